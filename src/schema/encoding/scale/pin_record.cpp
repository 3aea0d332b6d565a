#include <warden/schema/encoding/scale/pin_record.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(pin_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.iterations, encoder);
  encode(o.salt, encoder);
  encode(o.digest, encoder);
}

void decode(pin_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.iterations, decoder);
  decode(o.salt, decoder);
  decode(o.digest, decoder);
}

}  // namespace warden::schema::encoding::scale
