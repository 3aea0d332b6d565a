#include <warden/schema/encoding/scale/permission_level.hpp>
#include <warden/schema/encoding/scale/session.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(session<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.principal_id, encoder);
  encode(o.verified_level, encoder);
  encode(o.created_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.failed_attempts, encoder);
  encode(o.locked_until, encoder);
}

void decode(session<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.principal_id, decoder);
  decode(o.verified_level, decoder);
  decode(o.created_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.failed_attempts, decoder);
  decode(o.locked_until, decoder);
}

}  // namespace warden::schema::encoding::scale
