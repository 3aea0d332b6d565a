#include <warden/schema/encoding/scale/audit_event_type.hpp>
#include <warden/schema/encoding/scale/audit_outcome.hpp>
#include <warden/schema/encoding/scale/audit_record.hpp>
#include <warden/schema/encoding/scale/permission_level.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(audit_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.recorded_at, encoder);
  encode(o.event, encoder);
  encode(o.principal_id, encoder);
  encode(o.action_kind, encoder);
  encode(o.required_level, encoder);
  encode(o.outcome, encoder);
  encode(o.reason, encoder);
  encode(o.previous_hash, encoder);
  encode(o.hash, encoder);
}

void decode(audit_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.recorded_at, decoder);
  decode(o.event, decoder);
  decode(o.principal_id, decoder);
  decode(o.action_kind, decoder);
  decode(o.required_level, decoder);
  decode(o.outcome, decoder);
  decode(o.reason, decoder);
  decode(o.previous_hash, decoder);
  decode(o.hash, decoder);
}

}  // namespace warden::schema::encoding::scale
