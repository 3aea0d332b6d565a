#include <warden/schema/encoding/scale/call_end_reason.hpp>
#include <warden/schema/encoding/scale/call_summary.hpp>
#include <warden/schema/encoding/scale/sentiment.hpp>
#include <warden/schema/encoding/scale/speaker.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(utterance<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.speaker, encoder);
  encode(o.text, encoder);
  encode(o.spoken_at, encoder);
}

void decode(utterance<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.speaker, decoder);
  decode(o.text, decoder);
  decode(o.spoken_at, decoder);
}

void encode(call_summary<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.caller, encoder);
  encode(o.started_at, encoder);
  encode(o.duration, encoder);
  encode(o.transcript, encoder);
  encode(o.action_items, encoder);
  encode(o.summary, encoder);
  encode(o.sentiment, encoder);
  encode(o.blocked_requests, encoder);
  encode(o.tags, encoder);
  encode(o.end_reason, encoder);
  encode(o.complete, encoder);
}

void decode(call_summary<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.caller, decoder);
  decode(o.started_at, decoder);
  decode(o.duration, decoder);
  decode(o.transcript, decoder);
  decode(o.action_items, decoder);
  decode(o.summary, decoder);
  decode(o.sentiment, decoder);
  decode(o.blocked_requests, decoder);
  decode(o.tags, decoder);
  decode(o.end_reason, decoder);
  decode(o.complete, decoder);
}

}  // namespace warden::schema::encoding::scale
