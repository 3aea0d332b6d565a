#pragma once

#include <warden/schema/call_summary.hpp>
#include <warden/schema/utterance.hpp>
#include <scale/scale.hpp>

namespace warden::schema::encoding::scale {

void encode(warden::schema::utterance<1>&& o, ::scale::Encoder& encoder);
void decode(warden::schema::utterance<1>&& o, ::scale::Decoder& decoder);

void encode(warden::schema::call_summary<1>&& o, ::scale::Encoder& encoder);
void decode(warden::schema::call_summary<1>&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
