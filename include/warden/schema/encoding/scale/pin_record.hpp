#pragma once

#include <warden/schema/pin_record.hpp>
#include <scale/scale.hpp>

namespace warden::schema::encoding::scale {

void encode(warden::schema::pin_record<1>&& o, ::scale::Encoder& encoder);
void decode(warden::schema::pin_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
