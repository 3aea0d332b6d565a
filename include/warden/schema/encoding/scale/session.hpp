#pragma once

#include <warden/schema/session.hpp>
#include <scale/scale.hpp>

namespace warden::schema::encoding::scale {

void encode(warden::schema::session<1>&& o, ::scale::Encoder& encoder);
void decode(warden::schema::session<1>&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
