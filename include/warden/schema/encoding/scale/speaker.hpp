#pragma once

#include <warden/schema/utterance.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    speaker_t,
    warden::schema::speaker_t::caller,
    warden::schema::speaker_t::assistant)
