#pragma once

#include <warden/schema/call_summary.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    sentiment_t,
    warden::schema::sentiment_t::neutral,
    warden::schema::sentiment_t::positive,
    warden::schema::sentiment_t::negative,
    warden::schema::sentiment_t::urgent)
