#pragma once

#include <warden/schema/call_summary.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    call_end_reason_t,
    warden::schema::call_end_reason_t::caller_hangup,
    warden::schema::call_end_reason_t::goodbye,
    warden::schema::call_end_reason_t::silence,
    warden::schema::call_end_reason_t::max_duration,
    warden::schema::call_end_reason_t::unavailable,
    warden::schema::call_end_reason_t::error_limit)
