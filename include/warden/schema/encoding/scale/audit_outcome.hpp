#pragma once

#include <warden/schema/audit_outcome.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    audit_outcome_t,
    warden::schema::audit_outcome_t::granted,
    warden::schema::audit_outcome_t::denied,
    warden::schema::audit_outcome_t::blocked,
    warden::schema::audit_outcome_t::error)
