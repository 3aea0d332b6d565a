#pragma once

#include <warden/schema/audit_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    audit_event_type_t,
    warden::schema::audit_event_type_t::authorization,
    warden::schema::audit_event_type_t::authentication,
    warden::schema::audit_event_type_t::confirmation,
    warden::schema::audit_event_type_t::session,
    warden::schema::audit_event_type_t::call,
    warden::schema::audit_event_type_t::retention)
