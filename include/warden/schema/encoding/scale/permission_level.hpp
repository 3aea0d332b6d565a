#pragma once

#include <warden/schema/permission_level.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    permission_level_t,
    warden::schema::permission_level_t::l1,
    warden::schema::permission_level_t::l2,
    warden::schema::permission_level_t::l3,
    warden::schema::permission_level_t::l4,
    warden::schema::permission_level_t::l5)
