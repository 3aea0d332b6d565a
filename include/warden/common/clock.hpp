#pragma once

#include <warden/schema/primitives.hpp>

#include <functional>

namespace warden::common {

/// Wall-clock source in milliseconds since the epoch. Components take one so
/// that tests can drive expiry, lockout and delays deterministically.
using time_source_t = std::function<warden::schema::timestamp_milliseconds_t()>;

time_source_t system_time_source();

}  // namespace warden::common
