#pragma once

#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct session;

template <>
struct session<1> final {
  uint16_t version{1};
  std::string principal_id;
  permission_level_t verified_level{permission_level_t::l1};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
  uint32_t failed_attempts{};
  std::optional<timestamp_milliseconds_t> locked_until;
};

using session_t = session<1>;

}  // namespace warden::schema
