#pragma once

#include <warden/schema/action_origin.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace warden::schema {

/// Separator between an action kind and its target, e.g.
/// `open_app:com.example.app`.
inline constexpr auto kActionTargetSeparator = ':';

/// Request as submitted by a transport or background loop. The required
/// level is never supplied by the caller.
struct action_request_t final {
  std::string kind;
  std::string payload;
  timestamp_milliseconds_t requested_at{};
  action_origin_t origin{action_origin_t::user};
  std::optional<std::string> confirmation_token;
  /// Instant the triggering event happened (ring start for auto-pickup).
  std::optional<timestamp_milliseconds_t> triggered_at;
};

/// Request bound to the level resolved by the permission policy.
struct action_t final {
  std::string kind;
  permission_level_t required_level{permission_level_t::l1};
  std::string payload;
  timestamp_milliseconds_t requested_at{};
};

inline std::string_view base_kind(const std::string_view kind) {
  auto separator = kind.find(kActionTargetSeparator);
  if (separator == std::string_view::npos) {
    return kind;
  }
  return kind.substr(0, separator);
}

inline std::string_view action_target(const std::string_view kind) {
  auto separator = kind.find(kActionTargetSeparator);
  if (separator == std::string_view::npos) {
    return {};
  }
  return kind.substr(separator + 1);
}

}  // namespace warden::schema
