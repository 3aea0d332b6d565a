#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <string>
#include <variant>

namespace warden::schema {

struct granted_t final {};

struct denied_needs_auth_t final {
  permission_level_t required_level{permission_level_t::l2};
};

struct denied_blocked_t final {};

struct denied_pending_confirmation_t final {
  std::string token;
};

struct denied_pending_delay_t final {
  duration_milliseconds_t remaining{};
};

struct system_error_t final {
  error_code_t code{error_code_t::unknown_action};
  std::string reason;
};

using decision_t = std::variant<granted_t,
                                denied_needs_auth_t,
                                denied_blocked_t,
                                denied_pending_confirmation_t,
                                denied_pending_delay_t,
                                system_error_t>;

inline bool is_granted(const decision_t& decision) {
  return std::holds_alternative<granted_t>(decision);
}

/// Short human readable rendering for logs and user notifications.
std::string describe(const decision_t& decision);

}  // namespace warden::schema
