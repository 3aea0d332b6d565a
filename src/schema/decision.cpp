#include <warden/schema/decision.hpp>

#include <spdlog/fmt/fmt.h>

namespace warden::schema {

std::string describe(const decision_t& decision) {
  return std::visit(
      overloaded{
          [](const granted_t&) { return std::string{"granted"}; },
          [](const denied_needs_auth_t& d) {
            return fmt::format("authentication required ({})",
                               to_string(d.required_level));
          },
          [](const denied_blocked_t&) {
            return std::string{"blocked by policy"};
          },
          [](const denied_pending_confirmation_t&) {
            return std::string{"awaiting confirmation"};
          },
          [](const denied_pending_delay_t& d) {
            return fmt::format("cooling down, {} ms remaining", d.remaining);
          },
          [](const system_error_t& e) {
            return fmt::format("error: {} ({})", to_string(e.code), e.reason);
          },
      },
      decision);
}

}  // namespace warden::schema
