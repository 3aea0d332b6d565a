#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace warden::schema {

enum class error_code_t : uint32_t {
  unknown_action = 1,
  audit_unavailable = 2,
  confirmation_mismatch = 3,
  confirmation_expired = 4,
  confirmation_rejected = 5,
  capability_unavailable = 6,
  invalid_request = 7,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"unknown_action",
                                              error_code_t::unknown_action},
    std::pair<std::string_view, error_code_t>{"audit_unavailable",
                                              error_code_t::audit_unavailable},
    std::pair<std::string_view, error_code_t>{
        "confirmation_mismatch", error_code_t::confirmation_mismatch},
    std::pair<std::string_view, error_code_t>{
        "confirmation_expired", error_code_t::confirmation_expired},
    std::pair<std::string_view, error_code_t>{
        "confirmation_rejected", error_code_t::confirmation_rejected},
    std::pair<std::string_view, error_code_t>{
        "capability_unavailable", error_code_t::capability_unavailable},
    std::pair<std::string_view, error_code_t>{"invalid_request",
                                              error_code_t::invalid_request},
};
static_assert(has_unique_names(kErrorCodeMappings));

inline constexpr std::string_view to_string(const error_code_t value) {
  return name_of(value, kErrorCodeMappings);
}

}  // namespace warden::schema
