#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace warden::schema {

enum class auth_error_t : uint8_t {
  invalid_pin = 1,
  locked = 2,
  not_enrolled = 3,
  pin_too_short = 4,
};

inline constexpr auto kAuthErrorMappings = std::array{
    std::pair<std::string_view, auth_error_t>{"invalid_pin",
                                              auth_error_t::invalid_pin},
    std::pair<std::string_view, auth_error_t>{"locked", auth_error_t::locked},
    std::pair<std::string_view, auth_error_t>{"not_enrolled",
                                              auth_error_t::not_enrolled},
    std::pair<std::string_view, auth_error_t>{"pin_too_short",
                                              auth_error_t::pin_too_short},
};
static_assert(has_unique_names(kAuthErrorMappings));

inline constexpr std::string_view to_string(const auth_error_t value) {
  return name_of(value, kAuthErrorMappings);
}

}  // namespace warden::schema
