#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema {

enum class audit_outcome_t : uint8_t {
  granted = 0,
  denied = 1,
  blocked = 2,
  error = 3,
};

inline constexpr auto kAuditOutcomeMappings = std::array{
    std::pair<std::string_view, audit_outcome_t>{"granted",
                                                 audit_outcome_t::granted},
    std::pair<std::string_view, audit_outcome_t>{"denied",
                                                 audit_outcome_t::denied},
    std::pair<std::string_view, audit_outcome_t>{"blocked",
                                                 audit_outcome_t::blocked},
    std::pair<std::string_view, audit_outcome_t>{"error",
                                                 audit_outcome_t::error},
};
static_assert(has_unique_names(kAuditOutcomeMappings));

template <>
inline std::optional<audit_outcome_t> try_from_string<audit_outcome_t>(
    const std::string_view value) {
  return from_string(value, kAuditOutcomeMappings);
}

inline constexpr std::string_view to_string(const audit_outcome_t value) {
  return name_of(value, kAuditOutcomeMappings);
}

}  // namespace warden::schema
