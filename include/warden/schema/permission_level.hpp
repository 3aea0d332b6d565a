#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: permission level.
// Ordered tiers: l1 needs nothing, l2 a verified PIN, l3 adds a per-action
// confirmation, l4 adds a delay after confirmation, l5 is never granted.
namespace warden::schema {

enum class permission_level_t : uint8_t {
  l1 = 1,
  l2 = 2,
  l3 = 3,
  l4 = 4,
  l5 = 5,
};

inline constexpr auto kPermissionLevelMappings = std::array{
    std::pair<std::string_view, permission_level_t>{"L1",
                                                    permission_level_t::l1},
    std::pair<std::string_view, permission_level_t>{"L2",
                                                    permission_level_t::l2},
    std::pair<std::string_view, permission_level_t>{"L3",
                                                    permission_level_t::l3},
    std::pair<std::string_view, permission_level_t>{"L4",
                                                    permission_level_t::l4},
    std::pair<std::string_view, permission_level_t>{"L5",
                                                    permission_level_t::l5},
};
static_assert(has_unique_names(kPermissionLevelMappings));

template <>
inline std::optional<permission_level_t> try_from_string<permission_level_t>(
    const std::string_view value) {
  return from_string(value, kPermissionLevelMappings);
}

inline constexpr std::string_view to_string(const permission_level_t value) {
  return name_of(value, kPermissionLevelMappings);
}

}  // namespace warden::schema
