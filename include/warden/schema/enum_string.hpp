#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace warden::schema {

/// Name written to logs, audit records and the RPC surface for a value that
/// is missing from its mapping table.
inline constexpr std::string_view kUnknownEnumName = "unknown";

/// Wire names of a warden enum. Each schema header keeps one table next to
/// the enum it names and checks it with `has_unique_names`.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr bool has_unique_names(const enum_mappings_t<Enum, N>& mappings) {
  for (std::size_t i = 0; i < N; ++i) {
    for (std::size_t j = i + 1; j < N; ++j) {
      if (mappings[i].first == mappings[j].first ||
          mappings[i].second == mappings[j].second) {
        return false;
      }
    }
  }
  return true;
}

/// Exact, case-sensitive lookup. Audit filters and RPC arguments are
/// rejected rather than guessed.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value, const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.first == value) {
      return entry.second;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value, const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.second == value) {
      return entry.first;
    }
  }
  return std::nullopt;
}

/// `to_string` with `kUnknownEnumName` for values outside the table, such
/// as a byte decoded from an older database.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  return to_string(value, mappings).value_or(kUnknownEnumName);
}

/// Parse an enum that accepts names from outside the process. Only the
/// enums that specialize this can be parsed; the rest stay write-only.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace warden::schema
