#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using principal_id_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_zero_hash();

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Accepts an optional 0x prefix and either case.
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// ASCII lowercase copy.
std::string to_lower(std::string_view value);

inline constexpr duration_milliseconds_t seconds_to_milliseconds(
    const uint64_t seconds) {
  return seconds * 1000;
}

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
