#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash of `previous || bytes`; links one audit record to the next.
warden::schema::hash32_t chain(const warden::schema::hash32_t& previous,
                               const std::span<const uint8_t>& bytes);

}  // namespace warden::blake3
