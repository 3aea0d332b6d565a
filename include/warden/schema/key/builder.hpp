#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace warden::schema::key {

struct builder final {
  warden::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Big-endian so that byte order of keys matches numeric order.
  builder& write_sequence(uint64_t value);
};

}  // namespace warden::schema::key
