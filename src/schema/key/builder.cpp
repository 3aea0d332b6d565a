#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <warden/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace warden::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_sequence(const uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto* raw = reinterpret_cast<const uint8_t*>(&big);
  std::ranges::copy_n(raw, sizeof(big), std::back_inserter(data));
  return *this;
}
