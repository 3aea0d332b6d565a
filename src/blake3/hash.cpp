#include <blake3.h>
#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

warden::schema::hash32_t chain(const warden::schema::hash32_t& previous,
                               const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace warden::blake3
