#include <warden/common/critical.hpp>
#include <warden/crypto/random.hpp>

#include <openssl/rand.h>

namespace warden::crypto {

warden::schema::bytes_t random_bytes(const std::size_t size) {
  auto out = warden::schema::bytes_t(size);
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    warden::common::critical("OpenSSL RAND_bytes failed");
  }
  return out;
}

std::string make_token() {
  auto bytes = random_bytes(kTokenSize);
  return warden::schema::to_hex(warden::schema::make_bytes_view(bytes));
}

}  // namespace warden::crypto
