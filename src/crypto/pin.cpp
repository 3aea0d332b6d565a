#include <warden/common/critical.hpp>
#include <warden/crypto/pin.hpp>
#include <warden/crypto/random.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <charconv>
#include <vector>

namespace warden::crypto {

namespace {

inline constexpr auto kPinRecordScheme = std::string_view{"pbkdf2-sha256"};
inline constexpr auto kPinRecordSeparator = '$';

std::optional<warden::schema::bytes_t> derive(
    const std::string_view pin,
    const warden::schema::bytes_view_t& salt,
    const uint32_t iterations) {
  auto digest = warden::schema::bytes_t(kPinDigestSize);
  auto ok = PKCS5_PBKDF2_HMAC(pin.data(), static_cast<int>(pin.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              static_cast<int>(iterations), EVP_sha256(),
                              static_cast<int>(digest.size()), digest.data());
  if (ok != 1) {
    return std::nullopt;
  }
  return digest;
}

std::vector<std::string_view> split(std::string_view text, const char delim) {
  auto parts = std::vector<std::string_view>{};
  while (true) {
    auto position = text.find(delim);
    parts.push_back(text.substr(0, position));
    if (position == std::string_view::npos) {
      break;
    }
    text.remove_prefix(position + 1);
  }
  return parts;
}

}  // namespace

warden::schema::pin_record_t make_pin_record(const std::string_view pin,
                                             const uint32_t iterations) {
  auto record = warden::schema::pin_record_t{};
  record.iterations = iterations;
  record.salt = random_bytes(kPinSaltSize);
  auto digest =
      derive(pin, warden::schema::make_bytes_view(record.salt), iterations);
  if (!digest) {
    warden::common::critical("OpenSSL PKCS5_PBKDF2_HMAC failed");
  }
  record.digest = std::move(*digest);
  return record;
}

bool verify_pin(const std::string_view pin,
                const warden::schema::pin_record_t& record) {
  if (record.digest.size() != kPinDigestSize || record.iterations == 0) {
    return false;
  }
  auto digest = derive(pin, warden::schema::make_bytes_view(record.salt),
                       record.iterations);
  if (!digest) {
    return false;
  }
  return CRYPTO_memcmp(digest->data(), record.digest.data(), digest->size()) ==
         0;
}

std::string format_pin_record(const warden::schema::pin_record_t& record) {
  auto out = std::string{kPinRecordScheme};
  out.push_back(kPinRecordSeparator);
  out.append(std::to_string(record.iterations));
  out.push_back(kPinRecordSeparator);
  out.append(warden::schema::to_hex(warden::schema::make_bytes_view(record.salt)));
  out.push_back(kPinRecordSeparator);
  out.append(
      warden::schema::to_hex(warden::schema::make_bytes_view(record.digest)));
  return out;
}

std::optional<warden::schema::pin_record_t> parse_pin_record(
    const std::string_view text) {
  auto parts = split(text, kPinRecordSeparator);
  if (parts.size() != 4 || parts[0] != kPinRecordScheme) {
    return std::nullopt;
  }
  auto record = warden::schema::pin_record_t{};
  auto [end, error] = std::from_chars(
      parts[1].data(), parts[1].data() + parts[1].size(), record.iterations);
  if (error != std::errc{} || end != parts[1].data() + parts[1].size() ||
      record.iterations == 0) {
    return std::nullopt;
  }
  auto salt = warden::schema::try_from_hex(parts[2]);
  auto digest = warden::schema::try_from_hex(parts[3]);
  if (!salt || !digest || digest->size() != kPinDigestSize) {
    return std::nullopt;
  }
  record.salt = std::move(*salt);
  record.digest = std::move(*digest);
  return record;
}

}  // namespace warden::crypto
