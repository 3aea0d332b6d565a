#pragma once

#include <warden/schema/pin_record.hpp>
#include <warden/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::crypto {

inline constexpr auto kPinIterations = uint32_t{100000};
inline constexpr auto kPinSaltSize = std::size_t{16};
inline constexpr auto kPinDigestSize = std::size_t{32};
inline constexpr auto kMinPinLength = std::size_t{4};

/// Derive a salted PBKDF2-HMAC-SHA256 record for `pin` with a fresh random
/// salt.
warden::schema::pin_record_t make_pin_record(
    std::string_view pin,
    uint32_t iterations = kPinIterations);

/// Recompute the digest with the record's salt and iteration count and
/// compare in constant time.
bool verify_pin(std::string_view pin, const warden::schema::pin_record_t& record);

/// Text form used in configuration files:
/// `pbkdf2-sha256$<iterations>$<salt hex>$<digest hex>`.
std::string format_pin_record(const warden::schema::pin_record_t& record);
std::optional<warden::schema::pin_record_t> parse_pin_record(
    std::string_view text);

}  // namespace warden::crypto
