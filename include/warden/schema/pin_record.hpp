#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct pin_record;

/// PBKDF2-HMAC-SHA256 digest of an owner PIN.
template <>
struct pin_record<1> final {
  uint16_t version{1};
  uint32_t iterations{};
  bytes_t salt;
  bytes_t digest;
};

using pin_record_t = pin_record<1>;

}  // namespace warden::schema
