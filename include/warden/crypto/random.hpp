#pragma once

#include <warden/schema/primitives.hpp>

#include <cstddef>
#include <string>

namespace warden::crypto {

inline constexpr auto kTokenSize = std::size_t{16};

warden::schema::bytes_t random_bytes(std::size_t size);

/// Unguessable hex token for confirmation prompts.
std::string make_token();

}  // namespace warden::crypto
