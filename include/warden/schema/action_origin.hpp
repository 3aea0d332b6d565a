#pragma once

#include <cstdint>

namespace warden::schema {

/// Who raised the request: the owner through a transport, or a background
/// loop (call monitor, pollers).
enum class action_origin_t : uint8_t {
  user = 0,
  system = 1,
};

}  // namespace warden::schema
