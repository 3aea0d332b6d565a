#include <warden/common/clock.hpp>

#include <chrono>

namespace warden::common {

time_source_t system_time_source() {
  return [] {
    return static_cast<warden::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace warden::common
