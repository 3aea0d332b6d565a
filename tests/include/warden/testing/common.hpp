#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline constexpr auto kOwner = std::string_view{"owner"};
inline constexpr auto kOwnerPin = std::string_view{"1234"};
/// Low iteration count keeps PBKDF2 fast in tests.
inline constexpr auto kTestPinIterations = uint32_t{1000};
inline constexpr auto kStartTime =
    warden::schema::timestamp_milliseconds_t{1'700'000'000'000};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that only moves when told to. Copies of `source()` share the
/// same time.
class manual_clock final {
 public:
  explicit manual_clock(
      const warden::schema::timestamp_milliseconds_t start = kStartTime)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  warden::common::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

  warden::schema::timestamp_milliseconds_t now() const { return now_->load(); }
  void set(const warden::schema::timestamp_milliseconds_t value) {
    now_->store(value);
  }
  void advance(const warden::schema::duration_milliseconds_t delta) {
    now_->fetch_add(delta);
  }
  void advance_seconds(const uint64_t seconds) {
    advance(warden::schema::seconds_to_milliseconds(seconds));
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

}  // namespace warden::testing
