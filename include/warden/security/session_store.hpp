#pragma once

#include <warden/common/clock.hpp>
#include <warden/crypto/pin.hpp>
#include <warden/schema/auth_error.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/pin_record.hpp>
#include <warden/schema/session.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace warden::security {

using verify_result_t = std::variant<warden::schema::permission_level_t,
                                     warden::schema::auth_error_t>;

/// Per-principal verified sessions and PIN digests.
///
/// Operations on one principal are serialized by that principal's own mutex;
/// the map lock is held only to find or create the entry. Expiry is checked
/// lazily on read. Every mutation is written through to storage so sessions
/// and lockouts survive a restart.
class session_store final {
 public:
  struct settings final {
    warden::schema::duration_milliseconds_t session_timeout{300000};
    uint32_t max_pin_retries{3};
    warden::schema::duration_milliseconds_t lockout{900000};
  };

  session_store(
      warden::schema::encoding::encoder<
          warden::schema::encoding::scale_encoder_tag>& encoder,
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
      settings config,
      warden::common::time_source_t clock);

  session_store(const session_store&) = delete;
  session_store& operator=(const session_store&) = delete;

  /// Current session for `principal_id`, creating an unverified one.
  warden::schema::session_t get_or_create(std::string_view principal_id);

  /// Check `pin` against the enrolled digest.
  ///
  /// Returns `locked` without consulting the digest while a lockout is in
  /// force. A mismatch counts towards the lockout threshold; a match raises
  /// the session to L4 for `session_timeout` and clears the failure count.
  verify_result_t verify(std::string_view principal_id, std::string_view pin);

  /// Slide the expiry of a valid session forward. Never changes the level.
  void touch(std::string_view principal_id);

  bool is_valid(std::string_view principal_id);

  /// Verified level of a valid session; L1 when absent or expired.
  warden::schema::permission_level_t effective_level(
      std::string_view principal_id);

  void logout(std::string_view principal_id);

  /// Install a precomputed PIN digest (from configuration).
  void enroll(std::string_view principal_id,
              const warden::schema::pin_record_t& record);

  /// Derive and install a digest for `pin`.
  std::optional<warden::schema::auth_error_t> set_pin(
      std::string_view principal_id,
      std::string_view pin,
      uint32_t iterations = warden::crypto::kPinIterations);

  bool is_enrolled(std::string_view principal_id);

 private:
  struct entry final {
    std::mutex mutex;
    warden::schema::session_t session;
    std::optional<warden::schema::pin_record_t> pin;
  };

  std::shared_ptr<entry> entry_for(std::string_view principal_id);
  bool valid_locked(const entry& e,
                    warden::schema::timestamp_milliseconds_t now) const;
  void persist(const warden::schema::session_t& session);

  warden::schema::encoding::encoder<warden::schema::encoding::scale_encoder_tag>&
      encoder_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  settings settings_;
  warden::common::time_source_t clock_;

  std::mutex map_mutex_;
  std::map<std::string, std::shared_ptr<entry>, std::less<>> entries_;
};

}  // namespace warden::security
