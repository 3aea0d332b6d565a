#pragma once

#include <warden/common/clock.hpp>
#include <warden/dispatch/transport.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/call_summary.hpp>
#include <warden/schema/primitives.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace warden::dispatch {

/// Pending approval of one specific action, bound to the principal, the
/// action kind and a digest of the payload.
struct confirmation_t final {
  std::string token;
  std::string principal_id;
  std::string action_kind;
  warden::schema::hash32_t payload_digest{};
  warden::schema::timestamp_milliseconds_t issued_at{};
  warden::schema::timestamp_milliseconds_t expires_at{};
  std::optional<warden::schema::timestamp_milliseconds_t> confirmed_at;
  bool rejected{false};
};

enum class confirmation_status_t : uint8_t {
  confirmed = 0,
  rejected = 1,
  unknown_token = 2,
  expired = 3,
  wrong_principal = 4,
};

/// Delivers notifications and confirmation prompts, and owns the ledger of
/// outstanding confirmations.
class dispatcher final {
 public:
  struct settings final {
    warden::schema::duration_milliseconds_t confirmation_timeout{120000};
  };

  dispatcher(transport& outbound,
             settings config,
             warden::common::time_source_t clock);

  bool notify(std::string_view principal_id, std::string_view message);

  /// Issue a token for `action` and prompt the owner.
  std::string request_confirmation(std::string_view principal_id,
                                   const warden::schema::action_t& action,
                                   std::string_view description);

  /// Record the owner's answer for `token`.
  confirmation_status_t resolve_confirmation(std::string_view principal_id,
                                             std::string_view token,
                                             bool approved);

  std::optional<confirmation_t> find_confirmation(std::string_view token) const;

  void consume_confirmation(std::string_view token);

  /// Remove and return the confirmation for `token` if the owner approved
  /// it. At most one caller takes a given token.
  std::optional<confirmation_t> take_confirmation(std::string_view token);

  /// Drop confirmations past their expiry; returns how many were removed.
  std::size_t expire_confirmations();

  std::size_t pending_confirmations(std::string_view principal_id) const;

  bool notify_call_summary(std::string_view principal_id,
                           const warden::schema::call_summary_t& summary);

  static std::string format_call_summary(
      const warden::schema::call_summary_t& summary);

  static warden::schema::hash32_t payload_digest(std::string_view payload);

 private:
  transport& transport_;
  settings settings_;
  warden::common::time_source_t clock_;

  mutable std::mutex mutex_;
  std::map<std::string, confirmation_t, std::less<>> confirmations_;
};

}  // namespace warden::dispatch
