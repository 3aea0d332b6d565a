#pragma once

#include <warden/audit/audit_log.hpp>
#include <warden/common/clock.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/decision.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/security/permission_policy.hpp>
#include <warden/security/session_store.hpp>

#include <optional>
#include <string_view>

namespace warden::security {

/// Single gate for every privileged action.
///
/// Checks run in a fixed order: blocklist, level resolution, session,
/// confirmation, L4 delay. Whatever the outcome, exactly one audit record is
/// enqueued before the decision is returned; if the audit log refuses it the
/// decision becomes `system_error_t{audit_unavailable}`.
class authorization_engine final {
 public:
  struct settings final {
    warden::schema::duration_milliseconds_t l4_delay{10000};
  };

  authorization_engine(const permission_policy& policy,
                       session_store& sessions,
                       warden::audit::audit_log& audit,
                       warden::dispatch::dispatcher& dispatcher,
                       settings config,
                       warden::common::time_source_t clock);

  authorization_engine(const authorization_engine&) = delete;
  authorization_engine& operator=(const authorization_engine&) = delete;

  /// Decide whether `principal_id` may perform `request` now.
  ///
  /// A confirmation token from an earlier `denied_pending_confirmation_t`
  /// must be passed back in `request.confirmation_token` once the owner has
  /// approved it. Standing approvals apply only to system-origin requests.
  warden::schema::decision_t authorize(
      std::string_view principal_id,
      const warden::schema::action_request_t& request);

  /// Verify a PIN and record the attempt.
  verify_result_t verify_pin(std::string_view principal_id,
                             std::string_view pin);

  /// Feed the owner's answer to a confirmation prompt back in.
  warden::dispatch::confirmation_status_t confirm(std::string_view principal_id,
                                                  std::string_view token,
                                                  bool approved);

  void logout(std::string_view principal_id);

  const permission_policy& policy() const { return policy_; }
  warden::schema::timestamp_milliseconds_t now() const { return clock_(); }

 private:
  warden::schema::decision_t check_confirmation(
      std::string_view principal_id,
      const warden::schema::action_t& action,
      const policy_entry_t& entry,
      const warden::schema::action_request_t& request);

  warden::schema::decision_t finish(
      std::string_view principal_id,
      const warden::schema::action_request_t& request,
      std::optional<warden::schema::permission_level_t> level,
      warden::schema::decision_t decision);

  const permission_policy& policy_;
  session_store& sessions_;
  warden::audit::audit_log& audit_;
  warden::dispatch::dispatcher& dispatcher_;
  settings settings_;
  warden::common::time_source_t clock_;
};

}  // namespace warden::security
