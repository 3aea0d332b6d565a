#include <spdlog/spdlog.h>
#include <warden/security/authorization_engine.hpp>

using namespace warden::schema;

namespace warden::security {

namespace {

audit_outcome_t outcome_of(const decision_t& decision) {
  return std::visit(
      overloaded{
          [](const granted_t&) { return audit_outcome_t::granted; },
          [](const denied_blocked_t&) { return audit_outcome_t::blocked; },
          [](const system_error_t& e) {
            if (e.code == error_code_t::confirmation_mismatch ||
                e.code == error_code_t::confirmation_expired ||
                e.code == error_code_t::confirmation_rejected) {
              return audit_outcome_t::denied;
            }
            return audit_outcome_t::error;
          },
          [](const auto&) { return audit_outcome_t::denied; },
      },
      decision);
}

duration_milliseconds_t remaining(const timestamp_milliseconds_t since,
                                  const timestamp_milliseconds_t now,
                                  const duration_milliseconds_t delay) {
  auto elapsed = now > since ? now - since : 0;
  return elapsed >= delay ? 0 : delay - elapsed;
}

}  // namespace

authorization_engine::authorization_engine(
    const permission_policy& policy,
    session_store& sessions,
    warden::audit::audit_log& audit,
    warden::dispatch::dispatcher& dispatcher,
    settings config,
    warden::common::time_source_t clock)
    : policy_{policy},
      sessions_{sessions},
      audit_{audit},
      dispatcher_{dispatcher},
      settings_{config},
      clock_{std::move(clock)} {}

decision_t authorization_engine::finish(
    const std::string_view principal_id,
    const action_request_t& request,
    const std::optional<permission_level_t> level,
    decision_t decision) {
  auto record = audit_record_t{.recorded_at = clock_(),
                               .event = audit_event_type_t::authorization,
                               .principal_id = std::string{principal_id},
                               .action_kind = request.kind,
                               .required_level = level,
                               .outcome = outcome_of(decision),
                               .reason = describe(decision)};
  if (!audit_.append(std::move(record))) {
    spdlog::error("Audit log unavailable; refusing '{}' for '{}'", request.kind,
                  principal_id);
    return system_error_t{.code = error_code_t::audit_unavailable,
                          .reason = "audit log unavailable"};
  }
  return decision;
}

decision_t authorization_engine::authorize(const std::string_view principal_id,
                                           const action_request_t& request) {
  if (policy_.is_blocked(request.kind)) {
    spdlog::warn("Blocked action '{}' requested by '{}'", request.kind,
                 principal_id);
    return finish(principal_id, request, policy_.resolve(request.kind),
                  denied_blocked_t{});
  }

  auto action = policy_.bind(request);
  if (!action) {
    spdlog::error("Unknown action '{}' requested by '{}'", request.kind,
                  principal_id);
    return finish(principal_id, request, std::nullopt,
                  system_error_t{.code = error_code_t::unknown_action,
                                 .reason = "unknown action " + request.kind});
  }
  const auto& entry = policy_.find(request.kind)->get();
  auto level = action->required_level;

  if (level == permission_level_t::l1) {
    return finish(principal_id, request, level, granted_t{});
  }

  auto now = clock_();
  if (entry.standing_approval && request.origin == action_origin_t::system) {
    if (!request.triggered_at) {
      return finish(principal_id, request, level,
                    system_error_t{.code = error_code_t::invalid_request,
                                   .reason = "standing approval without a "
                                             "trigger time"});
    }
    auto wait = remaining(*request.triggered_at, now,
                          entry.delay.value_or(settings_.l4_delay));
    if (wait > 0) {
      return finish(principal_id, request, level,
                    denied_pending_delay_t{.remaining = wait});
    }
    spdlog::info("Standing approval used for '{}'", request.kind);
    return finish(principal_id, request, level, granted_t{});
  }

  auto verified = sessions_.effective_level(principal_id);
  if (verified < level) {
    spdlog::warn("'{}' needs {} for '{}' (has {})", principal_id,
                 to_string(level), request.kind, to_string(verified));
    return finish(principal_id, request, level,
                  denied_needs_auth_t{.required_level = level});
  }

  if (level >= permission_level_t::l3) {
    auto decision = check_confirmation(principal_id, *action, entry, request);
    if (!is_granted(decision)) {
      return finish(principal_id, request, level, std::move(decision));
    }
  }

  if (request.origin == action_origin_t::user) {
    sessions_.touch(principal_id);
  }
  spdlog::info("Granted '{}' to '{}'", request.kind, principal_id);
  return finish(principal_id, request, level, granted_t{});
}

decision_t authorization_engine::check_confirmation(
    const std::string_view principal_id,
    const action_t& action,
    const policy_entry_t& entry,
    const action_request_t& request) {
  if (!request.confirmation_token) {
    auto token =
        dispatcher_.request_confirmation(principal_id, action, entry.description);
    return denied_pending_confirmation_t{.token = std::move(token)};
  }

  const auto& token = *request.confirmation_token;
  auto confirmation = dispatcher_.find_confirmation(token);
  if (!confirmation || confirmation->principal_id != principal_id ||
      confirmation->action_kind != action.kind ||
      confirmation->payload_digest !=
          warden::dispatch::dispatcher::payload_digest(action.payload)) {
    spdlog::warn("Confirmation token does not match '{}' for '{}'", action.kind,
                 principal_id);
    return system_error_t{.code = error_code_t::confirmation_mismatch,
                          .reason = "confirmation does not match the action"};
  }

  auto now = clock_();
  if (now >= confirmation->expires_at) {
    dispatcher_.consume_confirmation(token);
    return system_error_t{.code = error_code_t::confirmation_expired,
                          .reason = "confirmation expired"};
  }
  if (confirmation->rejected) {
    dispatcher_.consume_confirmation(token);
    return system_error_t{.code = error_code_t::confirmation_rejected,
                          .reason = "confirmation rejected by owner"};
  }
  if (!confirmation->confirmed_at) {
    return denied_pending_confirmation_t{.token = token};
  }

  if (action.required_level == permission_level_t::l4) {
    auto wait = remaining(*confirmation->confirmed_at, now,
                          entry.delay.value_or(settings_.l4_delay));
    if (wait > 0) {
      return denied_pending_delay_t{.remaining = wait};
    }
  }

  if (!dispatcher_.take_confirmation(token)) {
    spdlog::warn("Confirmation for '{}' was already used by '{}'", action.kind,
                 principal_id);
    return system_error_t{.code = error_code_t::confirmation_mismatch,
                          .reason = "confirmation already used"};
  }
  return granted_t{};
}

verify_result_t authorization_engine::verify_pin(
    const std::string_view principal_id,
    const std::string_view pin) {
  auto result = sessions_.verify(principal_id, pin);
  auto record = audit_record_t{.recorded_at = clock_(),
                               .event = audit_event_type_t::authentication,
                               .principal_id = std::string{principal_id},
                               .action_kind = "verify_pin"};
  std::visit(overloaded{
                 [&](const permission_level_t level) {
                   record.required_level = level;
                   record.outcome = audit_outcome_t::granted;
                   record.reason = "verified";
                 },
                 [&](const auth_error_t error) {
                   record.outcome = error == auth_error_t::locked
                                        ? audit_outcome_t::blocked
                                        : audit_outcome_t::denied;
                   record.reason = std::string{to_string(error)};
                 },
             },
             result);
  if (!audit_.append(std::move(record))) {
    spdlog::error("Audit log unavailable while recording a PIN attempt");
  }
  return result;
}

warden::dispatch::confirmation_status_t authorization_engine::confirm(
    const std::string_view principal_id,
    const std::string_view token,
    const bool approved) {
  auto pending = dispatcher_.find_confirmation(token);
  auto status = dispatcher_.resolve_confirmation(principal_id, token, approved);
  auto record = audit_record_t{
      .recorded_at = clock_(),
      .event = audit_event_type_t::confirmation,
      .principal_id = std::string{principal_id},
      .action_kind = pending ? pending->action_kind : std::string{},
      .outcome = status == warden::dispatch::confirmation_status_t::confirmed
                     ? audit_outcome_t::granted
                     : audit_outcome_t::denied};
  using enum warden::dispatch::confirmation_status_t;
  switch (status) {
    case confirmed:
      record.reason = "confirmed";
      break;
    case rejected:
      record.reason = "rejected";
      break;
    case unknown_token:
      record.reason = "unknown token";
      break;
    case expired:
      record.reason = "expired";
      break;
    case wrong_principal:
      record.reason = "token belongs to another principal";
      break;
  }
  if (!audit_.append(std::move(record))) {
    spdlog::error("Audit log unavailable while recording a confirmation");
  }
  return status;
}

void authorization_engine::logout(const std::string_view principal_id) {
  sessions_.logout(principal_id);
  auto record = audit_record_t{.recorded_at = clock_(),
                               .event = audit_event_type_t::session,
                               .principal_id = std::string{principal_id},
                               .action_kind = "logout",
                               .outcome = audit_outcome_t::granted,
                               .reason = "session closed"};
  if (!audit_.append(std::move(record))) {
    spdlog::error("Audit log unavailable while recording a logout");
  }
}

}  // namespace warden::security
