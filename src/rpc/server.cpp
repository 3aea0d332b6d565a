#include <spdlog/spdlog.h>
#include <warden/rpc/server.hpp>
#include <warden/schema/audit_outcome.hpp>

using namespace warden::schema;

namespace warden::rpc {

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

std::string_view to_string(const warden::dispatch::confirmation_status_t status) {
  using enum warden::dispatch::confirmation_status_t;
  switch (status) {
    case confirmed:
      return "confirmed";
    case rejected:
      return "rejected";
    case unknown_token:
      return "unknown_token";
    case expired:
      return "expired";
    case wrong_principal:
      return "wrong_principal";
  }
  return "unknown";
}

std::string caller_of(const call_state_t& state) {
  return std::visit(
      overloaded{
          [](const call_idle_t&) { return std::string{}; },
          [](const call_completed_t& completed) {
            return completed.summary.caller;
          },
          [](const auto& active) { return active.caller; },
      },
      state);
}

}  // namespace

void populate_decision(const decision_t& source,
                       warden::v1::Decision* destination) {
  destination->set_description(describe(source));
  std::visit(
      overloaded{
          [&](const granted_t&) {
            destination->set_kind(warden::v1::DECISION_KIND_GRANTED);
          },
          [&](const denied_needs_auth_t& needs_auth) {
            destination->set_kind(warden::v1::DECISION_KIND_NEEDS_AUTH);
            destination->set_required_level(
                std::string{to_string(needs_auth.required_level)});
          },
          [&](const denied_blocked_t&) {
            destination->set_kind(warden::v1::DECISION_KIND_BLOCKED);
          },
          [&](const denied_pending_confirmation_t& pending) {
            destination->set_kind(
                warden::v1::DECISION_KIND_PENDING_CONFIRMATION);
            destination->set_confirmation_token(pending.token);
          },
          [&](const denied_pending_delay_t& pending) {
            destination->set_kind(warden::v1::DECISION_KIND_PENDING_DELAY);
            destination->set_remaining_ms(pending.remaining);
          },
          [&](const system_error_t& error) {
            destination->set_kind(warden::v1::DECISION_KIND_ERROR);
            destination->set_error_code(std::string{to_string(error.code)});
            destination->set_reason(error.reason);
          },
      },
      source);
}

action_request_t to_action_request(const warden::v1::ExecuteRequest& request,
                                   const timestamp_milliseconds_t now) {
  auto action = action_request_t{.kind = request.kind(),
                                 .payload = request.payload(),
                                 .requested_at = now,
                                 .origin = action_origin_t::user};
  if (!request.confirmation_token().empty()) {
    action.confirmation_token = request.confirmation_token();
  }
  return action;
}

listener::listener(warden::security::authorization_engine& engine,
                   warden::execution::command_router& router,
                   warden::audit::audit_log& audit,
                   warden::call::call_monitor& monitor)
    : engine_{engine}, router_{router}, audit_{audit}, monitor_{monitor} {}

grpc::ServerUnaryReactor* listener::Execute(
    grpc::CallbackServerContext* context,
    const warden::v1::ExecuteRequest* request,
    warden::v1::ExecuteResponse* response) {
  if (request->principal_id().empty() || request->kind().empty()) {
    return finish_invalid(context, "principal_id and kind are required");
  }
  auto result = router_.execute(request->principal_id(),
                                to_action_request(*request, engine_.now()));
  populate_decision(result.decision, response->mutable_decision());
  response->set_output(result.output);
  response->set_executed(result.executed);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyPin(
    grpc::CallbackServerContext* context,
    const warden::v1::VerifyPinRequest* request,
    warden::v1::VerifyPinResponse* response) {
  if (request->principal_id().empty()) {
    return finish_invalid(context, "principal_id is required");
  }
  auto result = engine_.verify_pin(request->principal_id(), request->pin());
  std::visit(overloaded{
                 [&](const permission_level_t level) {
                   response->set_verified(true);
                   response->set_level(std::string{to_string(level)});
                 },
                 [&](const auth_error_t error) {
                   response->set_verified(false);
                   response->set_error(std::string{to_string(error)});
                 },
             },
             result);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Confirm(
    grpc::CallbackServerContext* context,
    const warden::v1::ConfirmRequest* request,
    warden::v1::ConfirmResponse* response) {
  auto status = engine_.confirm(request->principal_id(), request->token(),
                                request->approved());
  response->set_status(std::string{to_string(status)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Logout(
    grpc::CallbackServerContext* context,
    const warden::v1::LogoutRequest* request,
    warden::v1::LogoutResponse* /*response*/) {
  engine_.logout(request->principal_id());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::QueryAudit(
    grpc::CallbackServerContext* context,
    const warden::v1::QueryAuditRequest* request,
    warden::v1::QueryAuditResponse* response) {
  auto filter = audit_filter_t{};
  if (request->has_principal_id()) {
    filter.principal_id = request->principal_id();
  }
  if (request->has_action_kind()) {
    filter.action_kind = request->action_kind();
  }
  if (request->has_outcome()) {
    filter.outcome = try_from_string<audit_outcome_t>(request->outcome());
    if (!filter.outcome) {
      return finish_invalid(context, "unknown outcome");
    }
  }
  if (request->has_from_ms()) {
    filter.from = request->from_ms();
  }
  if (request->has_to_ms()) {
    filter.to = request->to_ms();
  }
  if (request->limit() > 0) {
    filter.limit = request->limit();
  }

  for (const auto& record : audit_.query(filter)) {
    auto* out = response->add_records();
    out->set_sequence(record.sequence);
    out->set_recorded_at_ms(record.recorded_at);
    out->set_event(std::string{to_string(record.event)});
    out->set_principal_id(record.principal_id);
    out->set_action_kind(record.action_kind);
    if (record.required_level) {
      out->set_required_level(std::string{to_string(*record.required_level)});
    }
    out->set_outcome(std::string{to_string(record.outcome)});
    out->set_reason(record.reason);
    out->set_hash(
        to_hex(bytes_view_t{record.hash.data(), record.hash.size()}));
  }

  if (request->verify_chain()) {
    auto report = audit_.verify_chain();
    response->set_chain_checked(true);
    response->set_chain_intact(report.intact);
    if (report.broken_at) {
      response->set_chain_broken_at(*report.broken_at);
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::TelephonyEvent(
    grpc::CallbackServerContext* context,
    const warden::v1::TelephonyEventRequest* request,
    warden::v1::TelephonyEventResponse* response) {
  auto accepted = false;
  switch (request->kind()) {
    case warden::v1::TelephonyEventRequest::KIND_RING:
      accepted = monitor_.on_ring(request->caller());
      break;
    case warden::v1::TelephonyEventRequest::KIND_ANSWERED:
      accepted = monitor_.on_user_answered();
      break;
    case warden::v1::TelephonyEventRequest::KIND_HANGUP:
      accepted = monitor_.on_hangup();
      break;
    case warden::v1::TelephonyEventRequest::KIND_IDLE:
      accepted = monitor_.on_idle();
      break;
    default:
      return finish_invalid(context, "unknown telephony event");
  }
  response->set_accepted(accepted);
  response->set_phase(std::string{to_string(monitor_.phase())});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CallStatus(
    grpc::CallbackServerContext* context,
    const warden::v1::CallStatusRequest* /*request*/,
    warden::v1::CallStatusResponse* response) {
  auto state = monitor_.state();
  response->set_phase(std::string{to_string(phase_of(state))});
  response->set_caller(caller_of(state));
  if (auto* active = std::get_if<call_in_conversation_t>(&state)) {
    response->set_transcript_turns(
        static_cast<uint32_t>(active->transcript.size()));
  }
  return finish_ok(context);
}

}  // namespace warden::rpc
