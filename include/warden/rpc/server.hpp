#pragma once

#include <warden/v1/assistant.grpc.pb.h>
#include <warden/audit/audit_log.hpp>
#include <warden/call/call_monitor.hpp>
#include <warden/execution/command_router.hpp>
#include <warden/security/authorization_engine.hpp>

namespace warden::rpc {

/// Fill a wire decision from an authorization outcome.
void populate_decision(const warden::schema::decision_t& source,
                       warden::v1::Decision* destination);

/// User-origin request for an `Execute` call received at `now`.
warden::schema::action_request_t to_action_request(
    const warden::v1::ExecuteRequest& request,
    warden::schema::timestamp_milliseconds_t now);

/// Callback-API front end of the daemon. Every handler is a thin mapping
/// between protobuf messages and the engine, router, audit log or call
/// monitor; no authorization logic lives here.
struct listener final : public warden::v1::Assistant::CallbackService {
  listener(warden::security::authorization_engine& engine,
           warden::execution::command_router& router,
           warden::audit::audit_log& audit,
           warden::call::call_monitor& monitor);

  /// Authorize and run one command.
  virtual grpc::ServerUnaryReactor* Execute(
      grpc::CallbackServerContext* context,
      const warden::v1::ExecuteRequest* request,
      warden::v1::ExecuteResponse* response) override final;

  /// Check a PIN and raise the session on success.
  virtual grpc::ServerUnaryReactor* VerifyPin(
      grpc::CallbackServerContext* context,
      const warden::v1::VerifyPinRequest* request,
      warden::v1::VerifyPinResponse* response) override final;

  /// Owner's answer to a confirmation prompt.
  virtual grpc::ServerUnaryReactor* Confirm(
      grpc::CallbackServerContext* context,
      const warden::v1::ConfirmRequest* request,
      warden::v1::ConfirmResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Logout(
      grpc::CallbackServerContext* context,
      const warden::v1::LogoutRequest* request,
      warden::v1::LogoutResponse* response) override final;

  /// Filtered audit records, optionally with a chain verification report.
  virtual grpc::ServerUnaryReactor* QueryAudit(
      grpc::CallbackServerContext* context,
      const warden::v1::QueryAuditRequest* request,
      warden::v1::QueryAuditResponse* response) override final;

  /// Ring, answer, hang-up and idle notifications from the phone.
  virtual grpc::ServerUnaryReactor* TelephonyEvent(
      grpc::CallbackServerContext* context,
      const warden::v1::TelephonyEventRequest* request,
      warden::v1::TelephonyEventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CallStatus(
      grpc::CallbackServerContext* context,
      const warden::v1::CallStatusRequest* request,
      warden::v1::CallStatusResponse* response) override final;

  warden::security::authorization_engine& engine_;
  warden::execution::command_router& router_;
  warden::audit::audit_log& audit_;
  warden::call::call_monitor& monitor_;
};

}  // namespace warden::rpc
