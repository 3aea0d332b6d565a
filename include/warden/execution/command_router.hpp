#pragma once

#include <warden/audit/audit_log.hpp>
#include <warden/call/call_archive.hpp>
#include <warden/call/call_monitor.hpp>
#include <warden/capability/executor.hpp>
#include <warden/capability/reader.hpp>
#include <warden/common/await.hpp>
#include <warden/common/clock.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/decision.hpp>
#include <warden/security/authorization_engine.hpp>
#include <warden/security/session_store.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace warden::execution {

struct command_result_t final {
  warden::schema::decision_t decision;
  std::string output;
  /// The action was authorized and its handler completed.
  bool executed{false};
};

/// Runs user commands: authorize first, then hand the action to the
/// capability its policy entry names.
class command_router final {
 public:
  struct settings final {
    std::chrono::milliseconds capability_timeout{10000};
    std::size_t listing_limit{20};
  };

  command_router(warden::security::authorization_engine& engine,
                 warden::security::session_store& sessions,
                 warden::audit::audit_log& audit,
                 warden::call::call_archive& archive,
                 const warden::call::call_monitor& monitor,
                 warden::dispatch::dispatcher& dispatcher,
                 settings config,
                 warden::common::time_source_t clock);

  command_router(const command_router&) = delete;
  command_router& operator=(const command_router&) = delete;

  /// Register the data source answering `reader_capability_t{source}`.
  void register_reader(std::string source,
                       warden::capability::reader& reader);
  void register_executor(warden::capability::executor& executor);

  command_result_t execute(std::string_view principal_id,
                           const warden::schema::action_request_t& request);

 private:
  command_result_t run_builtin(std::string_view principal_id,
                               const warden::schema::action_t& action);
  command_result_t run_reader(const std::string& source,
                              const warden::schema::action_t& action);
  command_result_t run_executor(const warden::schema::action_t& action);

  warden::security::authorization_engine& engine_;
  warden::security::session_store& sessions_;
  warden::audit::audit_log& audit_;
  warden::call::call_archive& archive_;
  const warden::call::call_monitor& monitor_;
  warden::dispatch::dispatcher& dispatcher_;
  settings settings_;
  warden::common::time_source_t clock_;
  std::map<std::string, warden::capability::reader*, std::less<>> readers_;
  warden::capability::executor* executor_{nullptr};
  warden::common::deadline_runner runner_;
};

}  // namespace warden::execution
