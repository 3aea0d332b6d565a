#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/execution/command_router.hpp>

using namespace warden::schema;

namespace warden::execution {

namespace {

command_result_t done(std::string output) {
  return command_result_t{
      .decision = granted_t{}, .output = std::move(output), .executed = true};
}

command_result_t failed(std::string output) {
  return command_result_t{
      .decision = granted_t{}, .output = std::move(output), .executed = false};
}

}  // namespace

command_router::command_router(warden::security::authorization_engine& engine,
                               warden::security::session_store& sessions,
                               warden::audit::audit_log& audit,
                               warden::call::call_archive& archive,
                               const warden::call::call_monitor& monitor,
                               warden::dispatch::dispatcher& dispatcher,
                               settings config,
                               warden::common::time_source_t clock)
    : engine_{engine},
      sessions_{sessions},
      audit_{audit},
      archive_{archive},
      monitor_{monitor},
      dispatcher_{dispatcher},
      settings_{config},
      clock_{std::move(clock)} {}

void command_router::register_reader(std::string source,
                                     warden::capability::reader& reader) {
  readers_[std::move(source)] = &reader;
}

void command_router::register_executor(warden::capability::executor& executor) {
  executor_ = &executor;
}

command_result_t command_router::execute(const std::string_view principal_id,
                                         const action_request_t& request) {
  auto decision = engine_.authorize(principal_id, request);
  if (!is_granted(decision)) {
    auto output = describe(decision);
    return command_result_t{.decision = std::move(decision),
                            .output = std::move(output)};
  }

  auto action = engine_.policy().bind(request);
  auto entry = engine_.policy().find(request.kind);
  if (!action || !entry) {
    return failed("unknown action");
  }

  return std::visit(
      overloaded{
          [&](const warden::security::builtin_capability_t&) {
            return run_builtin(principal_id, *action);
          },
          [&](const warden::security::reader_capability_t& reader) {
            return run_reader(reader.source, *action);
          },
          [&](const warden::security::executor_capability_t&) {
            return run_executor(*action);
          },
          [&](const warden::security::telephony_capability_t&) {
            return failed("handled by the call monitor");
          },
          [&](const warden::security::no_capability_t&) {
            return failed("action is not executable");
          },
      },
      entry->get().capability);
}

command_result_t command_router::run_builtin(const std::string_view principal_id,
                                             const action_t& action) {
  auto kind = base_kind(action.kind);

  if (kind == "get_time") {
    auto now = std::chrono::system_clock::time_point{
        std::chrono::milliseconds{static_cast<int64_t>(clock_())}};
    return done(fmt::format("{:%Y-%m-%d %H:%M:%S} UTC",
                            std::chrono::floor<std::chrono::seconds>(now)));
  }

  if (kind == "call_status") {
    return done(fmt::format("Call: {}", to_string(monitor_.phase())));
  }

  if (kind == "query_status") {
    auto level = sessions_.effective_level(principal_id);
    auto text = fmt::format("Session: {}", to_string(level));
    if (level > permission_level_t::l1) {
      auto session = sessions_.get_or_create(principal_id);
      auto now = clock_();
      auto remaining = session.expires_at > now ? session.expires_at - now : 0;
      text += fmt::format(" ({}s remaining)", remaining / 1000);
    }
    text += fmt::format("\nPending confirmations: {}",
                        dispatcher_.pending_confirmations(principal_id));
    text += fmt::format("\nCall: {}", to_string(monitor_.phase()));
    if (audit_.faulted()) {
      text += "\nAudit log: unavailable";
    }
    return done(std::move(text));
  }

  if (kind == "help") {
    auto text = std::string{"Available actions:"};
    for (const auto& [name, entry] : engine_.policy().entries()) {
      if (entry.level == permission_level_t::l5) {
        continue;
      }
      text += fmt::format("\n{} ({}): {}", name, to_string(entry.level),
                          entry.description);
    }
    return done(std::move(text));
  }

  if (kind == "list_tasks") {
    auto calls = archive_.list(1);
    auto text = fmt::format("Pending confirmations: {}",
                            dispatcher_.pending_confirmations(principal_id));
    if (!calls.empty() && !calls.back().action_items.empty()) {
      text += fmt::format("\nFrom the last call ({}):", calls.back().caller);
      for (const auto& item : calls.back().action_items) {
        text += "\n- " + item;
      }
    }
    return done(std::move(text));
  }

  if (kind == "view_audit_log") {
    auto filter = audit_filter_t{.principal_id = std::string{principal_id},
                                 .limit = settings_.listing_limit};
    auto records = audit_.query(filter);
    if (records.empty()) {
      return done("Audit log is empty.");
    }
    auto text = std::string{};
    for (const auto& record : records) {
      if (!text.empty()) {
        text += '\n';
      }
      text += fmt::format("#{} {} {} {}", record.sequence,
                          record.action_kind, to_string(record.outcome),
                          record.reason);
    }
    return done(std::move(text));
  }

  if (kind == "list_calls") {
    auto calls = archive_.list(settings_.listing_limit);
    if (calls.empty()) {
      return done("No calls recorded.");
    }
    auto text = std::string{};
    for (const auto& call : calls) {
      if (!text.empty()) {
        text += "\n\n";
      }
      text += warden::dispatch::dispatcher::format_call_summary(call);
    }
    return done(std::move(text));
  }

  spdlog::error("No built-in handler for '{}'", action.kind);
  return failed("no handler for " + action.kind);
}

command_result_t command_router::run_reader(const std::string& source,
                                            const action_t& action) {
  auto found = readers_.find(source);
  if (found == readers_.end()) {
    spdlog::error("No reader registered for '{}'", source);
    return failed("no reader available for " + source);
  }
  auto* reader = found->second;
  auto lines = runner_.run(
      [reader, query = action.payload](std::stop_token stop) {
        return reader->read(query, stop);
      },
      settings_.capability_timeout);
  if (!lines) {
    spdlog::warn("Reader '{}' unavailable", source);
    return failed(source + " is unavailable");
  }
  if (lines->empty()) {
    return done("Nothing found.");
  }
  auto text = std::string{};
  for (const auto& line : *lines) {
    if (!text.empty()) {
      text += '\n';
    }
    text += line;
  }
  return done(std::move(text));
}

command_result_t command_router::run_executor(const action_t& action) {
  if (!executor_) {
    spdlog::error("No executor registered for '{}'", action.kind);
    return failed("no executor available");
  }
  auto* executor = executor_;
  auto output = runner_.run(
      [executor, kind = action.kind,
       payload = action.payload](std::stop_token stop) {
        return executor->perform(kind, payload, stop);
      },
      settings_.capability_timeout);
  if (!output) {
    spdlog::warn("Executor failed or timed out for '{}'", action.kind);
    return failed(action.kind + " failed");
  }
  return done(std::move(*output));
}

}  // namespace warden::execution
