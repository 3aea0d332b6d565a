#include <warden/security/permission_policy.hpp>

#include <algorithm>
#include <ranges>

using namespace warden::schema;

namespace warden::security {

namespace {

policy_entry_t builtin(const std::string_view description) {
  return policy_entry_t{.level = permission_level_t::l1,
                        .description = std::string{description},
                        .capability = builtin_capability_t{}};
}

policy_entry_t reader(const std::string_view description,
                      const std::string_view source,
                      const permission_level_t level = permission_level_t::l2) {
  return policy_entry_t{
      .level = level,
      .description = std::string{description},
      .capability = reader_capability_t{.source = std::string{source}}};
}

policy_entry_t executor(const std::string_view description,
                        const permission_level_t level,
                        const std::optional<duration_milliseconds_t> delay =
                            std::nullopt) {
  return policy_entry_t{.level = level,
                        .description = std::string{description},
                        .capability = executor_capability_t{},
                        .delay = delay};
}

policy_entry_t forbidden(const std::string_view description) {
  return policy_entry_t{.level = permission_level_t::l5,
                        .description = std::string{description},
                        .capability = no_capability_t{}};
}

}  // namespace

permission_policy::permission_policy(policy_table_t entries,
                                     std::vector<std::string> banking_blocklist)
    : entries_{std::move(entries)} {
  banking_blocklist_.reserve(banking_blocklist.size());
  for (const auto& name : banking_blocklist) {
    if (!name.empty()) {
      banking_blocklist_.push_back(to_lower(name));
    }
  }
}

permission_policy permission_policy::make_default(const settings& config) {
  auto table = policy_table_t{};

  table.emplace("query_status", builtin("Query system status"));
  table.emplace("list_tasks", builtin("List active tasks"));
  table.emplace("get_time", builtin("Get current time"));
  table.emplace("help", builtin("Show help"));
  table.emplace("call_status", builtin("Show the call handler state"));

  table.emplace("read_whatsapp", reader("Read WhatsApp messages", "whatsapp"));
  table.emplace("read_sms", reader("Read SMS messages", "sms"));
  table.emplace("read_call_log", reader("Read call history", "call_log"));
  table.emplace("read_contacts", reader("Read contacts", "contacts"));
  table.emplace("read_calendar", reader("Read calendar", "calendar"));
  table.emplace("read_file", reader("Read a file", "file"));
  table.emplace("view_audit_log",
                policy_entry_t{.level = permission_level_t::l2,
                               .description = "View the audit log",
                               .capability = builtin_capability_t{}});
  table.emplace("list_calls",
                policy_entry_t{.level = permission_level_t::l2,
                               .description = "List handled calls",
                               .capability = builtin_capability_t{}});

  table.emplace("write_calendar",
                executor("Modify calendar", permission_level_t::l3));
  table.emplace("edit_file", executor("Modify files", permission_level_t::l3));
  table.emplace("write_files",
                executor("Modify files", permission_level_t::l3));
  table.emplace("send_message",
                executor("Send message", permission_level_t::l3));
  table.emplace("create_reminder",
                executor("Create reminder", permission_level_t::l3));
  table.emplace("open_app", executor("Open an app", permission_level_t::l3));

  table.emplace("make_call", executor("Make phone call", permission_level_t::l4,
                                      seconds_to_milliseconds(10)));
  table.emplace("system_command",
                executor("Execute system command", permission_level_t::l4,
                         seconds_to_milliseconds(15)));
  table.emplace("modify_settings",
                executor("Modify system settings", permission_level_t::l4,
                         seconds_to_milliseconds(10)));
  table.emplace("shutdown", executor("Shutdown or reboot",
                                     permission_level_t::l4,
                                     seconds_to_milliseconds(30)));
  table.emplace("call_pickup",
                policy_entry_t{.level = permission_level_t::l4,
                               .description = "Answer an incoming call",
                               .capability = telephony_capability_t{},
                               .delay = config.auto_pickup_delay,
                               .standing_approval = config.auto_pickup_enabled});

  table.emplace("bank_transfer", forbidden("Transfer money"));
  table.emplace("upi_payment", forbidden("UPI payment"));
  table.emplace("open_banking_app", forbidden("Open a banking app"));
  table.emplace("read_bank_sms", forbidden("Read banking SMS"));

  return permission_policy{std::move(table), config.banking_blocklist};
}

std::optional<std::reference_wrapper<const policy_entry_t>>
permission_policy::find(const std::string_view kind) const {
  auto it = entries_.find(base_kind(kind));
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return std::cref(it->second);
}

std::optional<permission_level_t> permission_policy::resolve(
    const std::string_view kind) const {
  auto entry = find(kind);
  if (!entry) {
    return std::nullopt;
  }
  return entry->get().level;
}

bool permission_policy::is_blocked(const std::string_view kind) const {
  auto level = resolve(kind);
  if (level == permission_level_t::l5) {
    return true;
  }
  auto base = to_lower(base_kind(kind));
  auto target = to_lower(action_target(kind));
  return std::ranges::any_of(banking_blocklist_, [&](const auto& blocked) {
    if (base == blocked) {
      return true;
    }
    if (target.empty()) {
      return false;
    }
    return target.find(blocked) != std::string::npos;
  });
}

std::optional<action_t> permission_policy::bind(
    const action_request_t& request) const {
  auto level = resolve(request.kind);
  if (!level) {
    return std::nullopt;
  }
  return action_t{.kind = request.kind,
                  .required_level = *level,
                  .payload = request.payload,
                  .requested_at = request.requested_at};
}

}  // namespace warden::security
