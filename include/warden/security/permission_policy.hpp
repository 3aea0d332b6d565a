#pragma once

#include <warden/schema/action.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::security {

/// Answered inside the daemon (status, help, audit queries, call notes).
struct builtin_capability_t final {};

/// Served by a read-only data source registered under `source`.
struct reader_capability_t final {
  std::string source;
};

/// Forwarded to the device bridge, which performs the side effect.
struct executor_capability_t final {};

/// Driven by the call monitor, not by command routing.
struct telephony_capability_t final {};

/// Never executed.
struct no_capability_t final {};

using capability_t = std::variant<builtin_capability_t,
                                  reader_capability_t,
                                  executor_capability_t,
                                  telephony_capability_t,
                                  no_capability_t>;

struct policy_entry_t final {
  warden::schema::permission_level_t level{
      warden::schema::permission_level_t::l1};
  std::string description;
  capability_t capability{no_capability_t{}};
  /// Overrides the global L4 delay for this action.
  std::optional<warden::schema::duration_milliseconds_t> delay;
  /// System-origin requests skip session and confirmation checks; the delay
  /// is then measured from the triggering event.
  bool standing_approval{false};
};

using policy_table_t = std::map<std::string, policy_entry_t, std::less<>>;

/// Immutable registry mapping action kinds to permission levels.
///
/// Kinds may carry a target after ':' (`open_app:com.example`); the level is
/// resolved from the part before it. Unregistered kinds never resolve.
class permission_policy final {
 public:
  struct settings final {
    std::vector<std::string> banking_blocklist;
    bool auto_pickup_enabled{true};
    warden::schema::duration_milliseconds_t auto_pickup_delay{20000};
  };

  permission_policy(policy_table_t entries,
                    std::vector<std::string> banking_blocklist);

  /// Registry of the assistant's built-in actions.
  static permission_policy make_default(const settings& config);

  /// Required level for `kind`, or std::nullopt for an unknown action.
  std::optional<warden::schema::permission_level_t> resolve(
      std::string_view kind) const;

  /// True for L5 actions and for any kind or target on the banking
  /// blocklist. Takes precedence over every other rule.
  bool is_blocked(std::string_view kind) const;

  std::optional<std::reference_wrapper<const policy_entry_t>> find(
      std::string_view kind) const;

  std::optional<warden::schema::action_t> bind(
      const warden::schema::action_request_t& request) const;

  const policy_table_t& entries() const { return entries_; }

 private:
  policy_table_t entries_;
  std::vector<std::string> banking_blocklist_;
};

}  // namespace warden::security
