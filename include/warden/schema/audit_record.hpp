#pragma once

#include <warden/schema/audit_event_type.hpp>
#include <warden/schema/audit_outcome.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct audit_record;

/// One append-only audit entry. `hash` chains over every other field,
/// `previous_hash` included, so editing or dropping a record is detectable.
template <>
struct audit_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t recorded_at{};
  audit_event_type_t event{audit_event_type_t::authorization};
  std::string principal_id;
  std::string action_kind;
  std::optional<permission_level_t> required_level;
  audit_outcome_t outcome{audit_outcome_t::granted};
  std::string reason;
  hash32_t previous_hash{};
  hash32_t hash{};
};

using audit_record_t = audit_record<1>;

struct audit_filter_t final {
  std::optional<std::string> principal_id;
  std::optional<std::string> action_kind;
  std::optional<audit_outcome_t> outcome;
  std::optional<audit_event_type_t> event;
  std::optional<timestamp_milliseconds_t> from;
  std::optional<timestamp_milliseconds_t> to;
  std::optional<std::size_t> limit;
};

}  // namespace warden::schema
