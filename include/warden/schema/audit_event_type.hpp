#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// Classifies audit records so the owner can filter authorization decisions
// apart from PIN attempts, confirmations and call handling.
namespace warden::schema {

enum class audit_event_type_t : uint16_t {
  authorization = 1,
  authentication = 2,
  confirmation = 3,
  session = 4,
  call = 5,
  retention = 6,
};

inline constexpr auto kAuditEventTypeMappings = std::array{
    std::pair<std::string_view, audit_event_type_t>{
        "authorization", audit_event_type_t::authorization},
    std::pair<std::string_view, audit_event_type_t>{
        "authentication", audit_event_type_t::authentication},
    std::pair<std::string_view, audit_event_type_t>{
        "confirmation", audit_event_type_t::confirmation},
    std::pair<std::string_view, audit_event_type_t>{
        "session", audit_event_type_t::session},
    std::pair<std::string_view, audit_event_type_t>{"call",
                                                    audit_event_type_t::call},
    std::pair<std::string_view, audit_event_type_t>{
        "retention", audit_event_type_t::retention},
};
static_assert(has_unique_names(kAuditEventTypeMappings));

template <>
inline std::optional<audit_event_type_t> try_from_string<audit_event_type_t>(
    const std::string_view value) {
  return from_string(value, kAuditEventTypeMappings);
}

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return name_of(value, kAuditEventTypeMappings);
}

}  // namespace warden::schema
