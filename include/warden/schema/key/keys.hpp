#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema::key {

inline constexpr auto kAuditPrefix = std::string_view{"AUDIT|"};
inline constexpr auto kSessionPrefix = std::string_view{"SESSION|"};
inline constexpr auto kPinPrefix = std::string_view{"PIN|"};
inline constexpr auto kCallSummaryPrefix = std::string_view{"CALL|"};

bytes_t make_audit_key(uint64_t sequence);
bytes_t make_session_key(std::string_view principal_id);
bytes_t make_pin_key(std::string_view principal_id);
bytes_t make_call_summary_key(uint64_t sequence);

bytes_t make_prefix(std::string_view prefix);

/// Recover the sequence number from an audit or call summary key.
std::optional<uint64_t> parse_sequence(const bytes_view_t& key,
                                       std::string_view prefix);

}  // namespace warden::schema::key
