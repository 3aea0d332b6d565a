#include <boost/endian/conversion.hpp>
#include <warden/schema/key/builder.hpp>
#include <warden/schema/key/keys.hpp>

#include <algorithm>
#include <cstring>

using namespace warden::schema;

namespace warden::schema::key {

bytes_t make_audit_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kAuditPrefix);
  b.write_sequence(sequence);
  return b.data;
}

bytes_t make_session_key(const std::string_view principal_id) {
  auto b = builder{};
  b.write(kSessionPrefix);
  b.write(principal_id);
  return b.data;
}

bytes_t make_pin_key(const std::string_view principal_id) {
  auto b = builder{};
  b.write(kPinPrefix);
  b.write(principal_id);
  return b.data;
}

bytes_t make_call_summary_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kCallSummaryPrefix);
  b.write_sequence(sequence);
  return b.data;
}

bytes_t make_prefix(const std::string_view prefix) {
  auto b = builder{};
  b.write(prefix);
  return b.data;
}

std::optional<uint64_t> parse_sequence(const bytes_view_t& key,
                                       const std::string_view prefix) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!make_string_view(key.first(prefix.size())).starts_with(prefix)) {
    return std::nullopt;
  }
  auto big = uint64_t{};
  std::memcpy(&big, key.data() + prefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace warden::schema::key
