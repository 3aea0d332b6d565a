#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/utterance.hpp>

#include <array>
#include <string>
#include <vector>

namespace warden::schema {

enum class sentiment_t : uint8_t {
  neutral = 0,
  positive = 1,
  negative = 2,
  urgent = 3,
};

inline constexpr auto kSentimentMappings = std::array{
    std::pair<std::string_view, sentiment_t>{"neutral", sentiment_t::neutral},
    std::pair<std::string_view, sentiment_t>{"positive",
                                             sentiment_t::positive},
    std::pair<std::string_view, sentiment_t>{"negative",
                                             sentiment_t::negative},
    std::pair<std::string_view, sentiment_t>{"urgent", sentiment_t::urgent},
};
static_assert(has_unique_names(kSentimentMappings));

inline constexpr std::string_view to_string(const sentiment_t value) {
  return name_of(value, kSentimentMappings);
}

enum class call_end_reason_t : uint8_t {
  caller_hangup = 0,
  goodbye = 1,
  silence = 2,
  max_duration = 3,
  unavailable = 4,
  error_limit = 5,
};

inline constexpr auto kCallEndReasonMappings = std::array{
    std::pair<std::string_view, call_end_reason_t>{
        "caller_hangup", call_end_reason_t::caller_hangup},
    std::pair<std::string_view, call_end_reason_t>{"goodbye",
                                                   call_end_reason_t::goodbye},
    std::pair<std::string_view, call_end_reason_t>{"silence",
                                                   call_end_reason_t::silence},
    std::pair<std::string_view, call_end_reason_t>{
        "max_duration", call_end_reason_t::max_duration},
    std::pair<std::string_view, call_end_reason_t>{
        "unavailable", call_end_reason_t::unavailable},
    std::pair<std::string_view, call_end_reason_t>{
        "error_limit", call_end_reason_t::error_limit},
};
static_assert(has_unique_names(kCallEndReasonMappings));

inline constexpr std::string_view to_string(const call_end_reason_t value) {
  return name_of(value, kCallEndReasonMappings);
}

template <uint16_t Version>
struct call_summary;

/// Immutable record of one auto-answered call.
template <>
struct call_summary<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string caller;
  timestamp_milliseconds_t started_at{};
  duration_milliseconds_t duration{};
  std::vector<utterance_t> transcript;
  std::vector<std::string> action_items;
  std::string summary;
  sentiment_t sentiment{sentiment_t::neutral};
  std::vector<std::string> blocked_requests;
  std::vector<std::string> tags;
  call_end_reason_t end_reason{call_end_reason_t::caller_hangup};
  bool complete{true};
};

using call_summary_t = call_summary<1>;

}  // namespace warden::schema
