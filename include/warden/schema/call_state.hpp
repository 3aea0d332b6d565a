#pragma once

#include <warden/schema/call_phase.hpp>
#include <warden/schema/call_summary.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/utterance.hpp>

#include <string>
#include <variant>
#include <vector>

namespace warden::schema {

struct call_idle_t final {};

struct call_ringing_t final {
  timestamp_milliseconds_t started_at{};
  std::string caller;
};

struct call_user_answered_t final {
  std::string caller;
};

struct call_auto_pickup_pending_t final {
  timestamp_milliseconds_t started_at{};
  timestamp_milliseconds_t deadline{};
  std::string caller;
};

struct call_in_conversation_t final {
  timestamp_milliseconds_t started_at{};
  std::string caller;
  std::vector<utterance_t> transcript;
};

struct call_summarizing_t final {
  std::string caller;
};

struct call_completed_t final {
  call_summary_t summary;
};

struct call_rejected_t final {
  std::string caller;
  std::string reason;
};

using call_state_t = std::variant<call_idle_t,
                                  call_ringing_t,
                                  call_user_answered_t,
                                  call_auto_pickup_pending_t,
                                  call_in_conversation_t,
                                  call_summarizing_t,
                                  call_completed_t,
                                  call_rejected_t>;

inline call_phase_t phase_of(const call_state_t& state) {
  return std::visit(
      overloaded{
          [](const call_idle_t&) { return call_phase_t::idle; },
          [](const call_ringing_t&) { return call_phase_t::ringing; },
          [](const call_user_answered_t&) {
            return call_phase_t::user_answered;
          },
          [](const call_auto_pickup_pending_t&) {
            return call_phase_t::auto_pickup_pending;
          },
          [](const call_in_conversation_t&) {
            return call_phase_t::in_conversation;
          },
          [](const call_summarizing_t&) { return call_phase_t::summarizing; },
          [](const call_completed_t&) { return call_phase_t::completed; },
          [](const call_rejected_t&) { return call_phase_t::rejected; },
      },
      state);
}

}  // namespace warden::schema
