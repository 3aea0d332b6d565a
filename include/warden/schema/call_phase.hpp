#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace warden::schema {

/// Discriminator of `call_state_t`, small enough for a lock-free atomic.
enum class call_phase_t : uint8_t {
  idle = 0,
  ringing = 1,
  user_answered = 2,
  auto_pickup_pending = 3,
  in_conversation = 4,
  summarizing = 5,
  completed = 6,
  rejected = 7,
};

inline constexpr auto kCallPhaseMappings = std::array{
    std::pair<std::string_view, call_phase_t>{"idle", call_phase_t::idle},
    std::pair<std::string_view, call_phase_t>{"ringing", call_phase_t::ringing},
    std::pair<std::string_view, call_phase_t>{"user_answered",
                                              call_phase_t::user_answered},
    std::pair<std::string_view, call_phase_t>{
        "auto_pickup_pending", call_phase_t::auto_pickup_pending},
    std::pair<std::string_view, call_phase_t>{"in_conversation",
                                              call_phase_t::in_conversation},
    std::pair<std::string_view, call_phase_t>{"summarizing",
                                              call_phase_t::summarizing},
    std::pair<std::string_view, call_phase_t>{"completed",
                                              call_phase_t::completed},
    std::pair<std::string_view, call_phase_t>{"rejected",
                                              call_phase_t::rejected},
};
static_assert(has_unique_names(kCallPhaseMappings));

inline constexpr std::string_view to_string(const call_phase_t value) {
  return name_of(value, kCallPhaseMappings);
}

inline constexpr bool is_terminal(const call_phase_t value) {
  return value == call_phase_t::user_answered ||
         value == call_phase_t::completed || value == call_phase_t::rejected;
}

}  // namespace warden::schema
