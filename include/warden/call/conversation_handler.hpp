#pragma once

#include <warden/call/call_notes.hpp>
#include <warden/call/prompt_builder.hpp>
#include <warden/capability/brain.hpp>
#include <warden/capability/telephony.hpp>
#include <warden/capability/voice.hpp>
#include <warden/common/await.hpp>
#include <warden/common/clock.hpp>
#include <warden/schema/call_summary.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace warden::call {

/// Drives one answered call: greet, then listen, transcribe, reply until the
/// caller leaves or a limit is reached.
///
/// Every capability call is bounded by a timeout. An unavailable model or
/// a reply that would leak private data is replaced by a fixed fallback line.
/// A call that misses its timeout keeps running until it returns; the
/// handler waits for it on destruction, so the capabilities must outlive it.
class conversation_handler final {
 public:
  struct settings final {
    std::chrono::milliseconds turn_timeout{10000};
    std::chrono::milliseconds speech_timeout{30000};
    uint32_t silence_turns{2};
    warden::schema::duration_milliseconds_t max_call_duration{300000};
    uint32_t max_turn_errors{3};
    std::vector<std::string> goodbye_phrases;
    std::size_t window_turns{8};
  };

  using utterance_callback_t =
      std::function<void(const warden::schema::utterance_t&)>;

  conversation_handler(warden::capability::voice& voice,
                       warden::capability::telephony& telephony,
                       warden::capability::brain& brain,
                       const prompt_builder& prompts,
                       const call_notes& notes,
                       settings config,
                       warden::common::time_source_t clock);

  /// Converse until the call ends. `hangup` is polled between turns.
  warden::schema::call_summary_t run(const std::string& caller,
                                     warden::schema::timestamp_milliseconds_t
                                         started_at,
                                     const std::atomic<bool>& hangup,
                                     const utterance_callback_t& on_utterance);

  bool is_goodbye(std::string_view text) const;

 private:
  bool say(const std::string& text,
           warden::schema::call_summary_t& draft,
           const utterance_callback_t& on_utterance);
  std::optional<std::string> listen();
  std::optional<std::string> reply_to(
      const std::vector<warden::schema::utterance_t>& transcript);

  warden::capability::voice& voice_;
  warden::capability::telephony& telephony_;
  warden::capability::brain& brain_;
  const prompt_builder& prompts_;
  const call_notes& notes_;
  settings settings_;
  warden::common::time_source_t clock_;
  warden::common::deadline_runner runner_;
};

}  // namespace warden::call
