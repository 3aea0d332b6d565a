#include <spdlog/spdlog.h>
#include <warden/call/conversation_handler.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::call {

conversation_handler::conversation_handler(
    warden::capability::voice& voice,
    warden::capability::telephony& telephony,
    warden::capability::brain& brain,
    const prompt_builder& prompts,
    const call_notes& notes,
    settings config,
    warden::common::time_source_t clock)
    : voice_{voice},
      telephony_{telephony},
      brain_{brain},
      prompts_{prompts},
      notes_{notes},
      settings_{std::move(config)},
      clock_{std::move(clock)} {
  for (auto& phrase : settings_.goodbye_phrases) {
    phrase = to_lower(phrase);
  }
}

bool conversation_handler::is_goodbye(const std::string_view text) const {
  auto lowered = to_lower(text);
  return std::ranges::any_of(settings_.goodbye_phrases,
                             [&](const auto& phrase) {
                               return !phrase.empty() &&
                                      lowered.find(phrase) != std::string::npos;
                             });
}

bool conversation_handler::say(const std::string& text,
                               call_summary_t& draft,
                               const utterance_callback_t& on_utterance) {
  auto& voice = voice_;
  auto audio = runner_.run(
      [&voice, text](std::stop_token stop) { return voice.speak(text, stop); },
      settings_.turn_timeout);
  if (!audio) {
    spdlog::warn("Speech synthesis unavailable");
    return false;
  }
  auto& telephony = telephony_;
  auto played = runner_.run(
      [&telephony, audio = std::move(*audio)](
          std::stop_token stop) -> std::optional<bool> {
        return telephony.play(audio, stop);
      },
      settings_.turn_timeout);
  if (!played || !*played) {
    spdlog::warn("Failed to play audio to caller");
    return false;
  }
  auto turn = utterance_t{.speaker = speaker_t::assistant,
                          .text = text,
                          .spoken_at = clock_()};
  if (on_utterance) {
    on_utterance(turn);
  }
  draft.transcript.push_back(std::move(turn));
  return true;
}

std::optional<std::string> conversation_handler::listen() {
  auto& telephony = telephony_;
  auto window = static_cast<duration_milliseconds_t>(
      settings_.speech_timeout.count());
  auto audio = runner_.run(
      [&telephony, window](std::stop_token stop) {
        return telephony.capture(window, stop);
      },
      settings_.speech_timeout + settings_.turn_timeout);
  if (!audio || audio->empty()) {
    return std::string{};
  }
  auto& voice = voice_;
  return runner_.run(
      [&voice, audio = std::move(*audio)](std::stop_token stop) {
        return voice.transcribe(audio, stop);
      },
      settings_.turn_timeout);
}

std::optional<std::string> conversation_handler::reply_to(
    const std::vector<utterance_t>& transcript) {
  auto prompt = prompts_.build(transcript, settings_.window_turns);
  auto constraints = prompts_.constraints();
  auto& brain = brain_;
  auto reply = runner_.run(
      [&brain, prompt = std::move(prompt),
       constraints = std::move(constraints)](std::stop_token stop) {
        return brain.generate(prompt, constraints, stop);
      },
      settings_.turn_timeout);
  if (!reply || reply->empty()) {
    return std::nullopt;
  }
  if (prompts_.leaks_sensitive(*reply)) {
    spdlog::warn("Discarding generated reply that touches private data");
    return std::nullopt;
  }
  return reply;
}

call_summary_t conversation_handler::run(
    const std::string& caller,
    const timestamp_milliseconds_t started_at,
    const std::atomic<bool>& hangup,
    const utterance_callback_t& on_utterance) {
  auto draft = call_summary_t{.caller = caller, .started_at = started_at};
  auto silent_turns = uint32_t{};
  auto unheard_turns = uint32_t{};
  auto errors = uint32_t{};

  auto end = [&](const call_end_reason_t reason) {
    draft.end_reason = reason;
    auto now = clock_();
    draft.duration = now > started_at ? now - started_at : 0;
    spdlog::info("Call from '{}' ended: {}", caller, to_string(reason));
    return notes_.summarize(std::move(draft));
  };

  if (!say(prompts_.greeting(), draft, on_utterance)) {
    draft.complete = false;
    return end(call_end_reason_t::unavailable);
  }

  while (true) {
    if (hangup.load()) {
      return end(call_end_reason_t::caller_hangup);
    }
    auto now = clock_();
    if (now >= started_at && now - started_at >= settings_.max_call_duration) {
      say(std::string{kMaxDurationClosing}, draft, on_utterance);
      return end(call_end_reason_t::max_duration);
    }

    auto heard = listen();
    if (hangup.load()) {
      return end(call_end_reason_t::caller_hangup);
    }
    if (!heard || heard->empty()) {
      if (!heard) {
        spdlog::warn("Speech recognition unavailable");
        ++unheard_turns;
      }
      ++silent_turns;
      if (silent_turns >= settings_.silence_turns) {
        say(std::string{kSilenceClosing}, draft, on_utterance);
        if (unheard_turns > 0) {
          draft.complete = false;
          return end(call_end_reason_t::unavailable);
        }
        return end(call_end_reason_t::silence);
      }
      if (!say(std::string{kSilencePrompt}, draft, on_utterance)) {
        draft.complete = false;
        return end(call_end_reason_t::unavailable);
      }
      continue;
    }
    silent_turns = 0;
    unheard_turns = 0;

    auto turn = utterance_t{.speaker = speaker_t::caller,
                            .text = *heard,
                            .spoken_at = clock_()};
    if (on_utterance) {
      on_utterance(turn);
    }
    draft.transcript.push_back(std::move(turn));

    if (is_goodbye(*heard)) {
      say(std::string{kGoodbyeReply}, draft, on_utterance);
      return end(call_end_reason_t::goodbye);
    }

    auto reply = std::string{};
    if (prompts_.is_confidential_request(*heard)) {
      draft.blocked_requests.push_back(prompts_.redact(*heard));
      reply = std::string{kRefusalReply};
    } else if (auto generated = reply_to(draft.transcript)) {
      reply = std::move(*generated);
    } else {
      ++errors;
      if (errors >= settings_.max_turn_errors) {
        say(std::string{kFallbackReply}, draft, on_utterance);
        draft.complete = false;
        return end(call_end_reason_t::error_limit);
      }
      reply = std::string{kFallbackReply};
    }

    if (!say(reply, draft, on_utterance)) {
      draft.complete = false;
      return end(call_end_reason_t::unavailable);
    }
  }
}

}  // namespace warden::call
