#include <warden/call/call_notes.hpp>

#include <algorithm>
#include <initializer_list>
#include <iterator>

using namespace warden::schema;

namespace warden::call {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

std::string caller_text(const std::vector<utterance_t>& transcript) {
  auto text = std::string{};
  for (const auto& turn : transcript) {
    if (turn.speaker == speaker_t::caller) {
      text += to_lower(turn.text);
      text += ' ';
    }
  }
  return text;
}

std::size_t count_words(const std::string& text,
                        const std::initializer_list<const char*> words) {
  auto count = std::size_t{};
  for (const auto* word : words) {
    auto pattern = std::regex{std::string{"\\b"} + word + "\\b", kRegexFlags};
    count += static_cast<std::size_t>(
        std::distance(std::sregex_iterator{text.begin(), text.end(), pattern},
                      std::sregex_iterator{}));
  }
  return count;
}

}  // namespace

call_notes::call_notes(settings config) : settings_{config} {
  for (const auto& [pattern, item] :
       std::initializer_list<std::pair<const char*, const char*>>{
           {R"(\bcall (him|her|them|me|back)\b)", "Call back"},
           {R"(\b(will|should|please) call\b)", "Call back"},
           {R"(\b(message|text) (him|her|them|me)\b)", "Send message"},
           {R"(\b(urgent|important|asap)\b)", "Follow up (marked urgent)"},
           {R"(\be-?mail\b)", "Check for email"},
           {R"(\b(tomorrow|later|soon)\b)", "Schedule follow-up"},
       }) {
    action_patterns_.emplace_back(std::regex{pattern, kRegexFlags}, item);
  }
}

std::vector<std::string> call_notes::extract_action_items(
    const std::vector<utterance_t>& transcript) const {
  auto first = transcript.size() > settings_.window_turns
                   ? transcript.size() - settings_.window_turns
                   : 0;
  auto items = std::vector<std::string>{};
  for (auto i = first; i < transcript.size(); ++i) {
    if (transcript[i].speaker != speaker_t::caller) {
      continue;
    }
    for (const auto& [pattern, item] : action_patterns_) {
      if (std::regex_search(transcript[i].text, pattern) &&
          std::ranges::find(items, item) == items.end()) {
        items.push_back(item);
      }
    }
  }
  return items;
}

sentiment_t call_notes::classify_sentiment(
    const std::vector<utterance_t>& transcript) {
  auto text = caller_text(transcript);
  if (count_words(text, {"urgent", "emergency", "immediately", "asap",
                         "critical", "important"}) > 0) {
    return sentiment_t::urgent;
  }
  auto negative = count_words(text, {"angry", "frustrated", "bad", "terrible",
                                     "awful", "wrong", "problem", "issue"});
  auto positive = count_words(text, {"good", "great", "excellent", "thank",
                                     "thanks", "appreciate", "helpful"});
  if (negative > positive) {
    return sentiment_t::negative;
  }
  if (positive > negative) {
    return sentiment_t::positive;
  }
  return sentiment_t::neutral;
}

std::string call_notes::describe(const call_summary_t& summary) {
  const auto& transcript = summary.transcript;
  if (transcript.size() < 2) {
    return "Brief call with no substantial conversation.";
  }

  auto caller_turns = std::ranges::count_if(transcript, [](const auto& turn) {
    return turn.speaker == speaker_t::caller;
  });
  auto parts = std::vector<std::string>{};
  if (caller_turns == 0) {
    parts.emplace_back("Caller did not speak.");
  } else if (caller_turns == 1) {
    parts.emplace_back("Brief exchange with caller.");
  } else {
    parts.push_back("Conversation with " + std::to_string(caller_turns) +
                    " exchanges.");
  }

  auto text = caller_text(transcript);
  if (text.find("message") != std::string::npos) {
    parts.emplace_back("Caller left a message.");
  }
  if (text.find("call back") != std::string::npos ||
      text.find("callback") != std::string::npos ||
      text.find("call later") != std::string::npos) {
    parts.emplace_back("Suggested callback.");
  }
  if (!summary.blocked_requests.empty()) {
    parts.emplace_back(
        "Confidential information was requested but not shared.");
  }

  auto out = std::string{};
  for (const auto& part : parts) {
    if (!out.empty()) {
      out += ' ';
    }
    out += part;
  }
  return out;
}

call_summary_t call_notes::summarize(call_summary_t draft) const {
  draft.action_items = extract_action_items(draft.transcript);
  draft.sentiment = classify_sentiment(draft.transcript);
  draft.summary = describe(draft);

  draft.tags.clear();
  if (!draft.blocked_requests.empty()) {
    draft.tags.emplace_back("confidential-request");
  }
  if (draft.sentiment == sentiment_t::urgent) {
    draft.tags.emplace_back("urgent");
  }
  if (!draft.action_items.empty()) {
    draft.tags.emplace_back("has-actions");
  }
  if (!draft.complete) {
    draft.tags.emplace_back("incomplete");
  }
  return draft;
}

}  // namespace warden::call
