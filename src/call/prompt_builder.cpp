#include <warden/call/prompt_builder.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::call {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

std::regex make_regex(const std::string_view pattern) {
  return std::regex{std::string{pattern}, kRegexFlags};
}

std::string escape_regex(const std::string_view text) {
  static constexpr auto kSpecial = std::string_view{R"(\^$.|?*+()[]{})"};
  auto out = std::string{};
  for (const auto c : text) {
    if (kSpecial.find(c) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace

prompt_builder::prompt_builder(settings config) : settings_{std::move(config)} {
  sensitive_.emplace_back(make_regex(R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)"),
                          "[CARD]");
  sensitive_.emplace_back(make_regex(R"(\bcvv[:\s]*\d{3,4}\b)"), "[CVV]");
  sensitive_.emplace_back(make_regex(R"(\b(?:otp|pin)[:\s]*\d{4,6}\b)"),
                          "[CODE]");
  sensitive_.emplace_back(make_regex(R"(\b\d{9,18}\b)"), "[ACCOUNT]");
  sensitive_.emplace_back(make_regex(R"(\b[\w.-]+@[\w]+\b)"), "[UPI]");
  sensitive_.emplace_back(make_regex(R"(\b[A-Z]{4}0[A-Z0-9]{6}\b)"), "[IFSC]");

  for (const auto pattern : {
           R"(where are you)",
           R"(where do you live)",
           R"(your location)",
           R"(your address)",
           R"(when (are you|will you be))",
           R"(your schedule)",
           R"(your plans)",
           R"(are you (home|at))",
           R"(\bpersonal\b)",
           R"(\bprivate\b)",
           R"(password)",
           R"(\b(otp|pin|cvv)\b)",
           R"(\bbank\b)",
           R"(\baccount\b)",
           R"((credit|debit) card)",
           R"(card number)",
           R"(social security)",
           R"(\baadhaa?r\b)",
           R"(\bpan\b)",
       }) {
    confidential_.push_back(make_regex(pattern));
  }

  for (const auto pattern : {
           R"(\blocation\b)",
           R"(\baddress\b)",
           R"(\bwhereabouts\b)",
           R"(\bschedule\b)",
           R"(\bcalendar\b)",
           R"(\bpassword\b)",
           R"(\b(otp|pin)\b)",
           R"(\bsecret\b)",
           R"(bank account)",
           R"(card number)",
       }) {
    blocked_topics_.push_back(make_regex(pattern));
  }

  if (!settings_.owner_name.empty()) {
    owner_ = make_regex("\\b" + escape_regex(settings_.owner_name) + "\\b");
  }
}

std::string prompt_builder::redact(const std::string_view text) const {
  auto out = std::string{text};
  for (const auto& [pattern, replacement] : sensitive_) {
    out = std::regex_replace(out, pattern, replacement);
  }
  if (owner_) {
    out = std::regex_replace(out, *owner_, "[OWNER]");
  }
  return out;
}

bool prompt_builder::is_confidential_request(const std::string_view text) const {
  auto value = std::string{text};
  return std::ranges::any_of(confidential_, [&](const auto& pattern) {
    return std::regex_search(value, pattern);
  });
}

bool prompt_builder::leaks_sensitive(const std::string_view reply) const {
  auto value = std::string{reply};
  if (owner_ && std::regex_search(value, *owner_)) {
    return true;
  }
  auto matches = [&](const auto& pattern) {
    return std::regex_search(value, pattern);
  };
  return std::ranges::any_of(sensitive_,
                             [&](const auto& item) {
                               return matches(item.first);
                             }) ||
         std::ranges::any_of(blocked_topics_, matches);
}

std::string prompt_builder::build(const std::vector<utterance_t>& transcript,
                                  const std::size_t window) const {
  auto first = transcript.size() > window ? transcript.size() - window : 0;
  auto prompt = std::string{"Conversation so far:\n"};
  for (auto i = first; i < transcript.size(); ++i) {
    const auto& turn = transcript[i];
    prompt += turn.speaker == speaker_t::caller ? "Caller: " : "Assistant: ";
    prompt += redact(turn.text);
    prompt += '\n';
  }
  prompt += "Reply to the caller's last message.";
  return prompt;
}

warden::capability::generation_constraints_t prompt_builder::constraints()
    const {
  return warden::capability::generation_constraints_t{
      .system_prompt =
          "You are a polite phone assistant answering for someone who is "
          "unavailable. Keep replies to one or two short sentences. Offer to "
          "take a message. Never share personal information, location, "
          "schedule, or financial details, and never name the person you "
          "answer for.",
      .max_tokens = settings_.max_tokens,
      .forbidden_topics = {"location", "address", "schedule", "plans",
                           "passwords", "PINs", "OTPs", "bank accounts",
                           "card numbers"}};
}

std::string prompt_builder::greeting() const {
  return "Hello! The person you are calling is unavailable right now. I'm "
         "their assistant. Please leave a message.";
}

}  // namespace warden::call
