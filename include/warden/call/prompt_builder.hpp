#pragma once

#include <warden/capability/brain.hpp>
#include <warden/schema/utterance.hpp>

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::call {

inline constexpr auto kRefusalReply = std::string_view{
    "I apologize, but I'm not authorized to share that information."};
inline constexpr auto kFallbackReply = std::string_view{
    "I'm currently unavailable. Please leave a message."};
inline constexpr auto kSilencePrompt =
    std::string_view{"Are you still there? Please go ahead with your message."};
inline constexpr auto kSilenceClosing = std::string_view{
    "I didn't hear anything. Please call back later. Goodbye!"};
inline constexpr auto kGoodbyeReply = std::string_view{
    "Thank you for calling. I'll pass your message along. Goodbye!"};
inline constexpr auto kMaxDurationClosing = std::string_view{
    "I have to end the call now. Your message has been noted. Goodbye!"};

/// Builds model prompts for a call and keeps private data out of them.
///
/// Redaction covers the owner's name and financial identifiers (card and
/// account numbers, OTPs and PINs, CVVs, UPI ids, IFSC codes). Text from the
/// caller is redacted before it reaches the model; model output is checked
/// before it reaches the caller.
class prompt_builder final {
 public:
  struct settings final {
    std::string owner_name;
    uint32_t max_tokens{100};
  };

  explicit prompt_builder(settings config);

  std::string redact(std::string_view text) const;

  /// Caller asks for location, schedule, credentials or financial details.
  bool is_confidential_request(std::string_view text) const;

  /// Generated text would disclose the owner's name, a financial identifier
  /// or a blocked topic.
  bool leaks_sensitive(std::string_view reply) const;

  /// Prompt over the last `window` utterances, redacted.
  std::string build(const std::vector<warden::schema::utterance_t>& transcript,
                    std::size_t window) const;

  warden::capability::generation_constraints_t constraints() const;

  std::string greeting() const;

 private:
  settings settings_;
  std::vector<std::pair<std::regex, std::string>> sensitive_;
  std::vector<std::regex> confidential_;
  std::vector<std::regex> blocked_topics_;
  std::optional<std::regex> owner_;
};

}  // namespace warden::call
