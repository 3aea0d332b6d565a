#pragma once

#include <warden/schema/call_summary.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace warden::call {

/// Turns a finished transcript into the owner-facing call summary.
class call_notes final {
 public:
  struct settings final {
    std::size_t window_turns{8};
  };

  explicit call_notes(settings config);

  /// Fill `summary`, `action_items`, `sentiment` and `tags` of `draft`.
  warden::schema::call_summary_t summarize(
      warden::schema::call_summary_t draft) const;

  std::vector<std::string> extract_action_items(
      const std::vector<warden::schema::utterance_t>& transcript) const;

  static warden::schema::sentiment_t classify_sentiment(
      const std::vector<warden::schema::utterance_t>& transcript);

  static std::string describe(const warden::schema::call_summary_t& summary);

 private:
  settings settings_;
  std::vector<std::pair<std::regex, std::string>> action_patterns_;
};

}  // namespace warden::call
