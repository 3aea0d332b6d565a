#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace warden::capability {

struct generation_constraints_t final {
  std::string system_prompt;
  uint32_t max_tokens{100};
  std::vector<std::string> forbidden_topics;
};

/// Language model used to phrase replies to callers.
class brain {
 public:
  virtual ~brain() = default;

  /// `std::nullopt` means the model is unavailable.
  virtual std::optional<std::string> generate(
      const std::string& prompt,
      const generation_constraints_t& constraints,
      std::stop_token stop) = 0;
};

}  // namespace warden::capability
