#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace warden::capability {

/// Performs side-effecting device actions once they are authorized.
class executor {
 public:
  virtual ~executor() = default;

  virtual std::optional<std::string> perform(std::string_view kind,
                                             std::string_view payload,
                                             std::stop_token stop) = 0;
};

}  // namespace warden::capability
