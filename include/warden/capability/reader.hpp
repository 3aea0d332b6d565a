#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace warden::capability {

/// Read-only data source (messages, call log, contacts, calendar, files).
class reader {
 public:
  virtual ~reader() = default;

  virtual std::optional<std::vector<std::string>> read(std::string_view query,
                                                       std::stop_token stop) = 0;
};

}  // namespace warden::capability
