#pragma once

#include <string_view>

namespace warden::dispatch {

/// Outbound channel to the owner (chat bot, notification bridge).
class transport {
 public:
  virtual ~transport() = default;

  virtual bool deliver(std::string_view principal_id, std::string_view text) = 0;

  /// Ask the owner to approve one action; the reply comes back through
  /// `authorization_engine::confirm` with the same token.
  virtual bool deliver_confirmation_prompt(std::string_view principal_id,
                                           std::string_view token,
                                           std::string_view description) = 0;
};

}  // namespace warden::dispatch
