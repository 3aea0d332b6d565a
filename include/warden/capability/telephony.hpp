#pragma once

#include <warden/capability/voice.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <stop_token>

namespace warden::capability {

/// Control of the device's active call.
class telephony {
 public:
  virtual ~telephony() = default;

  virtual bool pickup() = 0;
  virtual bool reject() = 0;
  virtual bool play(const audio_t& audio, std::stop_token stop) = 0;

  /// Record caller audio for at most `max_duration`.
  virtual std::optional<audio_t> capture(
      warden::schema::duration_milliseconds_t max_duration,
      std::stop_token stop) = 0;
};

}  // namespace warden::capability
