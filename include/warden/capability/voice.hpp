#pragma once

#include <warden/schema/primitives.hpp>

#include <optional>
#include <stop_token>
#include <string>

namespace warden::capability {

using audio_t = warden::schema::bytes_t;

/// Speech synthesis and recognition.
class voice {
 public:
  virtual ~voice() = default;

  virtual std::optional<audio_t> speak(const std::string& text,
                                       std::stop_token stop) = 0;

  /// Empty text for silence; `std::nullopt` when recognition is unavailable.
  virtual std::optional<std::string> transcribe(const audio_t& audio,
                                                std::stop_token stop) = 0;
};

}  // namespace warden::capability
