#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <string>

namespace warden::schema {

enum class speaker_t : uint8_t {
  caller = 0,
  assistant = 1,
};

inline constexpr auto kSpeakerMappings = std::array{
    std::pair<std::string_view, speaker_t>{"caller", speaker_t::caller},
    std::pair<std::string_view, speaker_t>{"assistant", speaker_t::assistant},
};
static_assert(has_unique_names(kSpeakerMappings));

inline constexpr std::string_view to_string(const speaker_t value) {
  return name_of(value, kSpeakerMappings);
}

template <uint16_t Version>
struct utterance;

template <>
struct utterance<1> final {
  uint16_t version{1};
  speaker_t speaker{speaker_t::caller};
  std::string text;
  timestamp_milliseconds_t spoken_at{};
};

using utterance_t = utterance<1>;

}  // namespace warden::schema
