#pragma once
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/encoding/scale/audit_event_type.hpp>
#include <warden/schema/encoding/scale/audit_outcome.hpp>
#include <warden/schema/encoding/scale/audit_record.hpp>
#include <warden/schema/encoding/scale/call_end_reason.hpp>
#include <warden/schema/encoding/scale/call_summary.hpp>
#include <warden/schema/encoding/scale/permission_level.hpp>
#include <warden/schema/encoding/scale/pin_record.hpp>
#include <warden/schema/encoding/scale/sentiment.hpp>
#include <warden/schema/encoding/scale/session.hpp>
#include <warden/schema/encoding/scale/speaker.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, warden::schema::bytes_t& out);

  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
warden::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    warden::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        warden::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    warden::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace warden::schema::encoding
