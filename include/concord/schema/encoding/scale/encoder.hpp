#pragma once
#include <concord/common/critical.hpp>
#include <concord/schema/encoding/encoder.hpp>
#include <concord/schema/encoding/scale/claim_result.hpp>
#include <concord/schema/encoding/scale/manager_event_type.hpp>
#include <concord/schema/event_record.hpp>
#include <concord/schema/finalized_epoch.hpp>
#include <concord/schema/manager_state.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace concord::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  concord::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, concord::schema::bytes_t& out);

  template <typename T>
  T decode(const concord::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const concord::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
concord::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    concord::common::critical("failed to encode SCALE object: {}",
                              encoded.error().message());
  }
  return std::move(encoded.value());
}

// Appends the encoding of `obj` to `out`.
template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        concord::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const concord::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    concord::common::critical("failed to decode {} SCALE bytes", bytes.size());
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const concord::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace concord::schema::encoding
