#pragma once
#include <concord/schema/primitives.hpp>
#include <optional>
#include <span>

namespace concord::schema::encoding {

// Encoding backend is picked at build time through the tag type; the only
// backend today is SCALE.
template <typename Library>
struct encoder {
  template <typename T>
  concord::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, concord::schema::bytes_t& out);

  template <typename T>
  T decode(const concord::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const concord::schema::bytes_view_t& bytes);
};

}  // namespace concord::schema::encoding
