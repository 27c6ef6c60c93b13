#pragma once
#include <concord/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace concord::storage {

using key_value_entry_t =
    std::pair<concord::schema::bytes_t, concord::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const concord::schema::bytes_view_t& key) const;

  /// Persist all entries (already encoded) in one atomic write.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace concord::storage
