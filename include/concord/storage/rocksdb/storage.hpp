#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <concord/common/critical.hpp>
#include <concord/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace concord::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const concord::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const concord::schema::bytes_view_t& key) const;

  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const concord::schema::bytes_view_t& key) const {
  if (!database) {
    concord::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    concord::common::critical("Failed to get value from RocksDB: {}",
                              status.ToString());
  }
  auto decoded = encoder.template try_decode<T>(concord::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    concord::common::critical("Failed to decode value stored in RocksDB");
  }
  return decoded;
}

}  // namespace concord::storage
