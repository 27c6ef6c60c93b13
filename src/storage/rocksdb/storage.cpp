#include <concord/common/critical.hpp>
#include <concord/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

namespace concord::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // Small, sync-written database: defaults plus strict corruption checks.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    concord::common::critical("Failed to open RocksDB at {}: {}", path,
                              status.ToString());
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);
  return store;
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    concord::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(concord::schema::make_bytes_view(key)),
                  detail::to_slice(concord::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      concord::common::critical("failed staging key in write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    concord::common::critical("Failed to commit RocksDB batch: {}",
                              write_status.ToString());
  }
}

}  // namespace concord::storage
