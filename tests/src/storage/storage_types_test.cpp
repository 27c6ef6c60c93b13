#include <concord/schema/encoding/scale/encoder.hpp>
#include <concord/schema/finalized_epoch.hpp>
#include <concord/schema/key/engine_keys.hpp>
#include <concord/storage/rocksdb/storage.hpp>
#include <concord/storage/storage.hpp>
#include <concord/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using encoder_t = concord::schema::encoding::scale_encoder_t;

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = concord::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, single_entry_batch_then_get) {
  auto db = concord::testing::make_db_path("concord_storage_put");
  {
    auto storage =
        concord::storage::make_storage<concord::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = concord::schema::key::make_finalized_epoch_key(3);
    auto record = concord::schema::finalized_epoch_t{
        .epoch = 3, .claim = concord::testing::make_claim(7), .event_id = 12};
    storage.write_batch({{key, encoder.encode(record)}});

    auto loaded = storage.get<encoder_t, concord::schema::finalized_epoch_t>(
        encoder, concord::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, record);

    auto missing_key = concord::schema::key::make_finalized_epoch_key(4);
    EXPECT_FALSE((storage.get<encoder_t, concord::schema::finalized_epoch_t>(
                      encoder, concord::schema::make_bytes_view(missing_key)))
                     .has_value());
  }
  concord::testing::remove_path(db);
}

TEST(storage_types, write_batch_is_visible_to_point_reads) {
  auto db = concord::testing::make_db_path("concord_storage_batch");
  {
    auto storage =
        concord::storage::make_storage<concord::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto entries = std::vector<concord::storage::key_value_entry_t>{};
    for (uint64_t id : {3u, 1u, 300u, 2u}) {
      entries.emplace_back(concord::schema::key::make_event_key(id),
                           encoder.encode(id * 10));
    }
    entries.emplace_back(
        concord::schema::key::make_key(concord::schema::key::kEpochKey),
        encoder.encode(uint64_t{9}));
    storage.write_batch(entries);

    for (uint64_t id : {1u, 2u, 3u, 300u}) {
      auto key = concord::schema::key::make_event_key(id);
      EXPECT_EQ((storage.get<encoder_t, uint64_t>(
                    encoder, concord::schema::make_bytes_view(key))),
                std::optional<uint64_t>{id * 10});
    }

    auto epoch_key =
        concord::schema::key::make_key(concord::schema::key::kEpochKey);
    EXPECT_EQ((storage.get<encoder_t, uint64_t>(
                  encoder, concord::schema::make_bytes_view(epoch_key))),
              std::optional<uint64_t>{9});
  }
  concord::testing::remove_path(db);
}

TEST(storage_types, data_survives_reopen) {
  auto db = concord::testing::make_db_path("concord_storage_reopen");
  auto encoder = encoder_t{};
  auto key = concord::schema::key::make_key(concord::schema::key::kEpochKey);
  {
    auto storage =
        concord::storage::make_storage<concord::storage::rocksdb_storage_tag>(db);
    storage.write_batch({{key, encoder.encode(uint64_t{5})}});
  }
  {
    auto storage =
        concord::storage::make_storage<concord::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.get<encoder_t, uint64_t>(
        encoder, concord::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 5u);
  }
  concord::testing::remove_path(db);
}
