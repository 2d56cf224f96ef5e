#include <gtest/gtest.h>
#include <tessera/encoding/scale/encoder.hpp>
#include <tessera/schema/asset_record.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <tessera/storage/storage.hpp>
#include <tessera/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

using tessera::testing::make_db_path;
using tessera::testing::make_hash;
using tessera::testing::remove_path;

namespace {

using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;
using encoder_t = tessera::encoding::scale_encoder_t;

storage_t open_storage(const std::string& path) {
  return tessera::storage::make_storage<tessera::storage::rocksdb_storage_tag>(
      path);
}

tessera::storage::key_value_entry_t entry(const std::string_view key,
                                          const std::string_view value) {
  return {tessera::schema::make_bytes(key), tessera::schema::make_bytes(value)};
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = tessera::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.block_time, 0u);
  EXPECT_EQ(committed.next_event_id, 1u);
}

TEST(storage, empty_store_has_no_committed_state) {
  auto db = make_db_path("tessera_storage_empty");
  {
    auto storage = open_storage(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  remove_path(db);
}

TEST(storage, commit_persists_checkpoint_and_entries_across_reopen) {
  auto db = make_db_path("tessera_storage_commit");
  {
    auto storage = open_storage(db);
    storage.commit(
        tessera::storage::committed_state{.height = 42,
                                          .state_root = make_hash(10),
                                          .block_time = 1'700'000'000'000,
                                          .next_event_id = 17},
        {entry("EVT|a", "one"), entry("EVT|b", "two")});
  }
  {
    auto storage = open_storage(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->state_root, make_hash(10));
    EXPECT_EQ(loaded->block_time, 1'700'000'000'000u);
    EXPECT_EQ(loaded->next_event_id, 17u);
    EXPECT_EQ(storage.list_by_prefix(tessera::schema::make_bytes_view(
                                         std::string_view{"EVT|"}))
                  .size(),
              2u);
  }
  remove_path(db);
}

TEST(storage, typed_values_round_trip_through_encoder) {
  auto db = make_db_path("tessera_storage_typed");
  {
    auto storage = open_storage(db);
    auto encoder = encoder_t{};
    auto key = tessera::schema::make_bytes(std::string_view{"ASSET|7"});
    auto record = tessera::schema::asset_record_t{
        .in_custody = true,
        .original_owner = make_hash(2),
        .sale_proceeds = 200,
        .listed = false};
    storage.put(encoder, tessera::schema::bytes_view_t{key}, record);

    auto loaded = storage.get<tessera::schema::asset_record_t>(
        encoder, tessera::schema::bytes_view_t{key});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->in_custody);
    EXPECT_EQ(loaded->original_owner, make_hash(2));
    EXPECT_EQ(loaded->sale_proceeds, tessera::schema::amount_t{200});

    auto missing_key = tessera::schema::make_bytes(std::string_view{"ASSET|8"});
    EXPECT_FALSE(storage
                     .get<tessera::schema::asset_record_t>(
                         encoder, tessera::schema::bytes_view_t{missing_key})
                     .has_value());
  }
  remove_path(db);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto db = make_db_path("tessera_storage_prefix");
  {
    auto storage = open_storage(db);
    storage.commit(tessera::storage::committed_state{},
                   {entry("EVT|1", "a"), entry("EVT|2", "b"),
                    entry("EVU|1", "c"), entry("EV", "d")});
    auto rows = storage.list_by_prefix(
        tessera::schema::make_bytes_view(std::string_view{"EVT|"}));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(tessera::schema::make_string(rows[0].second), "a");
    EXPECT_EQ(tessera::schema::make_string(rows[1].second), "b");
  }
  remove_path(db);
}

TEST(storage, list_range_is_inclusive_and_ordered) {
  auto db = make_db_path("tessera_storage_range");
  {
    auto storage = open_storage(db);
    storage.commit(tessera::storage::committed_state{},
                   {entry("K|3", "c"), entry("K|1", "a"), entry("K|2", "b"),
                    entry("K|4", "d")});
    auto first = tessera::schema::make_bytes(std::string_view{"K|2"});
    auto last = tessera::schema::make_bytes(std::string_view{"K|3"});
    auto rows = storage.list_range(tessera::schema::bytes_view_t{first},
                                   tessera::schema::bytes_view_t{last});
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(tessera::schema::make_string(rows[0].first), "K|2");
    EXPECT_EQ(tessera::schema::make_string(rows[1].first), "K|3");

    auto empty = storage.list_range(tessera::schema::bytes_view_t{last},
                                    tessera::schema::bytes_view_t{first});
    EXPECT_TRUE(empty.empty());
  }
  remove_path(db);
}
