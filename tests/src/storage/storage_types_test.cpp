#include <gtest/gtest.h>
#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/storage/rocksdb/storage.hpp>
#include <verity/storage/storage.hpp>
#include <verity/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using storage_t =
    verity::storage::storage<verity::storage::rocksdb_storage_tag>;
using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;
using verity::testing::make_hash;

storage_t open_storage(const verity::testing::scoped_path& db) {
  return verity::storage::make_storage<verity::storage::rocksdb_storage_tag>(
      db.path);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = verity::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.block_time, 0u);

  auto entry = verity::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = verity::testing::scoped_path{
      verity::testing::make_db_path("verity_storage_committed")};
  auto storage = open_storage(db);
  EXPECT_FALSE(storage.load_committed_state().has_value());

  auto state = verity::storage::committed_state{
      .height = 42, .state_root = make_hash(10), .block_time = 1'700'000'000};
  storage.save_committed_state(state);

  auto loaded = storage.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->height, state.height);
  EXPECT_EQ(loaded->state_root, state.state_root);
  EXPECT_EQ(loaded->block_time, state.block_time);
}

TEST(storage_types, genesis_round_trips) {
  auto db = verity::testing::scoped_path{
      verity::testing::make_db_path("verity_storage_genesis")};
  auto storage = open_storage(db);
  EXPECT_FALSE(storage.load_genesis().has_value());

  auto genesis = verity::schema::genesis_t{};
  genesis.chain_id = make_hash(3);
  genesis.admin = verity::testing::make_ed25519_principal(4);
  genesis.genesis_time = 77;
  storage.save_genesis(genesis);

  auto loaded = storage.load_genesis();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->chain_id, genesis.chain_id);
  EXPECT_EQ(loaded->admin, genesis.admin);
  EXPECT_EQ(loaded->genesis_time, 77u);
}

TEST(storage_types, get_returns_nullopt_for_missing_key) {
  auto db = verity::testing::scoped_path{
      verity::testing::make_db_path("verity_storage_missing")};
  auto storage = open_storage(db);
  auto encoder = encoder_t{};
  auto key = verity::schema::make_bytes(std::string_view{"K|missing"});
  EXPECT_FALSE(storage.get<uint64_t>(encoder, verity::schema::make_bytes_view(key))
                   .has_value());

  storage.put(encoder, verity::schema::make_bytes_view(key), uint64_t{5});
  auto value =
      storage.get<uint64_t>(encoder, verity::schema::make_bytes_view(key));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 5u);
}

TEST(storage_types, write_batch_lands_every_entry) {
  auto db = verity::testing::scoped_path{
      verity::testing::make_db_path("verity_storage_batch")};
  auto storage = open_storage(db);
  auto encoder = encoder_t{};
  auto prefix = verity::schema::make_bytes(std::string_view{"W|"});

  storage.write_batch({});
  EXPECT_TRUE(storage.list_by_prefix(verity::schema::make_bytes_view(prefix))
                  .empty());

  auto entries = std::vector<verity::storage::key_value_entry_t>{
      {verity::schema::make_bytes(std::string_view{"W|a"}),
       encoder.encode(uint64_t{1})},
      {verity::schema::make_bytes(std::string_view{"W|b"}),
       encoder.encode(uint64_t{2})}};
  storage.write_batch(entries);

  auto rows = storage.list_by_prefix(verity::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], entries[0]);
  EXPECT_EQ(rows[1], entries[1]);
}

TEST(storage_types, replace_by_prefix_rewrites_selected_keyspace_only) {
  auto db = verity::testing::scoped_path{
      verity::testing::make_db_path("verity_storage_prefix")};
  auto storage = open_storage(db);
  auto encoder = encoder_t{};
  auto a_prefix = verity::schema::make_bytes(std::string_view{"A|"});
  auto b_prefix = verity::schema::make_bytes(std::string_view{"B|"});

  auto a1 = verity::schema::make_bytes(std::string_view{"A|one"});
  auto a2 = verity::schema::make_bytes(std::string_view{"A|two"});
  auto b1 = verity::schema::make_bytes(std::string_view{"B|one"});
  storage.put(encoder, verity::schema::make_bytes_view(a1), uint64_t{1});
  storage.put(encoder, verity::schema::make_bytes_view(a2), uint64_t{2});
  storage.put(encoder, verity::schema::make_bytes_view(b1), uint64_t{9});

  auto a3 = verity::schema::make_bytes(std::string_view{"A|three"});
  storage.replace_by_prefix(verity::schema::make_bytes_view(a_prefix),
                            {{a3, encoder.encode(uint64_t{3})}});

  auto a_rows =
      storage.list_by_prefix(verity::schema::make_bytes_view(a_prefix));
  ASSERT_EQ(a_rows.size(), 1u);
  EXPECT_EQ(a_rows[0].first, a3);
  auto a_value = encoder.try_decode<uint64_t>(
      verity::schema::make_bytes_view(a_rows[0].second));
  ASSERT_TRUE(a_value.has_value());
  EXPECT_EQ(a_value.value(), 3u);

  auto b_rows =
      storage.list_by_prefix(verity::schema::make_bytes_view(b_prefix));
  ASSERT_EQ(b_rows.size(), 1u);
  EXPECT_EQ(b_rows[0].first, b1);
}
