#include <gtest/gtest.h>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <notary/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
using storage_t = notary::storage::storage<notary::storage::rocksdb_storage_tag>;

storage_t open(const std::string& path) {
  return notary::storage::make_storage<notary::storage::rocksdb_storage_tag>(
      path);
}

}  // namespace

TEST(storage, missing_key_and_checkpoint_load_as_nullopt) {
  auto path = notary::testing::make_db_path("notary_storage_missing");
  {
    auto storage = open(path);
    auto key = notary::schema::make_bytes(std::string_view{"absent"});
    EXPECT_FALSE(storage.load(notary::schema::bytes_view_t{key}).has_value());
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  notary::testing::remove_path(path);
}

TEST(storage, put_get_and_committed_state_survive_reopen) {
  auto path = notary::testing::make_db_path("notary_storage_reopen");
  auto encoder = encoder_t{};
  auto key = notary::schema::key::make_nonce_key(
      encoder, notary::testing::make_account(3));
  auto root = notary::testing::make_hash(7);
  {
    auto storage = open(path);
    storage.put(encoder, notary::schema::bytes_view_t{key}, uint64_t{42});
    storage.save_committed_state(
        notary::storage::committed_state{.height = 5, .state_root = root});
  }
  {
    auto storage = open(path);
    auto value = storage.get<uint64_t>(encoder, notary::schema::bytes_view_t{key});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42u);
    auto state = storage.load_committed_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->height, 5);
    EXPECT_EQ(state->state_root, root);
  }
  notary::testing::remove_path(path);
}

TEST(storage, commit_batch_writes_entries_with_checkpoint) {
  auto path = notary::testing::make_db_path("notary_storage_batch");
  {
    auto storage = open(path);
    auto entries = std::vector<notary::storage::key_value_entry_t>{
        {notary::schema::make_bytes(std::string_view{"k1"}),
         notary::schema::make_bytes(std::string_view{"v1"})},
        {notary::schema::make_bytes(std::string_view{"k2"}),
         notary::schema::make_bytes(std::string_view{"v2"})}};
    auto root = notary::testing::make_hash(9);
    storage.commit_batch(entries, notary::storage::committed_state{
                                      .height = 2, .state_root = root});

    for (const auto& [key, value] : entries) {
      auto loaded = storage.load(notary::schema::bytes_view_t{key});
      ASSERT_TRUE(loaded.has_value());
      EXPECT_EQ(*loaded, value);
    }
    auto state = storage.load_committed_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->height, 2);
    EXPECT_EQ(state->state_root, root);
  }
  notary::testing::remove_path(path);
}

TEST(storage, list_by_prefix_returns_only_matching_keys) {
  auto path = notary::testing::make_db_path("notary_storage_prefix");
  auto encoder = encoder_t{};
  {
    auto storage = open(path);
    auto entries = std::vector<notary::storage::key_value_entry_t>{};
    for (uint64_t height = 1; height <= 3; ++height) {
      entries.emplace_back(
          notary::schema::key::make_history_key(encoder, height, 0),
          encoder.encode(height));
    }
    entries.emplace_back(
        notary::schema::key::make_nonce_key(encoder,
                                            notary::testing::make_account(1)),
        encoder.encode(uint64_t{1}));
    storage.commit_batch(entries, notary::storage::committed_state{
                                      .height = 3, .state_root = {}});

    auto prefix = notary::schema::key::make_prefix_key(
        encoder, notary::schema::key::kHistoryPrefix);
    auto rows = storage.list_by_prefix(notary::schema::bytes_view_t{prefix});
    EXPECT_EQ(rows.size(), 3u);
    for (const auto& [key, value] : rows) {
      EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                             std::begin(key)));
    }
  }
  notary::testing::remove_path(path);
}
