#include <gtest/gtest.h>
#include <bailment/schema/account.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>
#include <bailment/storage/rocksdb/storage.hpp>
#include <bailment/storage/storage.hpp>
#include <bailment/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

auto open_storage(const std::string& path) {
  return bailment::storage::make_storage<
      bailment::storage::rocksdb_storage_tag>(path);
}

}  // namespace

TEST(storage, missing_keys_read_as_empty) {
  auto db = bailment::testing::make_db_path("bailment_storage_missing");
  {
    auto storage = open_storage(db);
    auto key = bailment::storage::make_account_key(
        bailment::testing::make_key(1));
    EXPECT_FALSE(storage.get_raw(key).has_value());
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  bailment::testing::remove_path(db);
}

TEST(storage, account_round_trips_through_encoder) {
  auto db = bailment::testing::make_db_path("bailment_storage_account");
  {
    auto storage = open_storage(db);
    auto encoder = encoder_t{};
    auto key = bailment::storage::make_account_key(
        bailment::testing::make_key(1));
    auto account = bailment::schema::account_t{
        .owner = bailment::testing::make_key(9),
        .data = bailment::schema::bytes_t{1, 2, 3}};
    storage.put(encoder, key, account);

    auto loaded =
        storage.get<encoder_t, bailment::schema::account_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->owner, account.owner);
    EXPECT_EQ(loaded->data, account.data);
  }
  bailment::testing::remove_path(db);
}

TEST(storage, committed_state_survives_reopen) {
  auto db = bailment::testing::make_db_path("bailment_storage_committed");
  auto state = bailment::storage::committed_state{
      .height = 42,
      .state_root = bailment::testing::make_key(10),
      .chain_id = bailment::testing::make_key(20)};
  {
    auto storage = open_storage(db);
    storage.save_committed_state(state);
  }
  {
    auto storage = open_storage(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->state_root, state.state_root);
    EXPECT_EQ(loaded->chain_id, state.chain_id);
  }
  bailment::testing::remove_path(db);
}

TEST(storage, apply_writes_puts_deletes_and_checkpoint_together) {
  auto db = bailment::testing::make_db_path("bailment_storage_apply");
  {
    auto storage = open_storage(db);
    auto first =
        bailment::storage::make_account_key(bailment::testing::make_key(1));
    auto second =
        bailment::storage::make_account_key(bailment::testing::make_key(2));
    storage.apply(bailment::storage::write_set{
        .puts = {{first, bailment::schema::bytes_t{0xAA}}}});

    storage.apply(bailment::storage::write_set{
        .puts = {{second, bailment::schema::bytes_t{0xBB}}},
        .deletes = {first},
        .checkpoint = bailment::storage::committed_state{.height = 1}});

    EXPECT_FALSE(storage.get_raw(first).has_value());
    EXPECT_EQ(storage.get_raw(second), bailment::schema::bytes_t{0xBB});
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 1);
  }
  bailment::testing::remove_path(db);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto db = bailment::testing::make_db_path("bailment_storage_prefix");
  {
    auto storage = open_storage(db);
    auto encoder = encoder_t{};
    for (uint8_t i = 0; i < 3; ++i) {
      storage.put(encoder,
                  bailment::storage::make_account_key(
                      bailment::testing::make_key(i)),
                  uint64_t{i});
      storage.put(encoder,
                  bailment::storage::make_nonce_key(
                      bailment::testing::make_key(i)),
                  uint64_t{i});
    }
    auto accounts = storage.list_by_prefix(bailment::schema::make_bytes_view(
        bailment::storage::kAccountPrefix));
    EXPECT_EQ(accounts.size(), 3u);
    auto nonces = storage.list_by_prefix(bailment::schema::make_bytes_view(
        bailment::storage::kNoncePrefix));
    EXPECT_EQ(nonces.size(), 3u);
  }
  bailment::testing::remove_path(db);
}
