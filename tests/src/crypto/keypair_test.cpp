#include <gtest/gtest.h>
#include <bailment/crypto/keypair.hpp>
#include <bailment/crypto/verify.hpp>
#include <bailment/testing/common.hpp>

#include <filesystem>
#include <fstream>

TEST(keypair, save_then_load_restores_identity) {
  auto path = bailment::testing::make_db_path("bailment_keypair") + ".json";
  auto key = bailment::crypto::keypair::generate();
  ASSERT_TRUE(key.save(path));

  auto loaded = bailment::crypto::keypair::load(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->public_key(), key.public_key());
  EXPECT_EQ(loaded->seed(), key.seed());

  auto perms = std::filesystem::status(path).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_read,
            std::filesystem::perms::none);
  bailment::testing::remove_path(path);
}

TEST(keypair, load_rejects_mismatched_public_half) {
  auto path = bailment::testing::make_db_path("bailment_keypair") + ".json";
  {
    auto out = std::ofstream{path};
    out << '[';
    for (auto i = 0; i < 64; ++i) {
      out << (i == 0 ? "" : ",") << 7;
    }
    out << ']';
  }
  EXPECT_FALSE(bailment::crypto::keypair::load(path).has_value());
  bailment::testing::remove_path(path);
}

TEST(keypair, load_rejects_short_or_missing_files) {
  auto path = bailment::testing::make_db_path("bailment_keypair") + ".json";
  EXPECT_FALSE(bailment::crypto::keypair::load(path).has_value());
  {
    auto out = std::ofstream{path};
    out << "[1,2,3]";
  }
  EXPECT_FALSE(bailment::crypto::keypair::load(path).has_value());
  bailment::testing::remove_path(path);
}

TEST(keypair, signatures_verify_under_public_key) {
  auto key = bailment::testing::make_keypair(3);
  auto message = bailment::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF};
  EXPECT_TRUE(bailment::crypto::verify_signature(message, key.public_key(),
                                                 key.sign(message)));
}

TEST(keypair, distinct_seeds_give_distinct_identities) {
  EXPECT_NE(bailment::testing::make_keypair(1).public_key(),
            bailment::testing::make_keypair(2).public_key());
  EXPECT_EQ(bailment::testing::make_keypair(1).public_key(),
            bailment::testing::make_keypair(1).public_key());
}
