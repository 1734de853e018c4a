#include <gtest/gtest.h>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/program_ids.hpp>

TEST(primitives, base58_encodes_known_vector) {
  auto encoded = bailment::schema::to_base58(
      bailment::schema::make_bytes_view(std::string_view{"Hello World!"}));
  EXPECT_EQ(encoded, "2NEpo7TZRRrLZSi2U");
}

TEST(primitives, base58_decodes_known_vector) {
  auto decoded = bailment::schema::try_from_base58("2NEpo7TZRRrLZSi2U");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(bailment::schema::make_string(*decoded), "Hello World!");
}

TEST(primitives, base58_keeps_leading_zero_bytes) {
  auto bytes = bailment::schema::bytes_t{0x00, 0x00, 0x01};
  auto encoded = bailment::schema::to_base58(bytes);
  EXPECT_EQ(encoded, "112");
  EXPECT_EQ(bailment::schema::try_from_base58(encoded), bytes);
}

TEST(primitives, base58_rejects_characters_outside_alphabet) {
  EXPECT_FALSE(bailment::schema::try_from_base58("0OIl").has_value());
}

TEST(primitives, system_program_is_the_zero_identity) {
  EXPECT_EQ(bailment::schema::program_ids::system_program(),
            bailment::schema::make_zero_pubkey());
  EXPECT_EQ(bailment::schema::to_string(bailment::schema::make_zero_pubkey()),
            std::string(32, '1'));
}

TEST(primitives, well_known_program_ids_render_back_to_base58) {
  EXPECT_EQ(bailment::schema::to_string(
                bailment::schema::program_ids::token_program()),
            "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  EXPECT_EQ(bailment::schema::to_string(
                bailment::schema::program_ids::holding_account_program()),
            "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
}

TEST(primitives, try_make_pubkey_rejects_wrong_length) {
  EXPECT_FALSE(bailment::schema::try_make_pubkey("2NEpo7TZRRrLZSi2U"));
  EXPECT_FALSE(bailment::schema::try_make_pubkey(""));
}

TEST(primitives, try_make_pubkey_accepts_hex) {
  auto key = bailment::schema::try_make_pubkey(
      "0x0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ((*key)[0], 0x01);
  EXPECT_EQ((*key)[31], 0x20);
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = bailment::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  EXPECT_EQ(bailment::schema::to_hex(payload), "007f80ff");
  EXPECT_EQ(bailment::schema::from_hex("007F80FF"), payload);
  EXPECT_FALSE(bailment::schema::try_from_hex("abc").has_value());
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = bailment::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = bailment::schema::to_base64(payload);
  EXPECT_EQ(encoded, "AQID/v8=");
  EXPECT_EQ(bailment::schema::try_from_base64(encoded), payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  auto decoded = bailment::schema::try_from_base64("not base64***");
  EXPECT_FALSE(decoded.has_value());
}
