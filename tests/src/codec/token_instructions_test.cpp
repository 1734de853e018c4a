#include <gtest/gtest.h>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/schema/program_ids.hpp>
#include <bailment/testing/common.hpp>

using namespace bailment::schema;
using bailment::testing::make_key;

TEST(token_instructions, transfer_layout) {
  auto instruction = bailment::codec::make_transfer(make_key(1), make_key(2),
                                                    make_key(3), 258);
  EXPECT_EQ(instruction.program_id, program_ids::token_program());
  ASSERT_EQ(instruction.data.size(), 9u);
  EXPECT_EQ(instruction.data[0], 3);
  EXPECT_EQ(instruction.data[1], 0x02);
  EXPECT_EQ(instruction.data[2], 0x01);
  ASSERT_EQ(instruction.accounts.size(), 3u);
  EXPECT_TRUE(instruction.accounts[0].is_writable);
  EXPECT_TRUE(instruction.accounts[1].is_writable);
  EXPECT_TRUE(instruction.accounts[2].is_signer);

  auto decoded = bailment::codec::decode_token_instruction(instruction.data);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_TRUE(std::holds_alternative<bailment::codec::transfer_args>(*decoded));
  EXPECT_EQ(std::get<bailment::codec::transfer_args>(*decoded).amount, 258u);
}

TEST(token_instructions, initialize_mint_keeps_optional_freeze_authority) {
  auto with_freeze = bailment::codec::make_initialize_mint(
      make_key(1), 6, make_key(2), make_key(3));
  EXPECT_EQ(with_freeze.data[0], 20);
  auto decoded = bailment::codec::decode_token_instruction(with_freeze.data);
  ASSERT_TRUE(decoded.has_value());
  const auto& args = std::get<bailment::codec::initialize_mint_args>(*decoded);
  EXPECT_EQ(args.decimals, 6);
  EXPECT_EQ(args.mint_authority, make_key(2));
  EXPECT_EQ(args.freeze_authority, make_key(3));

  auto without = bailment::codec::make_initialize_mint(make_key(1), 0,
                                                       make_key(2), {});
  decoded = bailment::codec::decode_token_instruction(without.data);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(std::get<bailment::codec::initialize_mint_args>(*decoded)
                   .freeze_authority.has_value());
}

TEST(token_instructions, rejects_unknown_tag_and_short_data) {
  EXPECT_FALSE(bailment::codec::decode_token_instruction(bytes_t{}));
  EXPECT_FALSE(bailment::codec::decode_token_instruction(bytes_t{99}));
  EXPECT_FALSE(bailment::codec::decode_token_instruction(bytes_t{3, 1, 2}));
}

TEST(token_instructions, holding_account_creation_layout) {
  auto instruction = bailment::codec::make_create_holding_account(
      make_key(1), make_key(2), make_key(3), true);
  EXPECT_EQ(instruction.program_id, program_ids::holding_account_program());
  ASSERT_EQ(instruction.accounts.size(), 6u);
  EXPECT_TRUE(instruction.accounts[0].is_signer);
  EXPECT_TRUE(instruction.accounts[1].is_writable);
  EXPECT_EQ(instruction.accounts[2].key, make_key(2));
  EXPECT_EQ(instruction.accounts[3].key, make_key(3));
  EXPECT_EQ(instruction.accounts[4].key, program_ids::system_program());
  EXPECT_EQ(instruction.accounts[5].key, program_ids::token_program());
  EXPECT_EQ(bailment::codec::decode_holding_instruction(instruction.data),
            bailment::codec::holding_instruction_tag::create_idempotent);
  EXPECT_EQ(bailment::codec::decode_holding_instruction(bytes_t{}),
            bailment::codec::holding_instruction_tag::create);
  EXPECT_FALSE(bailment::codec::decode_holding_instruction(bytes_t{7}));
}
