#include <gtest/gtest.h>
#include <bailment/codec/instruction_codec.hpp>
#include <bailment/codec/selector.hpp>
#include <bailment/schema/program_ids.hpp>
#include <bailment/testing/common.hpp>

#include <algorithm>

using namespace bailment::schema;
using bailment::testing::make_key;

namespace {

const auto& program() {
  return program_ids::default_vault_escrow_program();
}

init_escrow_t make_init_escrow() {
  return init_escrow_t{.buyer = make_key(1),
                       .seller = make_key(2),
                       .mint = make_key(3),
                       .vault = make_key(4),
                       .escrow = make_key(5),
                       .amount = 50'000,
                       .deadline_unix_ts = 1'700'003'600};
}

release_to_seller_t make_release() {
  return release_to_seller_t{.buyer = make_key(1),
                             .seller = make_key(2),
                             .mint = make_key(3),
                             .escrow = make_key(5),
                             .vault = make_key(4),
                             .vault_holding = make_key(6),
                             .seller_holding = make_key(7)};
}

}  // namespace

TEST(instruction_codec, init_escrow_data_is_selector_amount_deadline) {
  auto data = bailment::codec::encode_data(make_init_escrow());
  ASSERT_EQ(data.size(), 24u);
  auto selector = bailment::codec::make_selector("init_escrow");
  EXPECT_TRUE(std::equal(std::begin(selector), std::end(selector),
                         std::begin(data)));
  // 50000 = 0xC350, little-endian.
  EXPECT_EQ(data[8], 0x50);
  EXPECT_EQ(data[9], 0xC3);
  EXPECT_EQ(data[10], 0x00);
  EXPECT_EQ(data[15], 0x00);
}

TEST(instruction_codec, argument_free_operations_carry_only_selector) {
  auto vault = init_vault_t{
      .authority = make_key(1), .mint = make_key(2), .vault = make_key(3)};
  EXPECT_EQ(bailment::codec::encode_data(vault).size(), 8u);
  EXPECT_EQ(bailment::codec::encode_data(make_release()).size(), 8u);
  auto lock = lock_tokens_t{.amount = 100'000};
  EXPECT_EQ(bailment::codec::encode_data(lock).size(), 16u);
}

TEST(instruction_codec, release_account_list_is_positional) {
  auto metas = bailment::codec::account_metas(make_release());
  ASSERT_EQ(metas.size(), 10u);
  EXPECT_EQ(metas[0].key, make_key(1));
  EXPECT_TRUE(metas[0].is_signer);
  EXPECT_TRUE(metas[1].is_writable);
  EXPECT_FALSE(metas[1].is_signer);
  EXPECT_FALSE(metas[2].is_writable);
  EXPECT_TRUE(metas[3].is_writable);
  EXPECT_FALSE(metas[4].is_writable);
  EXPECT_TRUE(metas[5].is_writable);
  EXPECT_TRUE(metas[6].is_writable);
  EXPECT_EQ(metas[7].key, program_ids::token_program());
  EXPECT_EQ(metas[8].key, program_ids::holding_account_program());
  EXPECT_EQ(metas[9].key, program_ids::system_program());
}

TEST(instruction_codec, required_accounts_per_operation) {
  EXPECT_EQ(bailment::codec::required_accounts("init_vault"), 4u);
  EXPECT_EQ(bailment::codec::required_accounts("lock_tokens"), 8u);
  EXPECT_EQ(bailment::codec::required_accounts("init_escrow"), 6u);
  EXPECT_EQ(bailment::codec::required_accounts("release_to_seller"), 10u);
  EXPECT_FALSE(bailment::codec::required_accounts("refund").has_value());
}

TEST(instruction_codec, decode_restores_operation) {
  auto instruction = bailment::codec::encode(program(), make_init_escrow());
  auto error = transaction_error_code::ok;
  auto decoded = bailment::codec::decode(instruction, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(error, transaction_error_code::ok);
  ASSERT_TRUE(std::holds_alternative<init_escrow_t>(*decoded));
  const auto& value = std::get<init_escrow_t>(*decoded);
  EXPECT_EQ(value.escrow, make_key(5));
  EXPECT_EQ(value.amount, 50'000u);
  EXPECT_EQ(value.deadline_unix_ts, 1'700'003'600);
  EXPECT_EQ(operation_name(*decoded), "init_escrow");
}

TEST(instruction_codec, decode_rejects_unknown_selector) {
  auto instruction = bailment::codec::encode(program(), make_release());
  instruction.data[0] ^= 0xFF;
  auto error = transaction_error_code::ok;
  EXPECT_FALSE(bailment::codec::decode(instruction, error).has_value());
  EXPECT_EQ(error, transaction_error_code::instruction_fallback_not_found);

  instruction.data.resize(4);
  EXPECT_FALSE(bailment::codec::decode(instruction, error).has_value());
  EXPECT_EQ(error, transaction_error_code::instruction_fallback_not_found);
}

TEST(instruction_codec, decode_rejects_short_or_trailing_arguments) {
  auto instruction = bailment::codec::encode(program(), make_init_escrow());
  auto error = transaction_error_code::ok;

  auto truncated = instruction;
  truncated.data.pop_back();
  EXPECT_FALSE(bailment::codec::decode(truncated, error).has_value());
  EXPECT_EQ(error, transaction_error_code::instruction_did_not_deserialize);

  auto padded = instruction;
  padded.data.push_back(0x00);
  EXPECT_FALSE(bailment::codec::decode(padded, error).has_value());
  EXPECT_EQ(error, transaction_error_code::instruction_did_not_deserialize);
}

TEST(instruction_codec, decode_rejects_missing_accounts) {
  auto instruction = bailment::codec::encode(program(), make_release());
  instruction.accounts.resize(9);
  auto error = transaction_error_code::ok;
  EXPECT_FALSE(bailment::codec::decode(instruction, error).has_value());
  EXPECT_EQ(error, transaction_error_code::not_enough_account_keys);
}
