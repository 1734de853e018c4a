#include <bailment/address/derive.hpp>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/execution/holding_account_program.hpp>
#include <bailment/execution/token_program.hpp>
#include <bailment/schema/program_ids.hpp>

#include <spdlog/fmt/fmt.h>

using namespace bailment::schema;

namespace bailment::execution::holding_account_program {

namespace {

constexpr std::size_t kCreateAccounts = 6;

}  // namespace

transaction_error_code process(instruction_context& context) {
  auto tag = bailment::codec::decode_holding_instruction(
      context.instruction().data);
  if (!tag) {
    return transaction_error_code::instruction_did_not_deserialize;
  }
  const auto& accounts = context.instruction().accounts;
  if (accounts.size() < kCreateAccounts) {
    return transaction_error_code::not_enough_account_keys;
  }
  const auto& payer = accounts[0].key;
  const auto& holding = accounts[1].key;
  const auto& owner = accounts[2].key;
  const auto& mint = accounts[3].key;
  if (accounts[4].key != program_ids::system_program() ||
      accounts[5].key != program_ids::token_program()) {
    return transaction_error_code::invalid_program_id;
  }
  if (!context.is_signer(payer)) {
    return transaction_error_code::account_not_signer;
  }
  if (holding != bailment::address::derive_holding_account(owner, mint).address) {
    return transaction_error_code::constraint_associated;
  }
  auto mint_account = context.load(mint);
  if (!mint_account || !token_program::decode_mint(*mint_account)) {
    return transaction_error_code::invalid_mint;
  }

  if (auto existing = context.load(holding)) {
    if (*tag == bailment::codec::holding_instruction_tag::create) {
      return transaction_error_code::account_already_in_use;
    }
    auto state = token_program::decode_holding(*existing);
    if (!state || state->owner != owner || state->mint != mint) {
      return transaction_error_code::constraint_associated;
    }
    context.log("Holding account already exists");
    return transaction_error_code::ok;
  }

  auto state = holding_account_state_t{
      .mint = mint,
      .owner = owner,
      .amount = 0,
      .state = holding_account_status_t::initialized};
  auto code = context.create_account(holding, program_ids::token_program(),
                                     token_program::encode_holding(state));
  if (code == transaction_error_code::ok) {
    context.log(fmt::format("Created holding account {} for owner {}",
                            to_string(holding), to_string(owner)));
  }
  return code;
}

}  // namespace bailment::execution::holding_account_program
