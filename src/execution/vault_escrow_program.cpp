#include <bailment/address/derive.hpp>
#include <bailment/codec/instruction_codec.hpp>
#include <bailment/codec/records.hpp>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/execution/token_program.hpp>
#include <bailment/execution/vault_escrow_program.hpp>
#include <bailment/schema/agreement_state.hpp>
#include <bailment/schema/program_ids.hpp>
#include <bailment/schema/vault_state.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>

using namespace bailment::schema;

namespace bailment::execution::vault_escrow_program {

namespace {

using bailment::address::kEscrowSeed;
using bailment::address::kVaultSeed;

// Signer, mutability and program slots of the positional account list.
transaction_error_code check_account_flags(const instruction_context& context,
                                           const operation_t& operation) {
  auto expected = bailment::codec::account_metas(operation);
  const auto& actual = context.instruction().accounts;
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (actual[i].key != expected[i].key) {
      return transaction_error_code::invalid_program_id;
    }
    if (expected[i].is_signer && !context.is_signer(actual[i].key)) {
      return transaction_error_code::account_not_signer;
    }
    if (expected[i].is_writable && !actual[i].is_writable) {
      return transaction_error_code::account_not_writable;
    }
  }
  return transaction_error_code::ok;
}

template <typename Record>
std::optional<Record> load_record(const instruction_context& context,
                                  const pubkey_t& key,
                                  transaction_error_code& error) {
  auto account = context.load(key);
  if (!account) {
    error = transaction_error_code::account_not_initialized;
    return std::nullopt;
  }
  if (account->owner != context.program_id()) {
    error = transaction_error_code::account_owned_by_wrong_program;
    return std::nullopt;
  }
  auto record = bailment::codec::decode_record<Record>(account->data);
  if (!record) {
    error = transaction_error_code::account_discriminator_mismatch;
  }
  return record;
}

transaction_error_code check_mint(const instruction_context& context,
                                  const pubkey_t& key) {
  auto account = context.load(key);
  if (!account) {
    return transaction_error_code::account_not_initialized;
  }
  if (!token_program::decode_mint(*account)) {
    return transaction_error_code::invalid_mint;
  }
  return transaction_error_code::ok;
}

// The vault must sit at the address its own fields and bump derive to.
transaction_error_code check_vault_address(const instruction_context& context,
                                           const pubkey_t& key,
                                           const vault_state_t& vault) {
  auto bump = std::array<uint8_t, 1>{vault.bump};
  auto address = bailment::address::create_program_address(
      {make_bytes_view(kVaultSeed), make_bytes_view(vault.mint),
       make_bytes_view(vault.authority), bytes_view_t{bump}},
      context.program_id());
  if (!address || *address != key) {
    return transaction_error_code::constraint_seeds;
  }
  return transaction_error_code::ok;
}

transaction_error_code check_holding_address(const pubkey_t& key,
                                             const pubkey_t& owner,
                                             const pubkey_t& mint) {
  if (bailment::address::derive_holding_account(owner, mint).address != key) {
    return transaction_error_code::constraint_associated;
  }
  return transaction_error_code::ok;
}

transaction_error_code init_vault(instruction_context& context,
                                  const init_vault_t& operation) {
  if (auto code = check_mint(context, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  auto derived = bailment::address::try_find_program_address(
      {make_bytes_view(kVaultSeed), make_bytes_view(operation.mint),
       make_bytes_view(operation.authority)},
      context.program_id());
  if (!derived || derived->address != operation.vault) {
    return transaction_error_code::constraint_seeds;
  }

  auto record = vault_state_t{.authority = operation.authority,
                              .mint = operation.mint,
                              .bump = derived->bump};
  auto code = context.create_account(operation.vault, context.program_id(),
                                     bailment::codec::encode_record(record));
  if (code == transaction_error_code::ok) {
    context.log("Instruction: InitVault");
  }
  return code;
}

transaction_error_code lock_tokens(instruction_context& context,
                                   const lock_tokens_t& operation) {
  if (auto code = check_mint(context, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  auto error = transaction_error_code::ok;
  auto vault = load_record<vault_state_t>(context, operation.vault, error);
  if (!vault) {
    return error;
  }
  if (vault->mint != operation.mint) {
    return transaction_error_code::constraint_seeds;
  }
  if (auto code = check_vault_address(context, operation.vault, *vault);
      code != transaction_error_code::ok) {
    return code;
  }
  if (vault->authority != operation.holder) {
    return transaction_error_code::not_vault_authority;
  }
  if (auto code = check_holding_address(operation.vault_holding,
                                        operation.vault, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }

  auto holder_account = context.load(operation.holder_holding);
  if (!holder_account) {
    return transaction_error_code::account_not_initialized;
  }
  auto holder_holding = token_program::decode_holding(*holder_account);
  if (!holder_holding || holder_holding->owner != operation.holder ||
      holder_holding->mint != operation.mint) {
    return transaction_error_code::constraint_raw;
  }

  context.log(fmt::format("Instruction: LockTokens amount={}",
                          operation.amount));
  return context.invoke(bailment::codec::make_transfer(
      operation.holder_holding, operation.vault_holding, operation.holder,
      operation.amount));
}

transaction_error_code init_escrow(instruction_context& context,
                                   const init_escrow_t& operation) {
  if (auto code = check_mint(context, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  auto error = transaction_error_code::ok;
  auto vault = load_record<vault_state_t>(context, operation.vault, error);
  if (!vault) {
    return error;
  }
  if (vault->mint != operation.mint) {
    return transaction_error_code::constraint_seeds;
  }
  if (auto code = check_vault_address(context, operation.vault, *vault);
      code != transaction_error_code::ok) {
    return code;
  }
  if (vault->authority != operation.buyer) {
    return transaction_error_code::not_vault_authority;
  }

  auto derived = bailment::address::try_find_program_address(
      {make_bytes_view(kEscrowSeed), make_bytes_view(operation.vault),
       make_bytes_view(operation.buyer), make_bytes_view(operation.seller)},
      context.program_id());
  if (!derived || derived->address != operation.escrow) {
    return transaction_error_code::constraint_seeds;
  }
  if (context.load(operation.escrow)) {
    return transaction_error_code::account_already_in_use;
  }

  if (operation.amount == 0) {
    return transaction_error_code::zero_amount;
  }
  if (operation.deadline_unix_ts <= context.now()) {
    return transaction_error_code::deadline_not_in_future;
  }
  // The vault's holding account is not part of the account list; its balance
  // is read straight from the ledger.
  auto vault_holding = bailment::address::derive_holding_account(
      operation.vault, operation.mint);
  auto balance = amount_t{0};
  if (auto account = context.load(vault_holding.address)) {
    if (auto holding = token_program::decode_holding(*account)) {
      balance = holding->amount;
    }
  }
  if (operation.amount > balance) {
    return transaction_error_code::amount_exceeds_vault_balance;
  }

  auto record = agreement_state_t{.vault = operation.vault,
                                  .buyer = operation.buyer,
                                  .seller = operation.seller,
                                  .mint = operation.mint,
                                  .amount_locked = operation.amount,
                                  .deadline_unix_ts = operation.deadline_unix_ts,
                                  .status = agreement_status_t::active,
                                  .bump = derived->bump};
  auto code = context.create_account(operation.escrow, context.program_id(),
                                     bailment::codec::encode_record(record));
  if (code == transaction_error_code::ok) {
    context.log(fmt::format("Instruction: InitEscrow amount={} deadline={}",
                            operation.amount, operation.deadline_unix_ts));
  }
  return code;
}

transaction_error_code release_to_seller(instruction_context& context,
                                         const release_to_seller_t& operation) {
  if (auto code = check_mint(context, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  auto error = transaction_error_code::ok;
  auto escrow =
      load_record<agreement_state_t>(context, operation.escrow, error);
  if (!escrow) {
    return error;
  }
  auto vault = load_record<vault_state_t>(context, operation.vault, error);
  if (!vault) {
    return error;
  }
  if (vault->mint != operation.mint) {
    return transaction_error_code::constraint_seeds;
  }
  if (auto code = check_vault_address(context, operation.vault, *vault);
      code != transaction_error_code::ok) {
    return code;
  }
  if (escrow->vault != operation.vault || escrow->seller != operation.seller ||
      escrow->mint != operation.mint || escrow->amount_locked == 0) {
    return transaction_error_code::constraint_raw;
  }
  if (auto code = check_holding_address(operation.vault_holding,
                                        operation.vault, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  if (auto code = check_holding_address(operation.seller_holding,
                                        operation.seller, operation.mint);
      code != transaction_error_code::ok) {
    return code;
  }
  if (!context.load(operation.seller_holding)) {
    return transaction_error_code::account_not_initialized;
  }

  if (context.now() > escrow->deadline_unix_ts) {
    return transaction_error_code::deadline_passed;
  }
  if (escrow->buyer != operation.buyer) {
    return transaction_error_code::not_buyer;
  }
  if (escrow->status != agreement_status_t::active) {
    return transaction_error_code::already_released;
  }

  auto bump = std::array<uint8_t, 1>{vault->bump};
  auto vault_seeds = bailment::address::seeds_t{
      make_bytes_view(kVaultSeed), make_bytes_view(vault->mint),
      make_bytes_view(vault->authority), bytes_view_t{bump}};
  if (auto code = context.invoke_signed(
          bailment::codec::make_transfer(operation.vault_holding,
                                         operation.seller_holding,
                                         operation.vault,
                                         escrow->amount_locked),
          {vault_seeds});
      code != transaction_error_code::ok) {
    return code;
  }

  escrow->status = agreement_status_t::released;
  auto code = context.store(operation.escrow,
                            bailment::codec::encode_record(*escrow));
  if (code == transaction_error_code::ok) {
    context.log(fmt::format("Instruction: ReleaseToSeller amount={}",
                            escrow->amount_locked));
  }
  return code;
}

}  // namespace

transaction_error_code process(instruction_context& context) {
  auto error = transaction_error_code::ok;
  auto operation = bailment::codec::decode(context.instruction(), error);
  if (!operation) {
    return error;
  }
  if (auto code = check_account_flags(context, *operation);
      code != transaction_error_code::ok) {
    return code;
  }
  return std::visit(
      overloaded{[&](const init_vault_t& value) {
                   return init_vault(context, value);
                 },
                 [&](const lock_tokens_t& value) {
                   return lock_tokens(context, value);
                 },
                 [&](const init_escrow_t& value) {
                   return init_escrow(context, value);
                 },
                 [&](const release_to_seller_t& value) {
                   return release_to_seller(context, value);
                 }},
      *operation);
}

}  // namespace bailment::execution::vault_escrow_program
