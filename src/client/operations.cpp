#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <bailment/client/operations.hpp>
#include <bailment/codec/instruction_codec.hpp>
#include <bailment/codec/records.hpp>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/codec/transaction_codec.hpp>
#include <bailment/execution/token_program.hpp>
#include <bailment/schema/operation.hpp>
#include <bailment/schema/program_ids.hpp>

#include <algorithm>
#include <string>
#include <thread>
#include <utility>

using namespace bailment::schema;

namespace {

bailment::client::operation_result make_result(
    const transaction_error_code code,
    const std::string_view operation,
    const pubkey_t& address,
    std::string message) {
  return bailment::client::operation_result{.code = code,
                                            .operation = std::string{operation},
                                            .address = address,
                                            .message = std::move(message)};
}

/// Failure decided before anything was submitted.
bailment::client::operation_result precondition(
    const transaction_error_code code,
    const std::string_view operation,
    const pubkey_t& address,
    std::string message) {
  spdlog::warn("{} rejected locally at {}: {}", operation,
               bailment::schema::to_string(address), message);
  return make_result(code, operation, address, std::move(message));
}

bailment::client::idempotent_result make_idempotent(
    bailment::client::operation_result detail) {
  auto status = bailment::client::idempotent_status_t::failed;
  if (detail.ok()) {
    status = bailment::client::idempotent_status_t::created;
  } else if (detail.category() == error_category_t::duplicate_initialization) {
    status = bailment::client::idempotent_status_t::already_exists;
  }
  return bailment::client::idempotent_result{.status = status,
                                             .detail = std::move(detail)};
}

}  // namespace

namespace bailment::client {

vault_addresses derive_vault_addresses(const context& ctx,
                                       const pubkey_t& mint) {
  auto vault = bailment::address::derive_vault(mint, ctx.payer(),
                                               ctx.program_id, ctx.seeds.vault);
  return vault_addresses{
      .vault = vault,
      .vault_holding =
          bailment::address::derive_holding_account(vault.address, mint)
              .address,
      .payer_holding =
          bailment::address::derive_holding_account(ctx.payer(), mint).address};
}

bailment::address::derived_address derive_agreement_address(
    const context& ctx,
    const pubkey_t& mint,
    const pubkey_t& seller) {
  auto vault = derive_vault_addresses(ctx, mint).vault.address;
  return bailment::address::derive_escrow(vault, ctx.payer(), seller,
                                          ctx.program_id, ctx.seeds.escrow);
}

operation_result submit(context& ctx,
                        const std::string_view operation,
                        const pubkey_t& address,
                        std::vector<instruction_t> instructions,
                        const signers_t& extra_signers) {
  auto signers = signers_t{std::cref(ctx.signer)};
  signers.insert(std::end(signers), std::begin(extra_signers),
                 std::end(extra_signers));

  auto tx = transaction_t{};
  tx.chain_id = ctx.ledger.chain_id();
  tx.fee_payer = ctx.payer();
  tx.instructions = std::move(instructions);
  auto raw = bytes_t{};
  auto sign_with_current_nonce = [&] {
    tx.nonce = ctx.ledger.next_nonce(ctx.payer());
    bailment::codec::sign_transaction(tx, signers);
    raw = bailment::codec::encode_transaction(tx);
  };
  sign_with_current_nonce();

  auto attempts = std::max<std::size_t>(ctx.retry.max_attempts, 1);
  auto attempt = std::size_t{1};
  auto refreshes = std::size_t{0};
  auto result = transaction_result_t{};
  while (true) {
    result = ctx.ledger.submit(bytes_view_t{raw.data(), raw.size()});
    auto code = error_code(result);

    if (code == transaction_error_code::invalid_nonce) {
      // Signatures do not enter the id, so a receipt proves this exact
      // content was applied, possibly by an attempt whose reply was lost.
      if (auto height = ctx.ledger.find_transaction(
              bailment::codec::transaction_id(tx))) {
        spdlog::info("{} applied by an earlier attempt at height {}",
                     operation, *height);
        return make_result(transaction_error_code::ok, operation, address, {});
      }
      if (refreshes < ctx.retry.max_nonce_refreshes) {
        ++refreshes;
        spdlog::info("{} nonce {} is stale, signing again", operation,
                     tx.nonce);
        sign_with_current_nonce();
        continue;
      }
      break;
    }
    if (classify(code) != error_category_t::transient || attempt >= attempts) {
      break;
    }
    spdlog::warn("{} attempt {}/{} failed transiently: {}", operation, attempt,
                 attempts, result.log);
    std::this_thread::sleep_for(ctx.retry.backoff * attempt);
    ++attempt;
  }

  auto code = error_code(result);
  if (code == transaction_error_code::ok) {
    spdlog::info("{} applied at {}", operation,
                 bailment::schema::to_string(address));
  } else if (classify(code) == error_category_t::duplicate_initialization) {
    spdlog::info("{} found {} already initialized", operation,
                 bailment::schema::to_string(address));
  } else {
    spdlog::error("{} failed at {}: {} ({})", operation,
                  bailment::schema::to_string(address), result.log,
                  bailment::schema::to_string(code));
  }
  return make_result(code, operation, address, result.log);
}

operation_result create_asset(context& ctx,
                              const bailment::crypto::keypair& mint,
                              const uint8_t decimals,
                              const amount_t initial_supply) {
  static constexpr auto kOperation = std::string_view{"create_asset"};
  const auto& mint_key = mint.public_key();
  if (ctx.ledger.get_account(mint_key).has_value()) {
    return precondition(transaction_error_code::account_already_in_use,
                        kOperation, mint_key, "mint account already exists");
  }

  auto payer_holding =
      bailment::address::derive_holding_account(ctx.payer(), mint_key).address;
  auto instructions = std::vector<instruction_t>{
      bailment::codec::make_initialize_mint(mint_key, decimals, ctx.payer(),
                                            ctx.payer()),
      bailment::codec::make_create_holding_account(ctx.payer(), ctx.payer(),
                                                   mint_key, true)};
  if (initial_supply > 0) {
    instructions.push_back(bailment::codec::make_mint_to(
        mint_key, payer_holding, ctx.payer(), initial_supply));
  }
  return submit(ctx, kOperation, mint_key, std::move(instructions),
                signers_t{std::cref(mint)});
}

idempotent_result ensure_holding_account(context& ctx,
                                         const pubkey_t& owner,
                                         const pubkey_t& mint) {
  static constexpr auto kOperation = std::string_view{"create_holding_account"};
  auto holding = bailment::address::derive_holding_account(owner, mint).address;
  if (fetch_holding(ctx, holding).has_value()) {
    spdlog::info("holding account {} already exists",
                 bailment::schema::to_string(holding));
    return idempotent_result{
        .status = idempotent_status_t::already_exists,
        .detail = make_result(transaction_error_code::ok, kOperation, holding,
                              "already exists")};
  }
  return make_idempotent(submit(
      ctx, kOperation, holding,
      {bailment::codec::make_create_holding_account(ctx.payer(), owner, mint,
                                                    true)}));
}

idempotent_result init_vault(context& ctx, const pubkey_t& mint) {
  auto addresses = derive_vault_addresses(ctx, mint);
  auto operation = init_vault_t{.authority = ctx.payer(),
                                .mint = mint,
                                .vault = addresses.vault.address};
  return make_idempotent(
      submit(ctx, init_vault_t::kName, addresses.vault.address,
             {bailment::codec::encode(ctx.program_id, operation)}));
}

operation_result lock_tokens(context& ctx,
                             const pubkey_t& mint,
                             const amount_t amount) {
  auto addresses = derive_vault_addresses(ctx, mint);
  const auto& vault = addresses.vault.address;
  if (!fetch_vault(ctx, vault).has_value()) {
    return precondition(transaction_error_code::account_not_initialized,
                        lock_tokens_t::kName, vault, "vault not initialized");
  }
  if (!fetch_holding(ctx, addresses.vault_holding).has_value()) {
    return precondition(transaction_error_code::account_not_initialized,
                        lock_tokens_t::kName, addresses.vault_holding,
                        "vault holding account not created");
  }
  auto holder = fetch_holding(ctx, addresses.payer_holding);
  if (!holder.has_value() || holder->amount < amount) {
    return precondition(
        transaction_error_code::insufficient_funds, lock_tokens_t::kName,
        addresses.payer_holding,
        fmt::format("holder has {} but {} requested",
                    holder ? holder->amount : 0, amount));
  }

  auto operation = lock_tokens_t{.holder = ctx.payer(),
                                 .mint = mint,
                                 .vault = vault,
                                 .vault_holding = addresses.vault_holding,
                                 .holder_holding = addresses.payer_holding,
                                 .amount = amount};
  return submit(ctx, lock_tokens_t::kName, vault,
                {bailment::codec::encode(ctx.program_id, operation)});
}

operation_result init_escrow(context& ctx,
                             const pubkey_t& mint,
                             const pubkey_t& seller,
                             const amount_t amount,
                             const unix_timestamp_t deadline_unix_ts,
                             const bool create_seller_holding) {
  auto addresses = derive_vault_addresses(ctx, mint);
  auto escrow = derive_agreement_address(ctx, mint, seller).address;
  if (amount == 0) {
    return precondition(transaction_error_code::zero_amount,
                        init_escrow_t::kName, escrow, "amount must be positive");
  }
  if (deadline_unix_ts <= ctx.ledger.now()) {
    return precondition(transaction_error_code::deadline_not_in_future,
                        init_escrow_t::kName, escrow,
                        fmt::format("deadline {} is not after {}",
                                    deadline_unix_ts, ctx.ledger.now()));
  }
  auto vault_holding = fetch_holding(ctx, addresses.vault_holding);
  auto balance = vault_holding ? vault_holding->amount : amount_t{0};
  if (amount > balance) {
    return precondition(
        transaction_error_code::amount_exceeds_vault_balance,
        init_escrow_t::kName, escrow,
        fmt::format("vault holds {} but {} requested", balance, amount));
  }

  auto instructions = std::vector<instruction_t>{};
  if (create_seller_holding) {
    instructions.push_back(bailment::codec::make_create_holding_account(
        ctx.payer(), seller, mint, true));
  }
  auto operation = init_escrow_t{.buyer = ctx.payer(),
                                 .seller = seller,
                                 .mint = mint,
                                 .vault = addresses.vault.address,
                                 .escrow = escrow,
                                 .amount = amount,
                                 .deadline_unix_ts = deadline_unix_ts};
  instructions.push_back(bailment::codec::encode(ctx.program_id, operation));
  return submit(ctx, init_escrow_t::kName, escrow, std::move(instructions));
}

operation_result release_to_seller(context& ctx,
                                   const pubkey_t& mint,
                                   const pubkey_t& seller) {
  auto addresses = derive_vault_addresses(ctx, mint);
  auto escrow = derive_agreement_address(ctx, mint, seller).address;
  auto agreement = fetch_agreement(ctx, escrow);
  if (!agreement.has_value()) {
    return precondition(transaction_error_code::account_not_initialized,
                        release_to_seller_t::kName, escrow,
                        "agreement not initialized");
  }
  if (agreement->status == agreement_status_t::released) {
    return precondition(transaction_error_code::already_released,
                        release_to_seller_t::kName, escrow,
                        "agreement already released");
  }
  if (ctx.ledger.now() > agreement->deadline_unix_ts) {
    return precondition(transaction_error_code::deadline_passed,
                        release_to_seller_t::kName, escrow,
                        fmt::format("deadline {} has passed",
                                    agreement->deadline_unix_ts));
  }
  if (agreement->buyer != ctx.payer()) {
    return precondition(transaction_error_code::not_buyer,
                        release_to_seller_t::kName, escrow,
                        "signer is not the buyer");
  }
  auto seller_holding =
      bailment::address::derive_holding_account(seller, mint).address;
  if (!fetch_holding(ctx, seller_holding).has_value()) {
    return precondition(transaction_error_code::account_not_initialized,
                        release_to_seller_t::kName, seller_holding,
                        "seller holding account not created");
  }

  auto operation =
      release_to_seller_t{.buyer = ctx.payer(),
                          .seller = seller,
                          .mint = mint,
                          .escrow = escrow,
                          .vault = addresses.vault.address,
                          .vault_holding = addresses.vault_holding,
                          .seller_holding = seller_holding};
  return submit(ctx, release_to_seller_t::kName, escrow,
                {bailment::codec::encode(ctx.program_id, operation)});
}

std::optional<mint_state_t> fetch_mint(const context& ctx,
                                       const pubkey_t& mint) {
  auto account = ctx.ledger.get_account(mint);
  if (!account.has_value()) {
    return std::nullopt;
  }
  return bailment::execution::token_program::decode_mint(*account);
}

std::optional<vault_state_t> fetch_vault(const context& ctx,
                                         const pubkey_t& vault) {
  auto account = ctx.ledger.get_account(vault);
  if (!account.has_value() || account->owner != ctx.program_id) {
    return std::nullopt;
  }
  return bailment::codec::decode_record<vault_state_t>(
      bytes_view_t{account->data.data(), account->data.size()});
}

std::optional<agreement_state_t> fetch_agreement(const context& ctx,
                                                 const pubkey_t& escrow) {
  auto account = ctx.ledger.get_account(escrow);
  if (!account.has_value() || account->owner != ctx.program_id) {
    return std::nullopt;
  }
  return bailment::codec::decode_record<agreement_state_t>(
      bytes_view_t{account->data.data(), account->data.size()});
}

std::optional<holding_account_state_t> fetch_holding(const context& ctx,
                                                     const pubkey_t& holding) {
  auto account = ctx.ledger.get_account(holding);
  if (!account.has_value()) {
    return std::nullopt;
  }
  return bailment::execution::token_program::decode_holding(*account);
}

std::optional<amount_t> holding_balance(const context& ctx,
                                        const pubkey_t& owner,
                                        const pubkey_t& mint) {
  auto holding = fetch_holding(
      ctx, bailment::address::derive_holding_account(owner, mint).address);
  if (!holding.has_value()) {
    return std::nullopt;
  }
  return holding->amount;
}

}  // namespace bailment::client
