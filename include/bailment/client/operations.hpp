#pragma once

#include <bailment/address/derive.hpp>
#include <bailment/client/context.hpp>
#include <bailment/client/operation_result.hpp>
#include <bailment/crypto/keypair.hpp>
#include <bailment/schema/agreement_state.hpp>
#include <bailment/schema/holding_account_state.hpp>
#include <bailment/schema/instruction.hpp>
#include <bailment/schema/mint_state.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/vault_state.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

// Client-side protocol steps. Every step derives the addresses it needs,
// checks the preconditions it can see locally, and submits one transaction.
namespace bailment::client {

using signers_t =
    std::vector<std::reference_wrapper<const bailment::crypto::keypair>>;

/// Addresses of the signer's vault for one asset.
struct vault_addresses final {
  bailment::address::derived_address vault;
  bailment::schema::pubkey_t vault_holding{};
  bailment::schema::pubkey_t payer_holding{};
};

vault_addresses derive_vault_addresses(const context& ctx,
                                       const bailment::schema::pubkey_t& mint);

bailment::address::derived_address derive_agreement_address(
    const context& ctx,
    const bailment::schema::pubkey_t& mint,
    const bailment::schema::pubkey_t& seller);

/// Sign `instructions` as one transaction (fee payer first, then
/// `extra_signers`) and submit it. Transient failures are resubmitted with
/// the same nonce according to the context's retry policy. A rejected stale
/// nonce counts as applied only when the executor holds a receipt for this
/// transaction; otherwise it is signed again with the current nonce.
operation_result submit(context& ctx,
                        std::string_view operation,
                        const bailment::schema::pubkey_t& address,
                        std::vector<bailment::schema::instruction_t> instructions,
                        const signers_t& extra_signers = {});

/// New asset with the signer as mint and freeze authority, the signer's
/// holding account, and `initial_supply` minted into it. One transaction.
operation_result create_asset(context& ctx,
                              const bailment::crypto::keypair& mint,
                              uint8_t decimals,
                              bailment::schema::amount_t initial_supply);

/// Canonical holding account of (owner, mint), created when absent.
idempotent_result ensure_holding_account(
    context& ctx,
    const bailment::schema::pubkey_t& owner,
    const bailment::schema::pubkey_t& mint);

/// Vault of the signer for `mint`. An existing vault is not an error.
idempotent_result init_vault(context& ctx,
                             const bailment::schema::pubkey_t& mint);

operation_result lock_tokens(context& ctx,
                             const bailment::schema::pubkey_t& mint,
                             bailment::schema::amount_t amount);

/// Agreement releasing `amount` from the signer's vault to `seller` no later
/// than `deadline_unix_ts`. With `create_seller_holding` the seller's holding
/// account is created idempotently in the same transaction.
operation_result init_escrow(context& ctx,
                             const bailment::schema::pubkey_t& mint,
                             const bailment::schema::pubkey_t& seller,
                             bailment::schema::amount_t amount,
                             bailment::schema::unix_timestamp_t deadline_unix_ts,
                             bool create_seller_holding = true);

operation_result release_to_seller(context& ctx,
                                   const bailment::schema::pubkey_t& mint,
                                   const bailment::schema::pubkey_t& seller);

std::optional<bailment::schema::mint_state_t> fetch_mint(
    const context& ctx,
    const bailment::schema::pubkey_t& mint);

std::optional<bailment::schema::vault_state_t> fetch_vault(
    const context& ctx,
    const bailment::schema::pubkey_t& vault);

std::optional<bailment::schema::agreement_state_t> fetch_agreement(
    const context& ctx,
    const bailment::schema::pubkey_t& escrow);

std::optional<bailment::schema::holding_account_state_t> fetch_holding(
    const context& ctx,
    const bailment::schema::pubkey_t& holding);

/// Balance of the canonical holding account of (owner, mint).
std::optional<bailment::schema::amount_t> holding_balance(
    const context& ctx,
    const bailment::schema::pubkey_t& owner,
    const bailment::schema::pubkey_t& mint);

}  // namespace bailment::client
