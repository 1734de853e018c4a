#pragma once
#include <bailment/schema/primitives.hpp>

// Well-known ledger program identities referenced by the escrow protocol.
namespace bailment::schema::program_ids {

/// Account allocator; appears as the trailing entry of every account list.
const pubkey_t& system_program();

/// Fungible-asset ledger (mints, holding accounts, transfers).
const pubkey_t& token_program();

/// Creates canonical per-(asset, owner) holding accounts.
const pubkey_t& holding_account_program();

/// Deployment address of the vault-escrow program unless configured otherwise.
const pubkey_t& default_vault_escrow_program();

}  // namespace bailment::schema::program_ids
