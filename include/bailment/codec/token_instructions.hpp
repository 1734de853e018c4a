#pragma once
#include <bailment/schema/instruction.hpp>
#include <bailment/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <variant>

// Instruction builders and parsers for the asset ledger (token program) and
// the holding-account program. Layout: one tag byte, then fixed-width
// little-endian fields.
namespace bailment::codec {

enum class token_instruction_tag : uint8_t {
  transfer = 3,
  set_authority = 6,
  mint_to = 7,
  initialize_mint = 20,
};

enum class authority_kind_t : uint8_t { mint_tokens = 0, freeze_account = 1 };

struct initialize_mint_args final {
  uint8_t decimals{};
  bailment::schema::pubkey_t mint_authority{};
  std::optional<bailment::schema::pubkey_t> freeze_authority;
};

struct mint_to_args final {
  bailment::schema::amount_t amount{};
};

struct transfer_args final {
  bailment::schema::amount_t amount{};
};

struct set_authority_args final {
  authority_kind_t kind{authority_kind_t::mint_tokens};
  std::optional<bailment::schema::pubkey_t> new_authority;
};

using token_instruction_t = std::variant<initialize_mint_args,
                                         mint_to_args,
                                         transfer_args,
                                         set_authority_args>;

/// Accounts: mint(signer, writable).
bailment::schema::instruction_t make_initialize_mint(
    const bailment::schema::pubkey_t& mint,
    uint8_t decimals,
    const bailment::schema::pubkey_t& mint_authority,
    const std::optional<bailment::schema::pubkey_t>& freeze_authority);

/// Accounts: mint(writable), destination(writable), authority(signer).
bailment::schema::instruction_t make_mint_to(
    const bailment::schema::pubkey_t& mint,
    const bailment::schema::pubkey_t& destination,
    const bailment::schema::pubkey_t& authority,
    bailment::schema::amount_t amount);

/// Accounts: source(writable), destination(writable), authority(signer).
bailment::schema::instruction_t make_transfer(
    const bailment::schema::pubkey_t& source,
    const bailment::schema::pubkey_t& destination,
    const bailment::schema::pubkey_t& authority,
    bailment::schema::amount_t amount);

/// Accounts: mint(writable), current authority(signer). An empty
/// `new_authority` revokes.
bailment::schema::instruction_t make_set_authority(
    const bailment::schema::pubkey_t& mint,
    const bailment::schema::pubkey_t& current_authority,
    authority_kind_t kind,
    const std::optional<bailment::schema::pubkey_t>& new_authority);

std::optional<token_instruction_t> decode_token_instruction(
    const bailment::schema::bytes_view_t& data);

enum class holding_instruction_tag : uint8_t {
  create = 0,
  create_idempotent = 1,
};

/// Accounts: payer(signer, writable), holding(writable), owner, mint,
/// system program, token program.
bailment::schema::instruction_t make_create_holding_account(
    const bailment::schema::pubkey_t& payer,
    const bailment::schema::pubkey_t& owner,
    const bailment::schema::pubkey_t& mint,
    bool idempotent);

/// Empty data is the legacy form of `create`.
std::optional<holding_instruction_tag> decode_holding_instruction(
    const bailment::schema::bytes_view_t& data);

}  // namespace bailment::codec
