#pragma once

#include <bailment/execution/invoke_context.hpp>
#include <bailment/schema/account.hpp>
#include <bailment/schema/holding_account_state.hpp>
#include <bailment/schema/mint_state.hpp>
#include <bailment/schema/transaction_error_code.hpp>

#include <optional>

// Reference fungible-asset ledger: mints, per-owner holding accounts and
// transfers between them. Records are stored as plain SCALE.
namespace bailment::execution::token_program {

bailment::schema::transaction_error_code process(instruction_context& context);

std::optional<bailment::schema::mint_state_t> decode_mint(
    const bailment::schema::account_t& account);
std::optional<bailment::schema::holding_account_state_t> decode_holding(
    const bailment::schema::account_t& account);

bailment::schema::bytes_t encode_mint(
    const bailment::schema::mint_state_t& mint);
bailment::schema::bytes_t encode_holding(
    const bailment::schema::holding_account_state_t& holding);

}  // namespace bailment::execution::token_program
