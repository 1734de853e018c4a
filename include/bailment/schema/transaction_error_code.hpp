#pragma once

#include <bailment/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bailment::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  // Envelope and authorization checks performed by the executor.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  missing_signature = 5,
  signature_verification_failed = 6,
  unknown_program = 7,
  // Instruction decoding.
  instruction_fallback_not_found = 10,
  instruction_did_not_deserialize = 11,
  not_enough_account_keys = 12,
  // Account constraints.
  account_already_in_use = 20,
  account_not_initialized = 21,
  account_owned_by_wrong_program = 22,
  account_discriminator_mismatch = 23,
  account_not_signer = 24,
  account_not_writable = 25,
  constraint_seeds = 26,
  constraint_has_one = 27,
  constraint_associated = 28,
  constraint_raw = 29,
  invalid_program_id = 30,
  // Asset ledger.
  insufficient_funds = 40,
  mint_mismatch = 41,
  owner_mismatch = 42,
  account_frozen = 43,
  fixed_supply = 44,
  arithmetic_overflow = 45,
  invalid_mint = 46,
  // Client side / transport.
  precondition_failed = 60,
  submission_timeout = 61,
  session_unavailable = 62,
  // Vault-escrow program.
  already_released = 6000,
  deadline_passed = 6001,
  // Reserved for a refund path; no instruction returns it.
  too_early = 6002,
  not_buyer = 6003,
  amount_exceeds_vault_balance = 6004,
  deadline_not_in_future = 6005,
  zero_amount = 6006,
  not_vault_authority = 6007,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "ok", transaction_error_code::ok},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "missing_signature", transaction_error_code::missing_signature},
    std::pair<std::string_view, transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "unknown_program", transaction_error_code::unknown_program},
    std::pair<std::string_view, transaction_error_code>{
        "instruction_fallback_not_found",
        transaction_error_code::instruction_fallback_not_found},
    std::pair<std::string_view, transaction_error_code>{
        "instruction_did_not_deserialize",
        transaction_error_code::instruction_did_not_deserialize},
    std::pair<std::string_view, transaction_error_code>{
        "not_enough_account_keys",
        transaction_error_code::not_enough_account_keys},
    std::pair<std::string_view, transaction_error_code>{
        "account_already_in_use",
        transaction_error_code::account_already_in_use},
    std::pair<std::string_view, transaction_error_code>{
        "account_not_initialized",
        transaction_error_code::account_not_initialized},
    std::pair<std::string_view, transaction_error_code>{
        "account_owned_by_wrong_program",
        transaction_error_code::account_owned_by_wrong_program},
    std::pair<std::string_view, transaction_error_code>{
        "account_discriminator_mismatch",
        transaction_error_code::account_discriminator_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "account_not_signer", transaction_error_code::account_not_signer},
    std::pair<std::string_view, transaction_error_code>{
        "account_not_writable", transaction_error_code::account_not_writable},
    std::pair<std::string_view, transaction_error_code>{
        "constraint_seeds", transaction_error_code::constraint_seeds},
    std::pair<std::string_view, transaction_error_code>{
        "constraint_has_one", transaction_error_code::constraint_has_one},
    std::pair<std::string_view, transaction_error_code>{
        "constraint_associated",
        transaction_error_code::constraint_associated},
    std::pair<std::string_view, transaction_error_code>{
        "constraint_raw", transaction_error_code::constraint_raw},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_program_id", transaction_error_code::invalid_program_id},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_funds", transaction_error_code::insufficient_funds},
    std::pair<std::string_view, transaction_error_code>{
        "mint_mismatch", transaction_error_code::mint_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "owner_mismatch", transaction_error_code::owner_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "account_frozen", transaction_error_code::account_frozen},
    std::pair<std::string_view, transaction_error_code>{
        "fixed_supply", transaction_error_code::fixed_supply},
    std::pair<std::string_view, transaction_error_code>{
        "arithmetic_overflow", transaction_error_code::arithmetic_overflow},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_mint", transaction_error_code::invalid_mint},
    std::pair<std::string_view, transaction_error_code>{
        "precondition_failed", transaction_error_code::precondition_failed},
    std::pair<std::string_view, transaction_error_code>{
        "submission_timeout", transaction_error_code::submission_timeout},
    std::pair<std::string_view, transaction_error_code>{
        "session_unavailable", transaction_error_code::session_unavailable},
    std::pair<std::string_view, transaction_error_code>{
        "already_released", transaction_error_code::already_released},
    std::pair<std::string_view, transaction_error_code>{
        "deadline_passed", transaction_error_code::deadline_passed},
    std::pair<std::string_view, transaction_error_code>{
        "too_early", transaction_error_code::too_early},
    std::pair<std::string_view, transaction_error_code>{
        "not_buyer", transaction_error_code::not_buyer},
    std::pair<std::string_view, transaction_error_code>{
        "amount_exceeds_vault_balance",
        transaction_error_code::amount_exceeds_vault_balance},
    std::pair<std::string_view, transaction_error_code>{
        "deadline_not_in_future",
        transaction_error_code::deadline_not_in_future},
    std::pair<std::string_view, transaction_error_code>{
        "zero_amount", transaction_error_code::zero_amount},
    std::pair<std::string_view, transaction_error_code>{
        "not_vault_authority", transaction_error_code::not_vault_authority},
};
static_assert(is_bijective(kTransactionErrorCodeMappings));

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return name_of(value, kTransactionErrorCodeMappings);
}

template <>
inline std::optional<transaction_error_code>
try_from_string<transaction_error_code>(const std::string_view value) {
  return from_string(value, kTransactionErrorCodeMappings);
}

/// How a caller is expected to react to a failure code.
enum class error_category_t : uint8_t {
  none = 0,
  duplicate_initialization = 1,
  precondition_violation = 2,
  authorization = 3,
  transient = 4,
  malformed = 5,
};

inline constexpr error_category_t classify(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::ok:
      return error_category_t::none;
    case transaction_error_code::account_already_in_use:
      return error_category_t::duplicate_initialization;
    case transaction_error_code::missing_signature:
    case transaction_error_code::signature_verification_failed:
    case transaction_error_code::account_not_signer:
    case transaction_error_code::constraint_has_one:
    case transaction_error_code::owner_mismatch:
    case transaction_error_code::not_buyer:
    case transaction_error_code::not_vault_authority:
      return error_category_t::authorization;
    case transaction_error_code::submission_timeout:
    case transaction_error_code::session_unavailable:
      return error_category_t::transient;
    case transaction_error_code::account_not_initialized:
    case transaction_error_code::insufficient_funds:
    case transaction_error_code::account_frozen:
    case transaction_error_code::fixed_supply:
    case transaction_error_code::precondition_failed:
    case transaction_error_code::already_released:
    case transaction_error_code::deadline_passed:
    case transaction_error_code::too_early:
    case transaction_error_code::amount_exceeds_vault_balance:
    case transaction_error_code::deadline_not_in_future:
    case transaction_error_code::zero_amount:
    case transaction_error_code::invalid_nonce:
      return error_category_t::precondition_violation;
    default:
      return error_category_t::malformed;
  }
}

}  // namespace bailment::schema
