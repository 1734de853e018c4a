#pragma once
#include <bailment/schema/account.hpp>
#include <bailment/schema/instruction.hpp>
#include <bailment/schema/operation.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction_error_code.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace bailment::codec {

/// Selector followed by the operation's fixed-width little-endian arguments.
bailment::schema::bytes_t encode_data(
    const bailment::schema::operation_t& operation);

/// Positional account list of the operation. The order is part of the
/// protocol.
std::vector<bailment::schema::account_meta_t> account_metas(
    const bailment::schema::operation_t& operation);

bailment::schema::instruction_t encode(
    const bailment::schema::pubkey_t& program_id,
    const bailment::schema::operation_t& operation);

/// Number of positional accounts the named operation requires.
std::optional<std::size_t> required_accounts(std::string_view operation_name);

/// Inverse of encode. On failure `error` holds
/// `instruction_fallback_not_found` (unknown selector),
/// `instruction_did_not_deserialize` (argument bytes of the wrong length) or
/// `not_enough_account_keys`.
std::optional<bailment::schema::operation_t> decode(
    const bailment::schema::instruction_t& instruction,
    bailment::schema::transaction_error_code& error);

}  // namespace bailment::codec
