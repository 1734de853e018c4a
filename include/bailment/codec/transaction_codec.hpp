#pragma once
#include <bailment/crypto/keypair.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bailment::codec {

bailment::schema::bytes_t encode_transaction(
    const bailment::schema::transaction_t& tx);

/// Empty on malformed input; `error` then carries the reason.
std::optional<bailment::schema::transaction_t> decode_transaction(
    const bailment::schema::bytes_view_t& raw_tx,
    std::string& error);

/// Bytes covered by every signature: the envelope with no signatures.
bailment::schema::bytes_t signing_payload(
    const bailment::schema::transaction_t& tx);

/// Identity of a transaction's content, independent of its signatures. The
/// executor keeps a receipt under this id for every committed transaction.
bailment::schema::hash32_t transaction_id(
    const bailment::schema::transaction_t& tx);

/// Replace the signature list with one signature per key pair.
void sign_transaction(
    bailment::schema::transaction_t& tx,
    const std::vector<std::reference_wrapper<const bailment::crypto::keypair>>&
        signers);

}  // namespace bailment::codec
