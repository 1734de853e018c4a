#pragma once
#include <bailment/schema/instruction.hpp>
#include <bailment/schema/primitives.hpp>
#include <vector>

namespace bailment::schema {

struct signature_entry_t final {
  pubkey_t signer{};
  ed25519_signature_t signature{};
};

/// Atomic unit submitted to the settlement executor. Either every
/// instruction applies or none does.
template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  pubkey_t fee_payer{};
  std::vector<instruction_t> instructions;
  std::vector<signature_entry_t> signatures;
};

using transaction_t = transaction<1>;

}  // namespace bailment::schema
