#pragma once
#include <bailment/schema/primitives.hpp>

// Schema type: vault state.
// Custody record stored at the vault's derived address. Field order is the
// on-ledger layout after the account discriminator.
namespace bailment::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  pubkey_t authority{};
  pubkey_t mint{};
  uint8_t bump{};
};

using vault_state_t = vault_state<1>;

}  // namespace bailment::schema
