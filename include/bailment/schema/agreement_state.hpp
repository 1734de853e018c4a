#pragma once
#include <bailment/schema/agreement_status.hpp>
#include <bailment/schema/primitives.hpp>

// Schema type: agreement state.
// Escrow record stored at the agreement's derived address. Amount and
// deadline are bound at creation; only `status` changes afterwards.
namespace bailment::schema {

template <uint16_t Version>
struct agreement_state;

template <>
struct agreement_state<1> final {
  pubkey_t vault{};
  pubkey_t buyer{};
  pubkey_t seller{};
  pubkey_t mint{};
  amount_t amount_locked{};
  unix_timestamp_t deadline_unix_ts{};
  agreement_status_t status{agreement_status_t::active};
  uint8_t bump{};
};

using agreement_state_t = agreement_state<1>;

}  // namespace bailment::schema
