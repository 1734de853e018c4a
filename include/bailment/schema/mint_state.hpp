#pragma once
#include <bailment/schema/primitives.hpp>
#include <optional>

// Schema type: mint state.
// Fungible asset descriptor kept by the asset ledger. `decimals` is fixed at
// creation; a revoked authority is represented by std::nullopt.
namespace bailment::schema {

/// Largest `decimals` whose scale, 10^decimals, fits in amount_t.
inline constexpr auto kMaxDecimals = uint8_t{19};

template <uint16_t Version>
struct mint_state;

template <>
struct mint_state<1> final {
  std::optional<pubkey_t> mint_authority;
  amount_t supply{};
  uint8_t decimals{};
  bool is_initialized{};
  std::optional<pubkey_t> freeze_authority;
};

using mint_state_t = mint_state<1>;

}  // namespace bailment::schema
