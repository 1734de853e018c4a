#pragma once
#include <bailment/schema/primitives.hpp>
#include <string_view>

// Schema type: release to seller.
// Escrow workflow: the buyer's approval moves the locked amount from the
// vault's holding account to the seller's. The seller never signs.
namespace bailment::schema {

struct release_to_seller_t final {
  static constexpr auto kName = std::string_view{"release_to_seller"};

  pubkey_t buyer{};
  pubkey_t seller{};
  pubkey_t mint{};
  pubkey_t escrow{};
  pubkey_t vault{};
  pubkey_t vault_holding{};
  pubkey_t seller_holding{};
};

}  // namespace bailment::schema
