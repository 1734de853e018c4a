#pragma once
#include <bailment/schema/primitives.hpp>
#include <string_view>

// Schema type: init vault.
// Custody workflow: allocates the vault record for (mint, authority). The
// vault's holding account is created separately through the asset ledger.
namespace bailment::schema {

struct init_vault_t final {
  static constexpr auto kName = std::string_view{"init_vault"};

  pubkey_t authority{};
  pubkey_t mint{};
  pubkey_t vault{};
};

}  // namespace bailment::schema
