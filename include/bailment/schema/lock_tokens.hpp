#pragma once
#include <bailment/schema/primitives.hpp>
#include <string_view>

// Schema type: lock tokens.
// Custody workflow: moves `amount` from the holder's holding account into the
// vault's holding account.
namespace bailment::schema {

struct lock_tokens_t final {
  static constexpr auto kName = std::string_view{"lock_tokens"};

  pubkey_t holder{};
  pubkey_t mint{};
  pubkey_t vault{};
  pubkey_t vault_holding{};
  pubkey_t holder_holding{};
  amount_t amount{};
};

}  // namespace bailment::schema
