#pragma once
#include <bailment/schema/primitives.hpp>
#include <string_view>

// Schema type: init escrow.
// Escrow workflow: records the terms (seller, amount, deadline) of a release
// from the buyer's vault. No value moves.
namespace bailment::schema {

struct init_escrow_t final {
  static constexpr auto kName = std::string_view{"init_escrow"};

  pubkey_t buyer{};
  pubkey_t seller{};
  pubkey_t mint{};
  pubkey_t vault{};
  pubkey_t escrow{};
  amount_t amount{};
  unix_timestamp_t deadline_unix_ts{};
};

}  // namespace bailment::schema
