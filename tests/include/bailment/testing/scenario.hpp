#pragma once

#include <bailment/client/operations.hpp>
#include <bailment/crypto/keypair.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/testing/execution_fixture.hpp>

#include <gtest/gtest.h>

namespace bailment::testing {

inline constexpr auto kDecimals = uint8_t{6};
inline constexpr auto kInitialSupply = bailment::schema::amount_t{
    1'000'000'000'000};
inline constexpr auto kLockAmount = bailment::schema::amount_t{100'000};
inline constexpr auto kEscrowAmount = bailment::schema::amount_t{50'000};

/// Asset minted to the buyer, a vault with its holding account, and
/// `locked` units moved into custody.
struct funded_vault final {
  bailment::schema::pubkey_t mint{};
  bailment::client::vault_addresses addresses;
};

inline funded_vault make_funded_vault(
    bailment::client::context& ctx,
    const bailment::crypto::keypair& mint,
    const bailment::schema::amount_t locked = kLockAmount) {
  auto created =
      bailment::client::create_asset(ctx, mint, kDecimals, kInitialSupply);
  EXPECT_TRUE(created.ok()) << created.message;
  const auto& mint_key = mint.public_key();
  EXPECT_TRUE(bailment::client::init_vault(ctx, mint_key).ok());
  auto addresses = bailment::client::derive_vault_addresses(ctx, mint_key);
  EXPECT_TRUE(bailment::client::ensure_holding_account(
                  ctx, addresses.vault.address, mint_key)
                  .ok());
  if (locked > 0) {
    auto lock = bailment::client::lock_tokens(ctx, mint_key, locked);
    EXPECT_TRUE(lock.ok()) << lock.message;
  }
  return funded_vault{.mint = mint_key, .addresses = addresses};
}

}  // namespace bailment::testing
