#pragma once

#include <bailment/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bailment::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

/// Ed25519 signing identity.
///
/// Persisted in the 64-entry JSON byte array form used by ledger wallets
/// (`[seed..., public_key...]`).
class keypair final {
 public:
  /// Fresh key from the OpenSSL random source.
  static keypair generate();
  static std::optional<keypair> from_seed(const ed25519_seed_t& seed);

  static std::optional<keypair> load(std::string_view path);
  bool save(std::string_view path) const;

  const bailment::schema::pubkey_t& public_key() const { return public_key_; }
  const ed25519_seed_t& seed() const { return seed_; }

  bailment::schema::ed25519_signature_t sign(
      const bailment::schema::bytes_view_t& message) const;

 private:
  keypair(const ed25519_seed_t& seed, const bailment::schema::pubkey_t& key)
      : seed_{seed}, public_key_{key} {}

  ed25519_seed_t seed_{};
  bailment::schema::pubkey_t public_key_{};
};

}  // namespace bailment::crypto
