#pragma once
#include <bailment/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Program-derived addresses: deterministic identities that no private key
// can sign for. Only the owning program can authorize on their behalf, by
// presenting the seeds and bump that produce them.
namespace bailment::address {

inline constexpr std::size_t kMaxSeeds = 16;
inline constexpr std::size_t kMaxSeedLength = 32;
inline constexpr auto kDerivationMarker =
    std::string_view{"ProgramDerivedAddress"};

inline constexpr auto kVaultSeed = std::string_view{"vault"};
inline constexpr auto kEscrowSeed = std::string_view{"escrow"};

using seeds_t = std::vector<bailment::schema::bytes_view_t>;

struct derived_address final {
  bailment::schema::pubkey_t address{};
  uint8_t bump{};
};

/// SHA-256(seeds || program_id || marker). Empty when the seed limits are
/// exceeded or the digest happens to be a valid curve point.
std::optional<bailment::schema::pubkey_t> create_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id);

/// Search bumps 255 down to 0 and return the first off-curve address.
std::optional<derived_address> try_find_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id);

/// As try_find_program_address; exhausting every bump is fatal.
derived_address find_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id);

/// Custody vault of `authority` for `mint`: seeds [tag, mint, authority].
derived_address derive_vault(const bailment::schema::pubkey_t& mint,
                             const bailment::schema::pubkey_t& authority,
                             const bailment::schema::pubkey_t& program_id,
                             std::string_view tag = kVaultSeed);

/// Escrow agreement: seeds [tag, vault, buyer, seller].
derived_address derive_escrow(const bailment::schema::pubkey_t& vault,
                              const bailment::schema::pubkey_t& buyer,
                              const bailment::schema::pubkey_t& seller,
                              const bailment::schema::pubkey_t& program_id,
                              std::string_view tag = kEscrowSeed);

/// Canonical holding account of (owner, mint): seeds
/// [owner, token program, mint] under the holding-account program.
derived_address derive_holding_account(const bailment::schema::pubkey_t& owner,
                                       const bailment::schema::pubkey_t& mint);

}  // namespace bailment::address
