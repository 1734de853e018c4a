#include <bailment/address/derive.hpp>
#include <bailment/common/critical.hpp>
#include <bailment/crypto/curve25519.hpp>
#include <bailment/crypto/sha256.hpp>
#include <bailment/schema/program_ids.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace bailment::address {

namespace {

using bailment::schema::make_bytes_view;

bool seeds_within_limits(const seeds_t& seeds) {
  if (seeds.size() > kMaxSeeds) {
    return false;
  }
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<bailment::schema::pubkey_t> create_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id) {
  if (!seeds_within_limits(seeds)) {
    return std::nullopt;
  }
  auto hasher = bailment::crypto::sha256_hasher{};
  for (const auto& seed : seeds) {
    hasher.update(seed);
  }
  hasher.update(make_bytes_view(program_id));
  hasher.update(kDerivationMarker);
  auto address = hasher.finalize();
  if (bailment::crypto::is_on_curve(address)) {
    return std::nullopt;
  }
  return address;
}

std::optional<derived_address> try_find_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id) {
  // The bump occupies one seed slot.
  if (seeds.size() >= kMaxSeeds || !seeds_within_limits(seeds)) {
    return std::nullopt;
  }
  auto with_bump = seeds;
  auto bump = std::array<uint8_t, 1>{};
  with_bump.push_back(bailment::schema::bytes_view_t{bump});
  for (auto candidate = 255; candidate >= 0; --candidate) {
    bump[0] = static_cast<uint8_t>(candidate);
    if (auto address = create_program_address(with_bump, program_id)) {
      return derived_address{.address = *address, .bump = bump[0]};
    }
  }
  return std::nullopt;
}

derived_address find_program_address(
    const seeds_t& seeds,
    const bailment::schema::pubkey_t& program_id) {
  auto found = try_find_program_address(seeds, program_id);
  if (!found) {
    bailment::common::critical(
        "unable to find a viable program address bump for program " +
        bailment::schema::to_string(program_id));
  }
  return *found;
}

derived_address derive_vault(const bailment::schema::pubkey_t& mint,
                             const bailment::schema::pubkey_t& authority,
                             const bailment::schema::pubkey_t& program_id,
                             const std::string_view tag) {
  auto derived = find_program_address(
      {make_bytes_view(tag), make_bytes_view(mint), make_bytes_view(authority)},
      program_id);
  spdlog::debug("Derived vault {} (bump {}) for authority {}",
                bailment::schema::to_string(derived.address), derived.bump,
                bailment::schema::to_string(authority));
  return derived;
}

derived_address derive_escrow(const bailment::schema::pubkey_t& vault,
                              const bailment::schema::pubkey_t& buyer,
                              const bailment::schema::pubkey_t& seller,
                              const bailment::schema::pubkey_t& program_id,
                              const std::string_view tag) {
  auto derived = find_program_address(
      {make_bytes_view(tag), make_bytes_view(vault), make_bytes_view(buyer),
       make_bytes_view(seller)},
      program_id);
  spdlog::debug("Derived escrow {} (bump {}) for seller {}",
                bailment::schema::to_string(derived.address), derived.bump,
                bailment::schema::to_string(seller));
  return derived;
}

derived_address derive_holding_account(
    const bailment::schema::pubkey_t& owner,
    const bailment::schema::pubkey_t& mint) {
  return find_program_address(
      {make_bytes_view(owner),
       make_bytes_view(bailment::schema::program_ids::token_program()),
       make_bytes_view(mint)},
      bailment::schema::program_ids::holding_account_program());
}

}  // namespace bailment::address
