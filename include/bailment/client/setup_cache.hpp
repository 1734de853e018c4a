#pragma once

#include <bailment/client/context.hpp>
#include <bailment/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace bailment::client {

/// What a completed setup run produced. A convenience for later runs, never
/// authoritative: the ledger and fresh derivations win on any mismatch.
template <uint16_t Version>
struct setup_record;

template <>
struct setup_record<1> final {
  uint16_t version{1};
  bailment::schema::pubkey_t program_id{};
  bailment::schema::pubkey_t mint{};
  uint8_t decimals{};
  bailment::schema::pubkey_t payer{};
  bailment::schema::pubkey_t payer_holding{};
  std::optional<bailment::schema::pubkey_t> vault;
  std::optional<uint8_t> vault_bump;
  std::optional<bailment::schema::pubkey_t> vault_holding;
};

using setup_record_t = setup_record<1>;

/// Record for a freshly created asset, before any vault exists.
setup_record_t make_setup_record(const context& ctx,
                                 const bailment::schema::pubkey_t& mint,
                                 uint8_t decimals);

/// Fill in the vault fields from a fresh derivation.
void record_vault(const context& ctx, setup_record_t& record);

/// Write the record atomically (temp file then rename).
bool save_setup(std::string_view path, const setup_record_t& record);

/// Read the record as stored. Empty when missing or unreadable.
std::optional<setup_record_t> load_setup(std::string_view path);

/// Read the record and keep it only if it matches the context's program and
/// signer, fresh derivations and the ledger's view of the asset.
std::optional<setup_record_t> load_validated_setup(std::string_view path,
                                                   const context& ctx);

}  // namespace bailment::client
