#include <spdlog/spdlog.h>
#include <bailment/address/derive.hpp>
#include <bailment/client/operations.hpp>
#include <bailment/client/setup_cache.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

using namespace bailment::schema;

namespace bailment::client {

namespace {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

bool discard(const std::string_view path, const std::string_view reason) {
  spdlog::warn("Discarding setup cache '{}': {}", path, reason);
  return false;
}

bool matches_context(const std::string_view path,
                     const setup_record_t& record,
                     const context& ctx) {
  if (record.program_id != ctx.program_id) {
    return discard(path, "recorded for a different program");
  }
  if (record.payer != ctx.payer()) {
    return discard(path, "recorded for a different payer");
  }
  auto payer_holding =
      bailment::address::derive_holding_account(ctx.payer(), record.mint);
  if (record.payer_holding != payer_holding.address) {
    return discard(path, "payer holding account does not match derivation");
  }
  auto mint = fetch_mint(ctx, record.mint);
  if (!mint || mint->decimals != record.decimals) {
    return discard(path, "asset is unknown to the ledger");
  }
  if (!record.vault) {
    return true;
  }
  auto addresses = derive_vault_addresses(ctx, record.mint);
  if (*record.vault != addresses.vault.address ||
      record.vault_bump != addresses.vault.bump ||
      record.vault_holding != addresses.vault_holding) {
    return discard(path, "vault does not match derivation");
  }
  return true;
}

}  // namespace

setup_record_t make_setup_record(const context& ctx,
                                 const pubkey_t& mint,
                                 const uint8_t decimals) {
  return setup_record_t{
      .program_id = ctx.program_id,
      .mint = mint,
      .decimals = decimals,
      .payer = ctx.payer(),
      .payer_holding =
          bailment::address::derive_holding_account(ctx.payer(), mint).address};
}

void record_vault(const context& ctx, setup_record_t& record) {
  auto addresses = derive_vault_addresses(ctx, record.mint);
  record.vault = addresses.vault.address;
  record.vault_bump = addresses.vault.bump;
  record.vault_holding = addresses.vault_holding;
}

bool save_setup(const std::string_view path, const setup_record_t& record) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(record);

  auto target = std::filesystem::path{path};
  auto temporary = target;
  temporary += ".tmp";
  {
    auto out = std::ofstream{temporary, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      spdlog::error("Failed to write setup cache '{}'", temporary.string());
      return false;
    }
  }
  auto error = std::error_code{};
  std::filesystem::rename(temporary, target, error);
  if (error) {
    spdlog::error("Failed to move setup cache into '{}': {}", target.string(),
                  error.message());
    return false;
  }
  spdlog::debug("Setup cache written to '{}'", target.string());
  return true;
}

std::optional<setup_record_t> load_setup(const std::string_view path) {
  auto in = std::ifstream{std::string{path}, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{in},
                       std::istreambuf_iterator<char>{}};
  auto encoder = encoder_t{};
  auto record =
      encoder.try_decode<setup_record_t>(bytes_view_t{bytes.data(),
                                                      bytes.size()});
  if (!record || record->version != 1) {
    discard(path, "unreadable record");
    return std::nullopt;
  }
  return record;
}

std::optional<setup_record_t> load_validated_setup(const std::string_view path,
                                                   const context& ctx) {
  auto record = load_setup(path);
  if (!record || !matches_context(path, *record, ctx)) {
    return std::nullopt;
  }
  return record;
}

}  // namespace bailment::client
