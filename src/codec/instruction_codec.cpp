#include <bailment/codec/instruction_codec.hpp>
#include <bailment/codec/little_endian.hpp>
#include <bailment/codec/selector.hpp>
#include <bailment/schema/program_ids.hpp>

#include <algorithm>
#include <iterator>

using namespace bailment::schema;

namespace bailment::codec {

namespace {

constexpr std::size_t kInitVaultAccounts = 4;
constexpr std::size_t kLockTokensAccounts = 8;
constexpr std::size_t kInitEscrowAccounts = 6;
constexpr std::size_t kReleaseToSellerAccounts = 10;

template <typename Operation>
bytes_t make_payload() {
  auto selector = make_selector(Operation::kName);
  return bytes_t{std::begin(selector), std::end(selector)};
}

}  // namespace

bytes_t encode_data(const operation_t& operation) {
  return std::visit(
      overloaded{
          [](const init_vault_t&) { return make_payload<init_vault_t>(); },
          [](const lock_tokens_t& value) {
            auto data = make_payload<lock_tokens_t>();
            append_le(data, value.amount);
            return data;
          },
          [](const init_escrow_t& value) {
            auto data = make_payload<init_escrow_t>();
            append_le(data, value.amount);
            append_le(data, value.deadline_unix_ts);
            return data;
          },
          [](const release_to_seller_t&) {
            return make_payload<release_to_seller_t>();
          }},
      operation);
}

std::vector<account_meta_t> account_metas(const operation_t& operation) {
  const auto& system = program_ids::system_program();
  const auto& token = program_ids::token_program();
  const auto& holding = program_ids::holding_account_program();
  return std::visit(
      overloaded{
          [&](const init_vault_t& value) {
            return std::vector<account_meta_t>{
                make_signer_meta(value.authority),
                make_readonly_meta(value.mint),
                make_writable_meta(value.vault), make_readonly_meta(system)};
          },
          [&](const lock_tokens_t& value) {
            return std::vector<account_meta_t>{
                make_signer_meta(value.holder),
                make_readonly_meta(value.mint),
                make_readonly_meta(value.vault),
                make_writable_meta(value.vault_holding),
                make_writable_meta(value.holder_holding),
                make_readonly_meta(token),
                make_readonly_meta(holding),
                make_readonly_meta(system)};
          },
          [&](const init_escrow_t& value) {
            return std::vector<account_meta_t>{
                make_signer_meta(value.buyer),
                make_readonly_meta(value.seller),
                make_readonly_meta(value.mint),
                make_readonly_meta(value.vault),
                make_writable_meta(value.escrow),
                make_readonly_meta(system)};
          },
          [&](const release_to_seller_t& value) {
            return std::vector<account_meta_t>{
                make_signer_meta(value.buyer),
                make_writable_meta(value.seller),
                make_readonly_meta(value.mint),
                make_writable_meta(value.escrow),
                make_readonly_meta(value.vault),
                make_writable_meta(value.vault_holding),
                make_writable_meta(value.seller_holding),
                make_readonly_meta(token),
                make_readonly_meta(holding),
                make_readonly_meta(system)};
          }},
      operation);
}

instruction_t encode(const pubkey_t& program_id, const operation_t& operation) {
  return instruction_t{.program_id = program_id,
                       .accounts = account_metas(operation),
                       .data = encode_data(operation)};
}

std::optional<std::size_t> required_accounts(
    const std::string_view operation_name) {
  if (operation_name == init_vault_t::kName) {
    return kInitVaultAccounts;
  }
  if (operation_name == lock_tokens_t::kName) {
    return kLockTokensAccounts;
  }
  if (operation_name == init_escrow_t::kName) {
    return kInitEscrowAccounts;
  }
  if (operation_name == release_to_seller_t::kName) {
    return kReleaseToSellerAccounts;
  }
  return std::nullopt;
}

std::optional<operation_t> decode(const instruction_t& instruction,
                                  transaction_error_code& error) {
  if (instruction.data.size() < kSelectorSize) {
    error = transaction_error_code::instruction_fallback_not_found;
    return std::nullopt;
  }
  auto selector = selector_t{};
  std::copy_n(std::begin(instruction.data), selector.size(),
              std::begin(selector));
  auto name = operation_for_selector(selector);
  if (!name) {
    error = transaction_error_code::instruction_fallback_not_found;
    return std::nullopt;
  }

  const auto& accounts = instruction.accounts;
  if (accounts.size() < required_accounts(*name).value_or(0)) {
    error = transaction_error_code::not_enough_account_keys;
    return std::nullopt;
  }

  auto reader = le_reader{bytes_view_t{instruction.data}.subspan(kSelectorSize)};
  auto decoded = std::optional<operation_t>{};
  if (*name == init_vault_t::kName) {
    decoded = init_vault_t{.authority = accounts[0].key,
                           .mint = accounts[1].key,
                           .vault = accounts[2].key};
  } else if (*name == lock_tokens_t::kName) {
    auto amount = reader.read<uint64_t>();
    if (amount) {
      decoded = lock_tokens_t{.holder = accounts[0].key,
                              .mint = accounts[1].key,
                              .vault = accounts[2].key,
                              .vault_holding = accounts[3].key,
                              .holder_holding = accounts[4].key,
                              .amount = *amount};
    }
  } else if (*name == init_escrow_t::kName) {
    auto amount = reader.read<uint64_t>();
    auto deadline = reader.read<int64_t>();
    if (amount && deadline) {
      decoded = init_escrow_t{.buyer = accounts[0].key,
                              .seller = accounts[1].key,
                              .mint = accounts[2].key,
                              .vault = accounts[3].key,
                              .escrow = accounts[4].key,
                              .amount = *amount,
                              .deadline_unix_ts = *deadline};
    }
  } else if (*name == release_to_seller_t::kName) {
    decoded = release_to_seller_t{.buyer = accounts[0].key,
                                  .seller = accounts[1].key,
                                  .mint = accounts[2].key,
                                  .escrow = accounts[3].key,
                                  .vault = accounts[4].key,
                                  .vault_holding = accounts[5].key,
                                  .seller_holding = accounts[6].key};
  }

  if (!decoded || !reader.finished()) {
    error = transaction_error_code::instruction_did_not_deserialize;
    return std::nullopt;
  }
  error = transaction_error_code::ok;
  return decoded;
}

}  // namespace bailment::codec
