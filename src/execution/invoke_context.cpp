#include <bailment/execution/holding_account_program.hpp>
#include <bailment/execution/invoke_context.hpp>
#include <bailment/execution/token_program.hpp>
#include <bailment/execution/vault_escrow_program.hpp>
#include <bailment/schema/program_ids.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace bailment::schema;

namespace bailment::execution {

invoke_context::invoke_context(const storage_t& storage,
                               const pubkey_t& vault_escrow_program,
                               const unix_timestamp_t now)
    : storage_{storage}, vault_escrow_program_{vault_escrow_program}, now_{now} {}

std::optional<account_t> invoke_context::load(const pubkey_t& key) const {
  if (auto found = overlay_.find(key); found != std::end(overlay_)) {
    return found->second;
  }
  auto raw = storage_.get_raw(
      make_bytes_view(bailment::storage::make_account_key(key)));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = bailment::schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<account_t>(make_bytes_view(*raw));
  if (!decoded) {
    bailment::common::critical("stored account " + to_string(key) +
                               " does not decode");
  }
  return decoded;
}

void invoke_context::store(const pubkey_t& key, account_t account) {
  overlay_.insert_or_assign(key, std::move(account));
}

std::vector<bailment::storage::key_value_entry_t> invoke_context::writes()
    const {
  auto encoder = bailment::schema::encoding::scale_encoder_t{};
  auto out = std::vector<bailment::storage::key_value_entry_t>{};
  out.reserve(overlay_.size());
  for (const auto& [key, account] : overlay_) {
    out.emplace_back(bailment::storage::make_account_key(key),
                     encoder.encode(account));
  }
  return out;
}

instruction_context::instruction_context(invoke_context& accounts,
                                         const instruction_t& instruction,
                                         std::set<pubkey_t> signers,
                                         const std::size_t depth)
    : accounts_{accounts},
      instruction_{instruction},
      signers_{std::move(signers)},
      depth_{depth} {}

const account_meta_t* instruction_context::find_meta(
    const pubkey_t& key) const {
  // A key may be listed more than once; privileges are the union.
  const account_meta_t* best = nullptr;
  for (const auto& meta : instruction_.accounts) {
    if (meta.key != key) {
      continue;
    }
    if (best == nullptr || (meta.is_signer && !best->is_signer) ||
        (meta.is_writable && !best->is_writable)) {
      best = &meta;
    }
  }
  return best;
}

bool instruction_context::is_signer(const pubkey_t& key) const {
  return std::any_of(std::begin(instruction_.accounts),
                     std::end(instruction_.accounts),
                     [&](const account_meta_t& meta) {
                       return meta.key == key && meta.is_signer;
                     }) &&
         signers_.contains(key);
}

bool instruction_context::is_writable(const pubkey_t& key) const {
  return std::any_of(std::begin(instruction_.accounts),
                     std::end(instruction_.accounts),
                     [&](const account_meta_t& meta) {
                       return meta.key == key && meta.is_writable;
                     });
}

bool instruction_context::has_account(const pubkey_t& key) const {
  return find_meta(key) != nullptr;
}

std::optional<account_t> instruction_context::load(const pubkey_t& key) const {
  return accounts_.load(key);
}

transaction_error_code instruction_context::create_account(const pubkey_t& key,
                                                           const pubkey_t& owner,
                                                           bytes_t data) {
  if (!is_writable(key)) {
    return transaction_error_code::account_not_writable;
  }
  if (accounts_.load(key)) {
    return transaction_error_code::account_already_in_use;
  }
  accounts_.store(key, account_t{.owner = owner, .data = std::move(data)});
  return transaction_error_code::ok;
}

transaction_error_code instruction_context::store(const pubkey_t& key,
                                                  bytes_t data) {
  if (!is_writable(key)) {
    return transaction_error_code::account_not_writable;
  }
  auto existing = accounts_.load(key);
  if (!existing) {
    return transaction_error_code::account_not_initialized;
  }
  if (existing->owner != program_id()) {
    return transaction_error_code::account_owned_by_wrong_program;
  }
  existing->data = std::move(data);
  accounts_.store(key, std::move(*existing));
  return transaction_error_code::ok;
}

transaction_error_code instruction_context::invoke(const instruction_t& inner) {
  return invoke_signed(inner, {});
}

transaction_error_code instruction_context::invoke_signed(
    const instruction_t& inner,
    const std::vector<bailment::address::seeds_t>& signer_seeds) {
  if (depth_ + 1 >= kMaxInvokeDepth) {
    return transaction_error_code::invalid_transaction;
  }
  if (!has_account(inner.program_id)) {
    return transaction_error_code::invalid_program_id;
  }

  auto signers = std::set<pubkey_t>{};
  for (const auto& meta : instruction_.accounts) {
    if (is_signer(meta.key)) {
      signers.insert(meta.key);
    }
  }
  for (const auto& seeds : signer_seeds) {
    auto address =
        bailment::address::create_program_address(seeds, program_id());
    if (!address) {
      return transaction_error_code::constraint_seeds;
    }
    signers.insert(*address);
  }

  // Callees never gain privileges the caller did not hold.
  for (const auto& meta : inner.accounts) {
    const auto* outer = find_meta(meta.key);
    if (outer == nullptr) {
      return transaction_error_code::not_enough_account_keys;
    }
    if (meta.is_writable && !outer->is_writable) {
      return transaction_error_code::account_not_writable;
    }
    if (meta.is_signer && !signers.contains(meta.key)) {
      return transaction_error_code::account_not_signer;
    }
  }

  auto callee = instruction_context{accounts_, inner, std::move(signers),
                                    depth_ + 1};
  return process_instruction(callee);
}

void instruction_context::log(std::string message) {
  spdlog::debug("program {}: {}", to_string(program_id()), message);
  accounts_.logs().push_back(std::move(message));
}

transaction_error_code process_instruction(instruction_context& context) {
  const auto& program = context.program_id();
  if (program == program_ids::token_program()) {
    return token_program::process(context);
  }
  if (program == program_ids::holding_account_program()) {
    return holding_account_program::process(context);
  }
  if (program == context.vault_escrow_program()) {
    return vault_escrow_program::process(context);
  }
  return transaction_error_code::unknown_program;
}

}  // namespace bailment::execution
