#pragma once

#include <bailment/execution/invoke_context.hpp>
#include <bailment/execution/signature_verifier.hpp>
#include <bailment/schema/account.hpp>
#include <bailment/schema/app_info.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/program_ids.hpp>
#include <bailment/schema/query_result.hpp>
#include <bailment/schema/transaction.hpp>
#include <bailment/schema/transaction_error_code.hpp>
#include <bailment/schema/transaction_result.hpp>
#include <bailment/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bailment::execution {

/// Reference settlement executor.
///
/// Accepts signed transactions, checks envelope, nonce and co-signers,
/// dispatches every instruction to its program and commits the resulting
/// account writes, the advanced nonce and the new state root in one storage
/// batch. A failing instruction discards the whole transaction.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  ///
  /// `require_strict_crypto` enables Ed25519 verification of every signature
  /// entry; when false only the presence of an entry per signer is checked.
  /// `chain_id` is used when the store holds no committed state yet.
  explicit engine(
      bailment::schema::encoding::encoder<
          bailment::schema::encoding::scale_encoder_tag>& encoder,
      storage_t& storage,
      const bailment::schema::pubkey_t& program_id =
          bailment::schema::program_ids::default_vault_escrow_program(),
      bool require_strict_crypto = true,
      std::optional<bailment::schema::hash32_t> chain_id = std::nullopt);

  /// Decode and validate without executing or mutating state.
  bailment::schema::transaction_result_t check_transaction(
      const bailment::schema::bytes_view_t& raw_tx);

  /// Validate, execute and commit one transaction atomically.
  bailment::schema::transaction_result_t process_transaction(
      const bailment::schema::bytes_view_t& raw_tx);

  /// Return application metadata (committed height, state root, chain id).
  bailment::schema::app_info_t info() const;

  /// Read-path query by route: `/account`, `/nonce`, `/transaction` or
  /// `/engine/info`.
  bailment::schema::query_result_t query(
      std::string_view path,
      const bailment::schema::bytes_view_t& data) const;

  std::optional<bailment::schema::account_t> get_account(
      const bailment::schema::pubkey_t& key) const;

  /// Every committed account, ordered by address.
  std::vector<std::pair<bailment::schema::pubkey_t, bailment::schema::account_t>>
  list_accounts() const;

  /// Height at which the transaction with `id` was committed, if it was.
  std::optional<int64_t> transaction_height(
      const bailment::schema::hash32_t& id) const;

  /// Nonce the next transaction paid by `payer` must carry.
  uint64_t next_nonce(const bailment::schema::pubkey_t& payer) const;

  bailment::schema::hash32_t chain_id() const;
  const bailment::schema::pubkey_t& program_id() const { return program_id_; }

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install the clock programs observe as "now".
  void set_clock(unix_clock_t clock);
  bailment::schema::unix_timestamp_t now() const;

 private:
  /// Validate envelope, nonce and signatures. On success `signers` holds
  /// every key whose signature was accepted.
  bailment::schema::transaction_result_t validate_transaction(
      const bailment::schema::transaction_t& tx,
      std::string_view codespace,
      std::set<bailment::schema::pubkey_t>& signers) const;

  /// Run every instruction against a fresh overlay and commit on success.
  bailment::schema::transaction_result_t execute_transaction(
      const bailment::schema::transaction_t& tx,
      const bailment::schema::bytes_view_t& raw_tx,
      const std::set<bailment::schema::pubkey_t>& signers);

  uint64_t stored_nonce(const bailment::schema::pubkey_t& payer) const;
  std::optional<int64_t> stored_receipt(
      const bailment::schema::hash32_t& id) const;

  /// Load committed state from storage at startup.
  void load_persisted_state(
      const std::optional<bailment::schema::hash32_t>& chain_id);

  mutable std::mutex mutex_;
  bailment::schema::encoding::encoder<
      bailment::schema::encoding::scale_encoder_tag>& encoder_;
  storage_t& storage_;
  bailment::schema::pubkey_t program_id_{};
  int64_t last_committed_height_{};
  bailment::schema::hash32_t last_committed_state_root_{};
  bailment::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  unix_clock_t clock_;
};

/// Chain id derived from a human readable network name.
bailment::schema::hash32_t make_chain_id(std::string_view name);

}  // namespace bailment::execution
