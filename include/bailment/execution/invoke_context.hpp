#pragma once

#include <bailment/address/derive.hpp>
#include <bailment/schema/account.hpp>
#include <bailment/schema/instruction.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction_error_code.hpp>
#include <bailment/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bailment::execution {

using storage_t =
    bailment::storage::storage<bailment::storage::rocksdb_storage_tag>;

inline constexpr std::size_t kMaxInvokeDepth = 4;

/// Account view of one transaction. Reads fall through to storage; writes
/// stay in the overlay until the executor commits them.
class invoke_context final {
 public:
  invoke_context(const storage_t& storage,
                 const bailment::schema::pubkey_t& vault_escrow_program,
                 bailment::schema::unix_timestamp_t now);

  std::optional<bailment::schema::account_t> load(
      const bailment::schema::pubkey_t& key) const;
  void store(const bailment::schema::pubkey_t& key,
             bailment::schema::account_t account);

  /// Account puts for every key written during the transaction.
  std::vector<bailment::storage::key_value_entry_t> writes() const;

  const bailment::schema::pubkey_t& vault_escrow_program() const {
    return vault_escrow_program_;
  }
  bailment::schema::unix_timestamp_t now() const { return now_; }

  std::vector<std::string>& logs() { return logs_; }

 private:
  const storage_t& storage_;
  bailment::schema::pubkey_t vault_escrow_program_{};
  bailment::schema::unix_timestamp_t now_{};
  std::map<bailment::schema::pubkey_t, bailment::schema::account_t> overlay_;
  std::vector<std::string> logs_;
};

/// One program invocation: the instruction, its signer set and the rules on
/// which accounts the running program may touch.
class instruction_context final {
 public:
  instruction_context(invoke_context& accounts,
                      const bailment::schema::instruction_t& instruction,
                      std::set<bailment::schema::pubkey_t> signers,
                      std::size_t depth = 0);

  const bailment::schema::instruction_t& instruction() const {
    return instruction_;
  }
  const bailment::schema::pubkey_t& program_id() const {
    return instruction_.program_id;
  }
  const bailment::schema::pubkey_t& vault_escrow_program() const {
    return accounts_.vault_escrow_program();
  }
  bailment::schema::unix_timestamp_t now() const { return accounts_.now(); }

  /// The key is listed as a signer and its signature was accepted.
  bool is_signer(const bailment::schema::pubkey_t& key) const;
  bool is_writable(const bailment::schema::pubkey_t& key) const;
  bool has_account(const bailment::schema::pubkey_t& key) const;

  /// Read any ledger account, listed or not.
  std::optional<bailment::schema::account_t> load(
      const bailment::schema::pubkey_t& key) const;

  /// Allocate a writable, absent account on behalf of `owner`.
  bailment::schema::transaction_error_code create_account(
      const bailment::schema::pubkey_t& key,
      const bailment::schema::pubkey_t& owner,
      bailment::schema::bytes_t data);

  /// Replace the data of a writable account owned by the running program.
  bailment::schema::transaction_error_code store(
      const bailment::schema::pubkey_t& key,
      bailment::schema::bytes_t data);

  /// Cross-program call with the caller's privileges.
  bailment::schema::transaction_error_code invoke(
      const bailment::schema::instruction_t& inner);

  /// Cross-program call that additionally signs for the program addresses
  /// produced by `signer_seeds` under the running program.
  bailment::schema::transaction_error_code invoke_signed(
      const bailment::schema::instruction_t& inner,
      const std::vector<bailment::address::seeds_t>& signer_seeds);

  void log(std::string message);

 private:
  const bailment::schema::account_meta_t* find_meta(
      const bailment::schema::pubkey_t& key) const;

  invoke_context& accounts_;
  const bailment::schema::instruction_t& instruction_;
  std::set<bailment::schema::pubkey_t> signers_;
  std::size_t depth_{};
};

/// Route an instruction to the program named by its program id.
bailment::schema::transaction_error_code process_instruction(
    instruction_context& context);

}  // namespace bailment::execution
