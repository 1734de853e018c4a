#include <spdlog/spdlog.h>
#include <bailment/blake3/hash.hpp>
#include <bailment/codec/transaction_codec.hpp>
#include <bailment/common/critical.hpp>
#include <bailment/crypto/curve25519.hpp>
#include <bailment/crypto/verify.hpp>
#include <bailment/execution/engine.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <tuple>
#include <utility>

using namespace bailment::schema;

namespace {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

constexpr auto kCheckCodespace = std::string_view{"bailment.check"};
constexpr auto kProcessCodespace = std::string_view{"bailment.process"};
constexpr auto kQueryCodespace = std::string_view{"bailment.query"};
constexpr auto kDefaultChainName = std::string_view{"bailment-local"};

bailment::schema::hash32_t fold_state_root(
    const bailment::schema::hash32_t& seed,
    const bailment::schema::bytes_view_t& tx,
    int64_t height) {
  auto encoder = encoder_t{};
  auto encoded_height = encoder.encode(height);
  return bailment::blake3::hash(
      {bailment::schema::make_bytes_view(seed), tx,
       bailment::schema::make_bytes_view(encoded_height)});
}

transaction_result_t make_error(const transaction_error_code code,
                                std::string log,
                                std::string info,
                                const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

std::optional<pubkey_t> read_key(const bytes_view_t& data) {
  if (data.size() != sizeof(pubkey_t)) {
    return std::nullopt;
  }
  auto key = pubkey_t{};
  std::copy(std::begin(data), std::end(data), std::begin(key));
  return key;
}

unix_timestamp_t system_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

namespace bailment::execution {

hash32_t make_chain_id(const std::string_view name) {
  return bailment::blake3::hash(name);
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const pubkey_t& program_id,
               const bool require_strict_crypto,
               std::optional<hash32_t> chain_id)
    : encoder_{encoder},
      storage_{storage},
      program_id_{program_id},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{bailment::crypto::verify_signature},
      clock_{system_now} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for program {}",
               to_string(program_id_));
  if (require_strict_crypto_ && !bailment::crypto::available()) {
    bailment::common::critical(
        "strict crypto requested but OpenSSL lacks Ed25519");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  load_persisted_state(chain_id);
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

void engine::load_persisted_state(const std::optional<hash32_t>& chain_id) {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    chain_id_ = committed->chain_id;
    if (chain_id && *chain_id != chain_id_) {
      spdlog::warn("Ignoring configured chain id; store belongs to chain {}",
                   to_hex(chain_id_));
    }
    return;
  }
  chain_id_ = chain_id.value_or(make_chain_id(kDefaultChainName));
  storage_.save_committed_state(
      bailment::storage::committed_state{.height = last_committed_height_,
                                         .state_root =
                                             last_committed_state_root_,
                                         .chain_id = chain_id_});
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = bailment::codec::decode_transaction(raw_tx, decode_error);
  if (!tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", decode_error, kCheckCodespace);
  }
  auto signers = std::set<pubkey_t>{};
  return validate_transaction(*tx, kCheckCodespace, signers);
}

transaction_result_t engine::process_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = bailment::codec::decode_transaction(raw_tx, decode_error);
  if (!tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", decode_error, kProcessCodespace);
  }
  auto signers = std::set<pubkey_t>{};
  auto validated = validate_transaction(*tx, kProcessCodespace, signers);
  if (validated.code != 0) {
    spdlog::warn("Rejected transaction from {}: {}", to_string(tx->fee_payer),
                 validated.log);
    return validated;
  }
  return execute_transaction(*tx, raw_tx, signers);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace,
    std::set<pubkey_t>& signers) const {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "unsupported transaction version", "expected version 1",
                      codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "invalid chain id", "transaction targets another chain",
                      codespace);
  }
  if (tx.instructions.empty()) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", "no instructions", codespace);
  }
  auto expected_nonce = stored_nonce(tx.fee_payer);
  if (tx.nonce != expected_nonce) {
    return make_error(transaction_error_code::invalid_nonce, "invalid nonce",
                      "expected nonce " + std::to_string(expected_nonce),
                      codespace);
  }

  auto payload = bailment::codec::signing_payload(tx);
  for (const auto& entry : tx.signatures) {
    if (require_strict_crypto_) {
      // A program address has no private key behind it.
      if (!bailment::crypto::is_on_curve(entry.signer) ||
          !signature_verifier_(payload, entry.signer, entry.signature)) {
        return make_error(
            transaction_error_code::signature_verification_failed,
            "signature verification failed", to_string(entry.signer),
            codespace);
      }
    }
    signers.insert(entry.signer);
  }

  if (!signers.contains(tx.fee_payer)) {
    return make_error(transaction_error_code::missing_signature,
                      "missing signature", to_string(tx.fee_payer), codespace);
  }
  for (const auto& instruction : tx.instructions) {
    for (const auto& meta : instruction.accounts) {
      if (meta.is_signer && !signers.contains(meta.key)) {
        return make_error(transaction_error_code::missing_signature,
                          "missing signature", to_string(meta.key), codespace);
      }
    }
  }

  auto result = transaction_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t engine::execute_transaction(
    const transaction_t& tx,
    const bytes_view_t& raw_tx,
    const std::set<pubkey_t>& signers) {
  auto accounts = invoke_context{storage_, program_id_, clock_()};
  for (std::size_t i = 0; i < tx.instructions.size(); ++i) {
    auto context = instruction_context{accounts, tx.instructions[i], signers};
    auto code = process_instruction(context);
    if (code != transaction_error_code::ok) {
      auto result = make_error(
          code, std::string{to_string(code)},
          "instruction " + std::to_string(i) + " of program " +
              to_string(tx.instructions[i].program_id) + " failed",
          kProcessCodespace);
      result.program_logs = std::move(accounts.logs());
      spdlog::warn("Transaction from {} failed at instruction {}: {}",
                   to_string(tx.fee_payer), i, result.log);
      return result;
    }
  }

  auto height = last_committed_height_ + 1;
  auto state_root = fold_state_root(last_committed_state_root_, raw_tx, height);
  auto writes = bailment::storage::write_set{};
  writes.puts = accounts.writes();
  writes.puts.emplace_back(bailment::storage::make_nonce_key(tx.fee_payer),
                           encoder_.encode(tx.nonce + 1));
  writes.puts.emplace_back(
      bailment::storage::make_receipt_key(bailment::codec::transaction_id(tx)),
      encoder_.encode(height));
  writes.checkpoint =
      bailment::storage::committed_state{.height = height,
                                         .state_root = state_root,
                                         .chain_id = chain_id_};
  storage_.apply(writes);
  last_committed_height_ = height;
  last_committed_state_root_ = state_root;

  spdlog::info("Committed transaction from {} at height {} ({} instruction(s))",
               to_string(tx.fee_payer), height, tx.instructions.size());
  auto result = transaction_result_t{};
  result.codespace = std::string{kProcessCodespace};
  result.state_root = state_root;
  result.program_logs = std::move(accounts.logs());
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.program_id = program_id_;
  result.strict_crypto = require_strict_crypto_;
  result.last_height = last_committed_height_;
  result.last_state_root = last_committed_state_root_;
  result.chain_id = chain_id_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.path = std::string{path};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }
  if (path == "/transaction") {
    auto id = read_key(data);
    if (!id) {
      result.code =
          static_cast<uint32_t>(transaction_error_code::invalid_transaction);
      result.log = "query data must be a 32-byte transaction id";
      return result;
    }
    auto committed_at = stored_receipt(*id);
    if (!committed_at) {
      result.code =
          static_cast<uint32_t>(transaction_error_code::invalid_transaction);
      result.log = "transaction not committed";
      return result;
    }
    result.value = encoder_.encode(*committed_at);
    return result;
  }
  if (path == "/account" || path == "/nonce") {
    auto key = read_key(data);
    if (!key) {
      result.code =
          static_cast<uint32_t>(transaction_error_code::invalid_transaction);
      result.log = "query data must be a 32-byte key";
      return result;
    }
    if (path == "/nonce") {
      result.value = encoder_.encode(stored_nonce(*key));
      return result;
    }
    auto raw = storage_.get_raw(
        make_bytes_view(bailment::storage::make_account_key(*key)));
    if (!raw) {
      result.code = static_cast<uint32_t>(
          transaction_error_code::account_not_initialized);
      result.log = "account not found";
      return result;
    }
    result.value = std::move(*raw);
    return result;
  }

  result.code =
      static_cast<uint32_t>(transaction_error_code::invalid_transaction);
  result.log = "unsupported query path";
  return result;
}

std::optional<account_t> engine::get_account(const pubkey_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<encoder_t, account_t>(
      encoder_, make_bytes_view(bailment::storage::make_account_key(key)));
}

std::vector<std::pair<pubkey_t, account_t>> engine::list_accounts() const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = make_bytes(bailment::storage::kAccountPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));

  auto accounts = std::vector<std::pair<pubkey_t, account_t>>{};
  accounts.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    auto address = read_key(bytes_view_t{key}.subspan(prefix.size()));
    if (!address) {
      bailment::common::critical("malformed account key in storage");
    }
    accounts.emplace_back(*address,
                          encoder_.decode<account_t>(make_bytes_view(value)));
  }
  return accounts;
}

std::optional<int64_t> engine::transaction_height(const hash32_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  return stored_receipt(id);
}

std::optional<int64_t> engine::stored_receipt(const hash32_t& id) const {
  return storage_.get<encoder_t, int64_t>(
      encoder_, make_bytes_view(bailment::storage::make_receipt_key(id)));
}

uint64_t engine::next_nonce(const pubkey_t& payer) const {
  auto lock = std::scoped_lock{mutex_};
  return stored_nonce(payer);
}

uint64_t engine::stored_nonce(const pubkey_t& payer) const {
  return storage_
      .get<encoder_t, uint64_t>(
          encoder_, make_bytes_view(bailment::storage::make_nonce_key(payer)))
      .value_or(0);
}

hash32_t engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Signature verifier ignored; strict crypto disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

void engine::set_clock(unix_clock_t clock) {
  auto lock = std::scoped_lock{mutex_};
  clock_ = std::move(clock);
}

unix_timestamp_t engine::now() const {
  auto lock = std::scoped_lock{mutex_};
  return clock_();
}

}  // namespace bailment::execution
