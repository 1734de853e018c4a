#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <bailment/address/derive.hpp>
#include <bailment/client/operations.hpp>
#include <bailment/client/session.hpp>
#include <bailment/client/setup_cache.hpp>
#include <bailment/codec/records.hpp>
#include <bailment/codec/selector.hpp>
#include <bailment/config/logging.hpp>
#include <bailment/config/settings.hpp>
#include <bailment/crypto/keypair.hpp>
#include <bailment/execution/engine.hpp>
#include <bailment/execution/token_program.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace bailment::schema;

namespace {

constexpr auto kDefaultLockAmount = amount_t{100'000};
constexpr auto kDefaultEscrowAmount = amount_t{50'000};

std::string format_amount(const amount_t amount, const uint8_t decimals) {
  auto digits = std::to_string(amount);
  if (decimals == 0) {
    return digits;
  }
  if (digits.size() <= decimals) {
    digits.insert(0, decimals + 1 - digits.size(), '0');
  }
  digits.insert(digits.size() - decimals, 1, '.');
  return digits;
}

std::optional<bailment::crypto::keypair> load_signer(
    const bailment::config::settings& values) {
  auto signer = bailment::crypto::keypair::load(values.keypair_path);
  if (!signer) {
    spdlog::error("No usable key pair at '{}'; run `bailment keygen` first",
                  values.keypair_path);
  }
  return signer;
}

/// Executor, session and signer context for the commands that submit.
class runtime final {
 public:
  runtime(const bailment::config::settings& values,
          const bailment::crypto::keypair& signer)
      : storage_{bailment::storage::make_storage<
            bailment::storage::rocksdb_storage_tag>(values.db_path)},
        engine_{encoder_,
                storage_,
                bailment::config::resolve_program_id(values),
                values.strict_crypto,
                bailment::execution::make_chain_id(values.chain_id)},
        session_{bailment::client::make_local_session(engine_)},
        context_{.signer = signer,
                 .ledger = session_,
                 .program_id = engine_.program_id()} {
    context_.retry.max_attempts = values.retries;
  }

  bailment::client::context& context() { return context_; }
  bailment::execution::engine& engine() { return engine_; }

 private:
  bailment::schema::encoding::scale_encoder_t encoder_;
  bailment::execution::storage_t storage_;
  bailment::execution::engine engine_;
  bailment::client::session session_;
  bailment::client::context context_;
};

int keygen(const bailment::config::settings& values) {
  auto path = values.arguments.empty() ? values.keypair_path
                                       : values.arguments.front();
  if (std::filesystem::exists(path)) {
    spdlog::error("Refusing to overwrite existing key pair '{}'", path);
    return 1;
  }
  auto key = bailment::crypto::keypair::generate();
  if (!key.save(path)) {
    return 1;
  }
  std::cout << to_string(key.public_key()) << std::endl;
  return 0;
}

int create_mint(const bailment::config::settings& values) {
  auto signer = load_signer(values);
  if (!signer) {
    return 1;
  }
  auto rt = runtime{values, *signer};
  auto& ctx = rt.context();

  auto mint = bailment::crypto::keypair::generate();
  auto decimals = static_cast<uint8_t>(values.decimals);
  auto result = bailment::client::create_asset(ctx, mint, decimals,
                                               values.initial_supply);
  if (!result.ok()) {
    return 1;
  }

  auto record = bailment::client::make_setup_record(ctx, mint.public_key(),
                                                    decimals);
  if (!bailment::client::save_setup(values.cache_path, record)) {
    return 1;
  }
  std::cout << "program:        " << to_string(ctx.program_id) << "\n"
            << "mint:           " << to_string(record.mint) << "\n"
            << "payer:          " << to_string(record.payer) << "\n"
            << "payer holding:  " << to_string(record.payer_holding) << "\n"
            << "decimals:       " << static_cast<int>(decimals) << "\n"
            << "supply:         "
            << format_amount(values.initial_supply, decimals) << std::endl;
  return 0;
}

int lock(const bailment::config::settings& values) {
  auto signer = load_signer(values);
  if (!signer) {
    return 1;
  }
  auto rt = runtime{values, *signer};
  auto& ctx = rt.context();

  auto record = bailment::client::load_validated_setup(values.cache_path, ctx);
  if (!record) {
    spdlog::error("No valid setup at '{}'; run `bailment create-mint` first",
                  values.cache_path);
    return 1;
  }

  if (!bailment::client::init_vault(ctx, record->mint).ok()) {
    return 1;
  }
  auto addresses = bailment::client::derive_vault_addresses(ctx, record->mint);
  if (!bailment::client::ensure_holding_account(
           ctx, addresses.vault.address, record->mint)
           .ok()) {
    return 1;
  }
  auto amount = values.amount == 0 ? kDefaultLockAmount : values.amount;
  if (!bailment::client::lock_tokens(ctx, record->mint, amount).ok()) {
    return 1;
  }

  bailment::client::record_vault(ctx, *record);
  if (!bailment::client::save_setup(values.cache_path, *record)) {
    return 1;
  }
  auto vault_balance =
      bailment::client::fetch_holding(ctx, addresses.vault_holding);
  std::cout << "vault:          " << to_string(addresses.vault.address)
            << " (bump " << static_cast<int>(addresses.vault.bump) << ")\n"
            << "vault holding:  " << to_string(addresses.vault_holding) << "\n"
            << "vault balance:  "
            << format_amount(vault_balance ? vault_balance->amount : 0,
                             record->decimals)
            << std::endl;
  return 0;
}

int escrow(const bailment::config::settings& values) {
  auto signer = load_signer(values);
  if (!signer) {
    return 1;
  }
  auto rt = runtime{values, *signer};
  auto& ctx = rt.context();

  auto record = bailment::client::load_validated_setup(values.cache_path, ctx);
  if (!record || !record->vault) {
    spdlog::error("No vault recorded at '{}'; run `bailment lock` first",
                  values.cache_path);
    return 1;
  }

  auto seller = pubkey_t{};
  if (values.seller.empty()) {
    seller = bailment::crypto::keypair::generate().public_key();
    spdlog::info("Generated seller {}", to_string(seller));
  } else if (auto parsed = try_make_pubkey(values.seller)) {
    seller = *parsed;
  } else {
    spdlog::error("Invalid seller identity '{}'", values.seller);
    return 1;
  }

  auto amount = values.amount == 0 ? kDefaultEscrowAmount : values.amount;
  auto deadline = ctx.ledger.now() + values.deadline_seconds;
  if (!bailment::client::init_escrow(ctx, record->mint, seller, amount,
                                     deadline)
           .ok()) {
    return 1;
  }
  if (!bailment::client::release_to_seller(ctx, record->mint, seller).ok()) {
    return 1;
  }

  auto agreement = bailment::client::derive_agreement_address(
      ctx, record->mint, seller);
  auto state = bailment::client::fetch_agreement(ctx, agreement.address);
  auto vault_balance =
      bailment::client::fetch_holding(ctx, *record->vault_holding);
  auto seller_balance =
      bailment::client::holding_balance(ctx, seller, record->mint);
  std::cout << "agreement:      " << to_string(agreement.address) << "\n"
            << "status:         "
            << (state ? to_string(state->status) : "missing") << "\n"
            << "vault balance:  "
            << format_amount(vault_balance ? vault_balance->amount : 0,
                             record->decimals)
            << "\n"
            << "seller balance: "
            << format_amount(seller_balance.value_or(0), record->decimals)
            << std::endl;
  return 0;
}

int derive(const bailment::config::settings& values) {
  if (values.arguments.empty() || values.arguments.size() > 3) {
    std::cerr << "Usage: bailment derive <mint> [authority] [seller]"
              << std::endl;
    return 1;
  }
  auto mint = try_make_pubkey(values.arguments[0]);
  auto authority = std::optional<pubkey_t>{};
  if (values.arguments.size() > 1) {
    authority = try_make_pubkey(values.arguments[1]);
  } else if (auto signer = load_signer(values)) {
    authority = signer->public_key();
  }
  if (!mint || !authority) {
    std::cerr << "Invalid identity" << std::endl;
    return 1;
  }

  auto program_id = bailment::config::resolve_program_id(values);
  auto vault = bailment::address::derive_vault(*mint, *authority, program_id);
  std::cout << "vault:          " << to_string(vault.address) << " (bump "
            << static_cast<int>(vault.bump) << ")\n"
            << "vault holding:  "
            << to_string(bailment::address::derive_holding_account(
                                 vault.address, *mint)
                             .address)
            << std::endl;
  if (values.arguments.size() == 3) {
    auto seller = try_make_pubkey(values.arguments[2]);
    if (!seller) {
      std::cerr << "Invalid seller identity" << std::endl;
      return 1;
    }
    auto agreement = bailment::address::derive_escrow(
        vault.address, *authority, *seller, program_id);
    std::cout << "agreement:      " << to_string(agreement.address)
              << " (bump " << static_cast<int>(agreement.bump) << ")"
              << std::endl;
  }
  return 0;
}

int selector(const bailment::config::settings& values) {
  if (values.arguments.size() != 1) {
    std::cerr << "Usage: bailment selector <operation>" << std::endl;
    return 1;
  }
  auto value = bailment::codec::make_selector(values.arguments.front());
  std::cout << to_hex(bytes_view_t{value.data(), value.size()}) << std::endl;
  return 0;
}

std::string_view describe(const account_t& account) {
  auto data = bytes_view_t{account.data.data(), account.data.size()};
  if (bailment::codec::decode_record<vault_state_t>(data)) {
    return "vault";
  }
  if (bailment::codec::decode_record<agreement_state_t>(data)) {
    return "agreement";
  }
  if (bailment::execution::token_program::decode_holding(account)) {
    return "holding";
  }
  if (bailment::execution::token_program::decode_mint(account)) {
    return "mint";
  }
  return "unknown";
}

int accounts(const bailment::config::settings& values) {
  auto signer = bailment::crypto::keypair::generate();
  auto rt = runtime{values, signer};
  auto listed = rt.engine().list_accounts();
  for (const auto& [address, account] : listed) {
    std::cout << fmt::format("{:<44} {:<9} owner {}", to_string(address),
                             describe(account), to_string(account.owner))
              << "\n";
  }
  std::cout << listed.size() << " account(s) at height "
            << rt.engine().info().last_height << std::endl;
  return 0;
}

int inspect(const bailment::config::settings& values) {
  if (values.arguments.size() != 1) {
    std::cerr << "Usage: bailment inspect <address>" << std::endl;
    return 1;
  }
  auto key = try_make_pubkey(values.arguments.front());
  if (!key) {
    std::cerr << "Invalid identity" << std::endl;
    return 1;
  }
  auto signer = bailment::crypto::keypair::generate();
  auto rt = runtime{values, signer};
  auto account = rt.engine().get_account(*key);
  if (!account) {
    std::cout << "account " << to_string(*key) << " does not exist"
              << std::endl;
    return 1;
  }

  std::cout << "owner:          " << to_string(account->owner) << "\n"
            << "data:           "
            << to_hex(bytes_view_t{account->data.data(), account->data.size()})
            << std::endl;
  auto data = bytes_view_t{account->data.data(), account->data.size()};
  namespace token_program = bailment::execution::token_program;
  if (auto vault = bailment::codec::decode_record<vault_state_t>(data)) {
    std::cout << "vault of " << to_string(vault->authority) << " for "
              << to_string(vault->mint) << " (bump "
              << static_cast<int>(vault->bump) << ")" << std::endl;
  } else if (auto agreement =
                 bailment::codec::decode_record<agreement_state_t>(data)) {
    std::cout << "agreement " << to_string(agreement->buyer) << " -> "
              << to_string(agreement->seller) << ", amount "
              << agreement->amount_locked << ", deadline "
              << agreement->deadline_unix_ts << ", "
              << to_string(agreement->status) << std::endl;
  } else if (auto holding = token_program::decode_holding(*account)) {
    std::cout << "holding of " << to_string(holding->owner) << " for "
              << to_string(holding->mint) << ": " << holding->amount << ", "
              << to_string(holding->state) << std::endl;
  } else if (auto mint = token_program::decode_mint(*account)) {
    std::cout << "mint: supply " << mint->supply << ", decimals "
              << static_cast<int>(mint->decimals) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto values = bailment::config::parse_settings(argc, argv);
  if (!values) {
    return 1;
  }
  bailment::config::setup_logging(values->log_level, values->log_file);

  auto status = 1;
  if (values->command == "keygen") {
    status = keygen(*values);
  } else if (values->command == "create-mint") {
    status = create_mint(*values);
  } else if (values->command == "lock") {
    status = lock(*values);
  } else if (values->command == "escrow") {
    status = escrow(*values);
  } else if (values->command == "derive") {
    status = derive(*values);
  } else if (values->command == "selector") {
    status = selector(*values);
  } else if (values->command == "inspect") {
    status = inspect(*values);
  } else if (values->command == "accounts") {
    status = accounts(*values);
  } else {
    spdlog::error("Unknown command '{}'", values->command);
  }

  spdlog::shutdown();
  return status;
}
