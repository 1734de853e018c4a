#include <bailment/config/settings.hpp>
#include <bailment/schema/mint_state.hpp>
#include <bailment/schema/program_ids.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace bailment::config {

po::options_description make_options_description(settings& values) {
  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "Read options from an INI file")(
      "db-path", po::value<std::string>(&values.db_path)->default_value(
                     values.db_path),
      "RocksDB directory of the local executor")(
      "program-id", po::value<std::string>(&values.program_id),
      "Vault-escrow program id (base58)")(
      "keypair,k",
      po::value<std::string>(&values.keypair_path)
          ->default_value(values.keypair_path),
      "Signer key pair file (JSON byte array)")(
      "cache-path",
      po::value<std::string>(&values.cache_path)
          ->default_value(values.cache_path),
      "Setup cache file")(
      "log-level",
      po::value<std::string>(&values.log_level)
          ->default_value(values.log_level),
      "trace, debug, info, warn, error or critical")(
      "log-file", po::value<std::string>(&values.log_file),
      "Also log to this file")(
      "strict-crypto",
      po::value<bool>(&values.strict_crypto)
          ->default_value(values.strict_crypto),
      "Verify every Ed25519 signature")(
      "chain-id",
      po::value<std::string>(&values.chain_id)->default_value(values.chain_id),
      "Network name the chain id is derived from")(
      "retries",
      po::value<std::size_t>(&values.retries)->default_value(values.retries),
      "Submission attempts for transient failures");

  auto steps = po::options_description{"Protocol steps"};
  steps.add_options()(
      "decimals",
      po::value<uint32_t>(&values.decimals)->default_value(values.decimals),
      "Decimals of a new asset")(
      "supply",
      po::value<uint64_t>(&values.initial_supply)
          ->default_value(values.initial_supply),
      "Base units minted to the payer with a new asset")(
      "amount", po::value<uint64_t>(&values.amount),
      "Base units to lock or to bind to an agreement")(
      "seller", po::value<std::string>(&values.seller),
      "Seller identity (base58); generated when empty")(
      "deadline-seconds",
      po::value<int64_t>(&values.deadline_seconds)
          ->default_value(values.deadline_seconds),
      "Agreement deadline relative to now");

  auto positional = po::options_description{};
  positional.add_options()("command", po::value<std::string>(&values.command))(
      "args", po::value<std::vector<std::string>>(&values.arguments));

  auto all = po::options_description{"Bailment"};
  all.add(general).add(steps).add(positional);
  return all;
}

std::optional<settings> parse_settings(const int argc,
                                       const char* const argv[]) {
  auto values = settings{};
  auto description = make_options_description(values);
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      const auto& path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        std::cerr << "Cannot open config file '" << path << "'" << std::endl;
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return std::nullopt;
  }

  if (vm.contains("help") || values.command.empty()) {
    std::cout << "Usage: bailment <keygen|create-mint|lock|escrow|derive|"
                 "selector|inspect|accounts> [args] [options]\n"
              << description << std::endl;
    return std::nullopt;
  }
  if (values.decimals > bailment::schema::kMaxDecimals) {
    std::cerr << "decimals must not exceed "
              << static_cast<int>(bailment::schema::kMaxDecimals) << std::endl;
    return std::nullopt;
  }
  return values;
}

bailment::schema::pubkey_t resolve_program_id(const settings& values) {
  if (values.program_id.empty()) {
    return bailment::schema::program_ids::default_vault_escrow_program();
  }
  return bailment::schema::make_pubkey(values.program_id);
}

}  // namespace bailment::config
