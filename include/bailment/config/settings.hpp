#pragma once

#include <bailment/schema/primitives.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bailment::config {

/// Runtime options of the command line tool, from the command line and an
/// optional `--config` file. Command line values win.
struct settings final {
  std::string command;
  std::string db_path{"bailment.db"};
  std::string program_id;
  std::string keypair_path{"keypair.json"};
  std::string cache_path{"bailment-setup.bin"};
  std::string log_level{"info"};
  std::string log_file;
  bool strict_crypto{true};
  std::string chain_id{"bailment-local"};
  uint32_t decimals{6};
  uint64_t initial_supply{1'000'000'000'000};
  uint64_t amount{};
  std::string seller;
  int64_t deadline_seconds{3600};
  std::size_t retries{3};
  std::vector<std::string> arguments;
};

boost::program_options::options_description make_options_description(
    settings& values);

/// Empty when `--help` was requested or the arguments do not parse; the
/// reason has already been printed.
std::optional<settings> parse_settings(int argc, const char* const argv[]);

/// Configured program id, or the default deployment.
bailment::schema::pubkey_t resolve_program_id(const settings& values);

}  // namespace bailment::config
