#include <gtest/gtest.h>
#include <bailment/config/settings.hpp>
#include <bailment/schema/program_ids.hpp>
#include <bailment/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace {

std::optional<bailment::config::settings> parse(
    const std::vector<std::string>& args) {
  auto argv = std::vector<const char*>{"bailment"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return bailment::config::parse_settings(static_cast<int>(argv.size()),
                                          argv.data());
}

}  // namespace

TEST(settings, defaults_apply_when_only_a_command_is_given) {
  auto values = parse({"lock"});
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(values->command, "lock");
  EXPECT_EQ(values->db_path, "bailment.db");
  EXPECT_EQ(values->decimals, 6u);
  EXPECT_EQ(values->deadline_seconds, 3600);
  EXPECT_EQ(values->retries, 3u);
  EXPECT_TRUE(values->strict_crypto);
  EXPECT_TRUE(values->arguments.empty());
  EXPECT_EQ(bailment::config::resolve_program_id(*values),
            bailment::schema::program_ids::default_vault_escrow_program());
}

TEST(settings, positional_arguments_and_options_are_collected) {
  auto values = parse({"derive", "So11111111111111111111111111111111111111112",
                       "--amount", "500", "--strict-crypto", "false",
                       "--program-id",
                       "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"});
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(values->command, "derive");
  ASSERT_EQ(values->arguments.size(), 1u);
  EXPECT_EQ(values->amount, 500u);
  EXPECT_FALSE(values->strict_crypto);
  EXPECT_EQ(bailment::config::resolve_program_id(*values),
            bailment::schema::program_ids::token_program());
}

TEST(settings, config_file_fills_unset_options) {
  auto path = bailment::testing::make_db_path("bailment_settings") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "db-path = /tmp/ledger\n"
        << "decimals = 2\n"
        << "log-level = debug\n";
  }
  auto values = parse({"create-mint", "--config", path, "--decimals", "9"});
  bailment::testing::remove_path(path);
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(values->db_path, "/tmp/ledger");
  EXPECT_EQ(values->log_level, "debug");
  EXPECT_EQ(values->decimals, 9u);
}

TEST(settings, largest_representable_decimals_is_accepted) {
  auto values = parse({"create-mint", "--decimals", "19"});
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(values->decimals, 19u);
}

TEST(settings, invalid_input_yields_nothing) {
  EXPECT_FALSE(parse({}).has_value());
  EXPECT_FALSE(parse({"--help"}).has_value());
  EXPECT_FALSE(parse({"lock", "--amount", "many"}).has_value());
  EXPECT_FALSE(parse({"lock", "--unknown-flag"}).has_value());
  EXPECT_FALSE(parse({"create-mint", "--decimals", "256"}).has_value());
  EXPECT_FALSE(parse({"create-mint", "--decimals", "20"}).has_value());
  EXPECT_FALSE(
      parse({"lock", "--config", "/nonexistent/bailment.ini"}).has_value());
}
