#include <gtest/gtest.h>
#include <warden/config/options.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>
#include <fstream>
#include <vector>

namespace po = boost::program_options;
using namespace warden::config;

namespace {

parse_result parse_args(std::vector<const char*> args) {
  args.insert(args.begin(), "warden");
  return parse(static_cast<int>(args.size()), args.data());
}

bool contains(const std::vector<std::string>& values, std::string_view value) {
  return std::ranges::find(values, value) != values.end();
}

}  // namespace

TEST(options, defaults_match_documented_values) {
  auto result = parse_args({});
  const auto& values = result.values;
  EXPECT_FALSE(result.show_help);
  EXPECT_EQ(values.grpc_address, "127.0.0.1:50151");
  EXPECT_EQ(values.owner, "owner");
  EXPECT_EQ(values.auto_pickup_delay_seconds, 20u);
  EXPECT_TRUE(values.auto_pickup_enabled);
  EXPECT_EQ(values.session_timeout_seconds, 300u);
  EXPECT_EQ(values.max_pin_retries, 3u);
  EXPECT_EQ(values.lockout_seconds, 900u);
  EXPECT_EQ(values.l4_delay_seconds, 10u);
  EXPECT_EQ(values.confirmation_timeout_seconds, 120u);
  EXPECT_EQ(values.max_call_duration_seconds, 300u);
  EXPECT_EQ(values.banking_blocklist, default_banking_blocklist());
  EXPECT_EQ(values.goodbye_phrases, default_goodbye_phrases());
}

TEST(options, command_line_overrides_defaults) {
  auto result = parse_args({"--owner", "alice", "--auto-pickup-delay-seconds",
                            "30", "--auto-pickup-enabled", "false",
                            "--banking-blocklist", "com.example.bank",
                            "--goodbye-phrase", "see ya", "-v"});
  const auto& values = result.values;
  EXPECT_EQ(values.owner, "alice");
  EXPECT_EQ(values.auto_pickup_delay_seconds, 30u);
  EXPECT_FALSE(values.auto_pickup_enabled);
  EXPECT_TRUE(values.verbose);
  EXPECT_TRUE(contains(values.banking_blocklist, "com.example.bank"));
  EXPECT_TRUE(contains(values.banking_blocklist, "com.phonepe.app"));
  EXPECT_EQ(values.goodbye_phrases, std::vector<std::string>{"see ya"});
}

TEST(options, config_file_fills_in_unset_values) {
  auto path = warden::testing::make_db_path("warden_options_config") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "owner = carol\n"
         << "turn-timeout-seconds = 7\n"
         << "banking-blocklist = com.example.wallet\n";
  }

  auto result =
      parse_args({"--config", path.c_str(), "--owner", "dave"});
  warden::testing::remove_path(path);

  EXPECT_EQ(result.values.owner, "dave");
  EXPECT_EQ(result.values.turn_timeout_seconds, 7u);
  EXPECT_TRUE(contains(result.values.banking_blocklist, "com.example.wallet"));
}

TEST(options, help_is_reported_without_validation) {
  auto result = parse_args({"--help"});
  EXPECT_TRUE(result.show_help);
  EXPECT_NE(result.help.find("--grpc-address"), std::string::npos);
  EXPECT_NE(result.help.find("--auto-pickup-delay-seconds"), std::string::npos);
}

TEST(options, invalid_input_throws) {
  EXPECT_THROW(parse_args({"--max-pin-retries", "0"}), po::error);
  EXPECT_THROW(parse_args({"--owner="}), po::error);
  EXPECT_THROW(parse_args({"--silence-turns", "many"}), po::error);
  EXPECT_THROW(parse_args({"--no-such-option"}), po::error);
  EXPECT_THROW(parse_args({"--config", "/nonexistent/warden.ini"}), po::error);
}
