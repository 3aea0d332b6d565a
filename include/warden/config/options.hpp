#pragma once

#include <boost/program_options.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace warden::config {

/// Runtime settings for the daemon. Every field maps to a kebab-case option
/// that can be given on the command line or in the `--config` file.
struct options final {
  std::string grpc_address{"127.0.0.1:50151"};
  std::string bridge_address{"127.0.0.1:50152"};
  uint32_t bridge_deadline_ms{5000};
  std::string db_path{"warden.db"};
  std::string log_file{"warden.log"};
  bool verbose{false};

  std::string owner{"owner"};
  std::string owner_name{"Boss"};
  std::string owner_pin_digest;

  uint32_t auto_pickup_delay_seconds{20};
  bool auto_pickup_enabled{true};
  uint32_t session_timeout_seconds{300};
  uint32_t max_pin_retries{3};
  uint32_t lockout_seconds{900};
  uint32_t l4_delay_seconds{10};
  uint32_t confirmation_timeout_seconds{120};
  std::vector<std::string> banking_blocklist;

  uint32_t turn_timeout_seconds{10};
  uint32_t silence_turns{2};
  uint32_t max_call_duration_seconds{300};
  uint32_t max_turn_errors{3};
  std::vector<std::string> goodbye_phrases;
  uint32_t summary_window_turns{8};

  uint32_t audit_queue_capacity{1024};
  uint32_t audit_retention_days{30};
  uint32_t whatsapp_poll_interval_ms{5000};
};

const std::vector<std::string>& default_banking_blocklist();
const std::vector<std::string>& default_goodbye_phrases();

struct parse_result final {
  options values;
  bool show_help{false};
  std::string help;
};

/// Parse the command line, then the optional `--config` file; values on the
/// command line win. Throws `boost::program_options::error` on malformed or
/// out-of-range input.
parse_result parse(int argc, const char* const argv[]);

}  // namespace warden::config
