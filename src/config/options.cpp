#include <warden/config/options.hpp>

#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace warden::config {

namespace {

po::options_description make_description(options& o) {
  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(),
      "Path to an INI style configuration file")(
      "grpc-address,g",
      po::value<std::string>(&o.grpc_address)->default_value(o.grpc_address),
      "IP:Port for the assistant gRPC service")(
      "bridge-address",
      po::value<std::string>(&o.bridge_address)->default_value(o.bridge_address),
      "IP:Port of the platform bridge exposing device capabilities")(
      "bridge-deadline-ms",
      po::value<uint32_t>(&o.bridge_deadline_ms)
          ->default_value(o.bridge_deadline_ms),
      "Deadline for a single bridge call")(
      "db-path",
      po::value<std::string>(&o.db_path)->default_value(o.db_path),
      "RocksDB directory for audit, sessions and call notes")(
      "log-file",
      po::value<std::string>(&o.log_file)->default_value(o.log_file),
      "Log file path")("verbose,v", po::bool_switch(&o.verbose),
                       "Enable debug logging");

  auto owner = po::options_description{"Owner"};
  owner.add_options()(
      "owner", po::value<std::string>(&o.owner)->default_value(o.owner),
      "Principal id of the device owner")(
      "owner-name",
      po::value<std::string>(&o.owner_name)->default_value(o.owner_name),
      "Owner display name, never revealed to callers")(
      "owner-pin-digest", po::value<std::string>(&o.owner_pin_digest),
      "PIN digest produced by warden_pin");

  auto security = po::options_description{"Security"};
  security.add_options()(
      "auto-pickup-delay-seconds",
      po::value<uint32_t>(&o.auto_pickup_delay_seconds)
          ->default_value(o.auto_pickup_delay_seconds),
      "Ring time before the assistant answers")(
      "auto-pickup-enabled",
      po::value<bool>(&o.auto_pickup_enabled)
          ->default_value(o.auto_pickup_enabled),
      "Grant standing approval for answering unattended calls")(
      "session-timeout-seconds",
      po::value<uint32_t>(&o.session_timeout_seconds)
          ->default_value(o.session_timeout_seconds),
      "Idle time before a verified session expires")(
      "max-pin-retries",
      po::value<uint32_t>(&o.max_pin_retries)
          ->default_value(o.max_pin_retries),
      "Consecutive PIN failures before lockout")(
      "lockout-seconds",
      po::value<uint32_t>(&o.lockout_seconds)
          ->default_value(o.lockout_seconds),
      "Lockout duration")(
      "l4-delay-seconds",
      po::value<uint32_t>(&o.l4_delay_seconds)
          ->default_value(o.l4_delay_seconds),
      "Minimum delay between confirmation and execution of L4 actions")(
      "confirmation-timeout-seconds",
      po::value<uint32_t>(&o.confirmation_timeout_seconds)
          ->default_value(o.confirmation_timeout_seconds),
      "Lifetime of a confirmation token")(
      "banking-blocklist",
      po::value<std::vector<std::string>>(&o.banking_blocklist)->composing(),
      "Additional blocked package or action names (repeatable)");

  auto call = po::options_description{"Call handling"};
  call.add_options()(
      "turn-timeout-seconds",
      po::value<uint32_t>(&o.turn_timeout_seconds)
          ->default_value(o.turn_timeout_seconds),
      "Wait for the caller in each turn")(
      "silence-turns",
      po::value<uint32_t>(&o.silence_turns)->default_value(o.silence_turns),
      "Consecutive silent turns that end the call")(
      "max-call-duration-seconds",
      po::value<uint32_t>(&o.max_call_duration_seconds)
          ->default_value(o.max_call_duration_seconds),
      "Hard limit on an assistant-handled call")(
      "max-turn-errors",
      po::value<uint32_t>(&o.max_turn_errors)
          ->default_value(o.max_turn_errors),
      "Failed responses tolerated before the call is closed")(
      "goodbye-phrase",
      po::value<std::vector<std::string>>(&o.goodbye_phrases)->composing(),
      "Caller phrase that ends the call (repeatable)")(
      "summary-window-turns",
      po::value<uint32_t>(&o.summary_window_turns)
          ->default_value(o.summary_window_turns),
      "Final turns considered when extracting action items");

  auto runtime = po::options_description{"Runtime"};
  runtime.add_options()(
      "audit-queue-capacity",
      po::value<uint32_t>(&o.audit_queue_capacity)
          ->default_value(o.audit_queue_capacity),
      "Bounded audit write queue size")(
      "audit-retention-days",
      po::value<uint32_t>(&o.audit_retention_days)
          ->default_value(o.audit_retention_days),
      "Age after which audit records are pruned")(
      "whatsapp-poll-interval-ms",
      po::value<uint32_t>(&o.whatsapp_poll_interval_ms)
          ->default_value(o.whatsapp_poll_interval_ms),
      "WhatsApp poll interval");

  auto description = po::options_description{"Warden"};
  description.add(general).add(owner).add(security).add(call).add(runtime);
  return description;
}

void require_positive(const uint32_t value, const std::string_view name) {
  if (value == 0) {
    throw po::error(std::string{name} + " must be greater than zero");
  }
}

void validate(const options& o) {
  require_positive(o.max_pin_retries, "max-pin-retries");
  require_positive(o.session_timeout_seconds, "session-timeout-seconds");
  require_positive(o.turn_timeout_seconds, "turn-timeout-seconds");
  require_positive(o.silence_turns, "silence-turns");
  require_positive(o.max_call_duration_seconds, "max-call-duration-seconds");
  require_positive(o.max_turn_errors, "max-turn-errors");
  require_positive(o.summary_window_turns, "summary-window-turns");
  require_positive(o.audit_queue_capacity, "audit-queue-capacity");
  require_positive(o.audit_retention_days, "audit-retention-days");
  require_positive(o.whatsapp_poll_interval_ms, "whatsapp-poll-interval-ms");
  require_positive(o.bridge_deadline_ms, "bridge-deadline-ms");
  if (o.owner.empty()) {
    throw po::error("owner must not be empty");
  }
}

}  // namespace

const std::vector<std::string>& default_banking_blocklist() {
  static const auto kBlocklist = std::vector<std::string>{
      // UPI and payment apps
      "com.phonepe.app",
      "com.google.android.apps.nbu.paisa.user",
      "net.one97.paytm",
      "com.paytm.app",
      "in.org.npci.upiapp",
      "com.cred.app",
      "com.dreamplug.androidapp",
      "com.mobikwik_new",
      "com.freecharge.android",
      "in.amazon.mshop.android.shopping",
      "com.paypal.android.p2pmobile",
      "com.hdfcbank.payzapp",
      "com.samsung.android.samsungpay",
      // Banking apps
      "com.snapwork.hdfc",
      "com.hdfcbank.mobilebanking",
      "com.sbi.sbifreedomplus",
      "com.sbi.lotusintouch",
      "com.icicibank.iciciapp",
      "com.icicibank.imobile",
      "com.axis.mobile",
      "com.axis.netbanking",
      "com.kotak.kotakmobilebanking",
      "com.pnb.android",
      "com.bankofbaroda.mconnect",
      "com.canarabank.mobility",
      "com.unionbank.ecommerce",
      "com.idbi.mpassbook",
      "com.bandhan.bank",
      "com.yesbank.yesonline",
      // Wallets
      "com.google.android.apps.walletnfcrel",
      "com.samsung.android.spaymini",
  };
  return kBlocklist;
}

const std::vector<std::string>& default_goodbye_phrases() {
  static const auto kPhrases = std::vector<std::string>{
      "goodbye", "bye", "thank you bye", "that's all", "talk later",
  };
  return kPhrases;
}

parse_result parse(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto description = make_description(result.values);

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    const auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw po::error("cannot open config file " + path);
    }
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    auto help = std::ostringstream{};
    help << description;
    result.show_help = true;
    result.help = help.str();
    return result;
  }

  auto& values = result.values;
  values.banking_blocklist.insert(std::begin(values.banking_blocklist),
                                  std::begin(default_banking_blocklist()),
                                  std::end(default_banking_blocklist()));
  if (values.goodbye_phrases.empty()) {
    values.goodbye_phrases = default_goodbye_phrases();
  }
  validate(values);
  return result;
}

}  // namespace warden::config
