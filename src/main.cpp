#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/audit/audit_log.hpp>
#include <warden/call/call_archive.hpp>
#include <warden/call/call_monitor.hpp>
#include <warden/call/call_notes.hpp>
#include <warden/call/conversation_handler.hpp>
#include <warden/call/prompt_builder.hpp>
#include <warden/common/clock.hpp>
#include <warden/config/options.hpp>
#include <warden/crypto/pin.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/execution/command_router.hpp>
#include <warden/execution/whatsapp_poller.hpp>
#include <warden/rpc/bridge_client.hpp>
#include <warden/rpc/server.hpp>
#include <warden/security/authorization_engine.hpp>
#include <warden/security/permission_policy.hpp>
#include <warden/security/session_store.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace warden::schema;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = warden::config::parse_result{};
  try {
    parsed = warden::config::parse(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << "warden: " << e.what() << std::endl;
    return 1;
  }
  if (parsed.show_help) {
    std::cout << parsed.help << std::endl;
    return 0;
  }
  const auto& config = parsed.values;

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.verbose ? spdlog::level::debug
                                   : spdlog::level::info);

  auto clock = warden::common::system_time_source();
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          config.db_path);

  auto bridge = warden::rpc::bridge_client{
      grpc::CreateChannel(config.bridge_address,
                          grpc::InsecureChannelCredentials()),
      {.deadline = std::chrono::milliseconds{config.bridge_deadline_ms}}};

  auto audit = warden::audit::audit_log{
      encoder, storage,
      {.queue_capacity = config.audit_queue_capacity,
       .retention = config.audit_retention_days * 24ull *
                    seconds_to_milliseconds(60 * 60)},
      clock};

  auto sessions = warden::security::session_store{
      encoder, storage,
      {.session_timeout = seconds_to_milliseconds(config.session_timeout_seconds),
       .max_pin_retries = config.max_pin_retries,
       .lockout = seconds_to_milliseconds(config.lockout_seconds)},
      clock};
  if (!config.owner_pin_digest.empty()) {
    auto record = warden::crypto::parse_pin_record(config.owner_pin_digest);
    if (!record) {
      spdlog::critical("owner-pin-digest is not a valid digest");
      spdlog::shutdown();
      return 1;
    }
    sessions.enroll(config.owner, *record);
  } else if (!sessions.is_enrolled(config.owner)) {
    spdlog::warn("No PIN enrolled for '{}'; L2 and above stay locked",
                 config.owner);
  }

  auto dispatcher = warden::dispatch::dispatcher{
      bridge,
      {.confirmation_timeout =
           seconds_to_milliseconds(config.confirmation_timeout_seconds)},
      clock};

  auto policy = warden::security::permission_policy::make_default(
      {.banking_blocklist = config.banking_blocklist,
       .auto_pickup_enabled = config.auto_pickup_enabled,
       .auto_pickup_delay =
           seconds_to_milliseconds(config.auto_pickup_delay_seconds)});
  auto engine = warden::security::authorization_engine{
      policy, sessions, audit, dispatcher,
      {.l4_delay = seconds_to_milliseconds(config.l4_delay_seconds)}, clock};

  auto prompts = warden::call::prompt_builder{{.owner_name = config.owner_name}};
  auto notes = warden::call::call_notes{{.window_turns = config.summary_window_turns}};
  auto archive = warden::call::call_archive{encoder, storage};
  auto conversation = warden::call::conversation_handler{
      bridge, bridge, bridge, prompts, notes,
      {.turn_timeout = std::chrono::seconds{config.turn_timeout_seconds},
       .silence_turns = config.silence_turns,
       .max_call_duration =
           seconds_to_milliseconds(config.max_call_duration_seconds),
       .max_turn_errors = config.max_turn_errors,
       .goodbye_phrases = config.goodbye_phrases,
       .window_turns = config.summary_window_turns},
      clock};
  auto monitor = warden::call::call_monitor{
      engine, bridge, conversation, archive, dispatcher, audit,
      {.owner = config.owner,
       .auto_pickup_delay =
           seconds_to_milliseconds(config.auto_pickup_delay_seconds),
       .auto_pickup_enabled = config.auto_pickup_enabled},
      clock};

  auto readers = std::vector<std::unique_ptr<warden::capability::reader>>{};
  auto router = warden::execution::command_router{
      engine, sessions, audit, archive, monitor, dispatcher, {}, clock};
  for (const auto* source :
       {"whatsapp", "sms", "call_log", "contacts", "calendar", "file"}) {
    readers.push_back(bridge.make_reader(source));
    router.register_reader(source, *readers.back());
  }
  router.register_executor(bridge);

  auto poller = warden::execution::whatsapp_poller{
      engine, *readers.front(), dispatcher,
      {.owner = config.owner,
       .interval = std::chrono::milliseconds{config.whatsapp_poll_interval_ms}},
      clock};
  poller.start();

  spdlog::info("gRPC service listening on {}", config.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener =
      warden::rpc::listener{engine, router, audit, monitor};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", config.grpc_address);
    poller.stop();
    monitor.stop();
    audit.close();
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto ticks = uint64_t{};
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(!audit.faulted());
      if (ticks % 10 == 0) {
        dispatcher.expire_confirmations();
      }
      if (ticks % 3600 == 0) {
        audit.apply_retention();
      }
      ++ticks;
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  poller.stop();
  monitor.stop();
  audit.close();
  spdlog::info("Shut down cleanly");
  spdlog::shutdown();
  return 0;
}
