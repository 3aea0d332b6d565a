#pragma once

#include <warden/audit/audit_log.hpp>
#include <warden/call/call_archive.hpp>
#include <warden/call/call_monitor.hpp>
#include <warden/call/call_notes.hpp>
#include <warden/call/conversation_handler.hpp>
#include <warden/call/prompt_builder.hpp>
#include <warden/config/options.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/execution/command_router.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/security/authorization_engine.hpp>
#include <warden/security/permission_policy.hpp>
#include <warden/security/session_store.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fakes.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace warden::testing {

/// Fully wired assistant over a throwaway RocksDB and in-memory fakes.
/// Defaults mirror the daemon's configuration defaults.
class assistant_fixture final {
 public:
  explicit assistant_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(db_path_)},
        audit_{encoder_, storage_, {}, clock_.source()},
        sessions_{encoder_, storage_, {}, clock_.source()},
        dispatcher_{transport_, {}, clock_.source()},
        policy_{warden::security::permission_policy::make_default(
            {.banking_blocklist = warden::config::default_banking_blocklist()})},
        engine_{policy_, sessions_, audit_, dispatcher_, {}, clock_.source()},
        prompts_{{.owner_name = "Boss"}},
        notes_{{}},
        archive_{encoder_, storage_},
        conversation_{voice_,
                      telephony_,
                      brain_,
                      prompts_,
                      notes_,
                      {.turn_timeout = std::chrono::seconds{5},
                       .speech_timeout = std::chrono::seconds{5},
                       .goodbye_phrases =
                           warden::config::default_goodbye_phrases()},
                      clock_.source()},
        monitor_{engine_,
                 telephony_,
                 conversation_,
                 archive_,
                 dispatcher_,
                 audit_,
                 {.owner = std::string{kOwner}},
                 clock_.source()},
        router_{engine_,   sessions_, audit_, archive_, monitor_,
                dispatcher_, {},       clock_.source()} {}

  assistant_fixture(const assistant_fixture&) = delete;
  assistant_fixture& operator=(const assistant_fixture&) = delete;
  assistant_fixture(assistant_fixture&&) = delete;
  assistant_fixture& operator=(assistant_fixture&&) = delete;

  ~assistant_fixture() {
    monitor_.stop();
    audit_.close();
    storage_.database.reset();
    remove_path(db_path_);
  }

  void enroll_owner() {
    sessions_.set_pin(kOwner, kOwnerPin, kTestPinIterations);
  }

  /// Enroll and verify the owner's PIN, leaving an L4 session.
  void login_owner() {
    enroll_owner();
    engine_.verify_pin(kOwner, kOwnerPin);
  }

  warden::schema::action_request_t request(
      std::string kind,
      std::string payload = {}) const {
    return warden::schema::action_request_t{.kind = std::move(kind),
                                            .payload = std::move(payload),
                                            .requested_at = clock_.now()};
  }

  const std::string& db_path() const { return db_path_; }
  manual_clock& clock() { return clock_; }
  warden::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }
  recording_transport& transport() { return transport_; }
  fake_telephony& telephony() { return telephony_; }
  fake_voice& voice() { return voice_; }
  fake_brain& brain() { return brain_; }
  warden::audit::audit_log& audit() { return audit_; }
  warden::security::session_store& sessions() { return sessions_; }
  warden::dispatch::dispatcher& dispatcher() { return dispatcher_; }
  const warden::security::permission_policy& policy() const { return policy_; }
  warden::security::authorization_engine& engine() { return engine_; }
  const warden::call::prompt_builder& prompts() const { return prompts_; }
  const warden::call::call_notes& notes() const { return notes_; }
  warden::call::call_archive& archive() { return archive_; }
  warden::call::conversation_handler& conversation() { return conversation_; }
  warden::call::call_monitor& monitor() { return monitor_; }
  warden::execution::command_router& router() { return router_; }

 private:
  std::string db_path_;
  manual_clock clock_;
  warden::schema::encoding::scale_encoder_t encoder_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag> storage_;
  recording_transport transport_;
  fake_telephony telephony_;
  fake_voice voice_;
  fake_brain brain_;
  warden::audit::audit_log audit_;
  warden::security::session_store sessions_;
  warden::dispatch::dispatcher dispatcher_;
  warden::security::permission_policy policy_;
  warden::security::authorization_engine engine_;
  warden::call::prompt_builder prompts_;
  warden::call::call_notes notes_;
  warden::call::call_archive archive_;
  warden::call::conversation_handler conversation_;
  warden::call::call_monitor monitor_;
  warden::execution::command_router router_;
};

}  // namespace warden::testing
