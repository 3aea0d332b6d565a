#pragma once

#include <warden/audit/audit_log.hpp>
#include <warden/call/call_archive.hpp>
#include <warden/call/conversation_handler.hpp>
#include <warden/capability/telephony.hpp>
#include <warden/common/clock.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/schema/call_phase.hpp>
#include <warden/schema/call_state.hpp>
#include <warden/security/authorization_engine.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace warden::call {

/// Incoming-call state machine with auto-pickup.
///
/// Telephony events and the ring timer race for the same transitions; each
/// transition is a compare-and-swap on the phase word, so exactly one of
/// them wins and the others are no-ops. The full state lives beside the
/// phase under `state_mutex_` for observers.
class call_monitor final {
 public:
  struct settings final {
    std::string owner;
    warden::schema::duration_milliseconds_t auto_pickup_delay{20000};
    bool auto_pickup_enabled{true};
  };

  call_monitor(warden::security::authorization_engine& engine,
               warden::capability::telephony& telephony,
               conversation_handler& conversation,
               call_archive& archive,
               warden::dispatch::dispatcher& dispatcher,
               warden::audit::audit_log& audit,
               settings config,
               warden::common::time_source_t clock);
  ~call_monitor();

  call_monitor(const call_monitor&) = delete;
  call_monitor& operator=(const call_monitor&) = delete;

  /// idle -> ringing; arms the auto-pickup timer.
  bool on_ring(const std::string& caller);
  /// ringing -> user_answered.
  bool on_user_answered();
  /// ringing -> idle as a missed call, or ends an ongoing conversation.
  bool on_hangup();
  /// ringing -> auto_pickup_pending, then authorize `call_pickup` and either
  /// converse or reject. Runs the whole conversation on the calling thread.
  bool on_ring_timeout();
  /// Any terminal phase -> idle.
  bool on_idle();

  warden::schema::call_phase_t phase() const;
  warden::schema::call_state_t state() const;

  /// Stop the timer thread and end any conversation in progress.
  void stop();

 private:
  bool transition(warden::schema::call_phase_t from,
                  warden::schema::call_phase_t to);
  void set_state(warden::schema::call_state_t state);
  void arm(std::chrono::milliseconds delay);
  void disarm();
  void run_timer();
  void converse(const std::string& caller,
                warden::schema::timestamp_milliseconds_t started_at);
  void reject(const std::string& caller, const std::string& reason);

  warden::security::authorization_engine& engine_;
  warden::capability::telephony& telephony_;
  conversation_handler& conversation_;
  call_archive& archive_;
  warden::dispatch::dispatcher& dispatcher_;
  warden::audit::audit_log& audit_;
  settings settings_;
  warden::common::time_source_t clock_;

  std::atomic<warden::schema::call_phase_t> phase_{
      warden::schema::call_phase_t::idle};
  std::atomic<bool> hangup_{false};
  mutable std::mutex state_mutex_;
  warden::schema::call_state_t state_{warden::schema::call_idle_t{}};

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool stopping_{false};
  std::thread timer_;
};

}  // namespace warden::call
