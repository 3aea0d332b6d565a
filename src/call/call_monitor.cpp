#include <spdlog/spdlog.h>
#include <warden/call/call_monitor.hpp>

using namespace warden::schema;

namespace warden::call {

namespace {

constexpr auto kCallPickupAction = std::string_view{"call_pickup"};

}  // namespace

call_monitor::call_monitor(warden::security::authorization_engine& engine,
                           warden::capability::telephony& telephony,
                           conversation_handler& conversation,
                           call_archive& archive,
                           warden::dispatch::dispatcher& dispatcher,
                           warden::audit::audit_log& audit,
                           settings config,
                           warden::common::time_source_t clock)
    : engine_{engine},
      telephony_{telephony},
      conversation_{conversation},
      archive_{archive},
      dispatcher_{dispatcher},
      audit_{audit},
      settings_{std::move(config)},
      clock_{std::move(clock)} {
  timer_ = std::thread{[this] { run_timer(); }};
}

call_monitor::~call_monitor() {
  stop();
}

void call_monitor::stop() {
  hangup_ = true;
  {
    auto lock = std::scoped_lock{timer_mutex_};
    stopping_ = true;
    deadline_.reset();
  }
  timer_cv_.notify_all();
  if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) {
    timer_.join();
  }
}

call_phase_t call_monitor::phase() const {
  return phase_.load();
}

call_state_t call_monitor::state() const {
  auto lock = std::scoped_lock{state_mutex_};
  return state_;
}

bool call_monitor::transition(const call_phase_t from, const call_phase_t to) {
  auto expected = from;
  if (!phase_.compare_exchange_strong(expected, to)) {
    return false;
  }
  spdlog::debug("Call phase {} -> {}", to_string(from), to_string(to));
  return true;
}

void call_monitor::set_state(call_state_t state) {
  auto lock = std::scoped_lock{state_mutex_};
  state_ = std::move(state);
}

void call_monitor::arm(const std::chrono::milliseconds delay) {
  {
    auto lock = std::scoped_lock{timer_mutex_};
    if (stopping_) {
      return;
    }
    deadline_ = std::chrono::steady_clock::now() + delay;
  }
  timer_cv_.notify_all();
}

void call_monitor::disarm() {
  {
    auto lock = std::scoped_lock{timer_mutex_};
    deadline_.reset();
  }
  timer_cv_.notify_all();
}

void call_monitor::run_timer() {
  auto lock = std::unique_lock{timer_mutex_};
  while (!stopping_) {
    if (!deadline_) {
      timer_cv_.wait(lock, [this] { return stopping_ || deadline_; });
      continue;
    }
    auto deadline = *deadline_;
    auto changed = timer_cv_.wait_until(lock, deadline, [&] {
      return stopping_ || deadline_ != deadline;
    });
    if (changed) {
      continue;
    }
    deadline_.reset();
    lock.unlock();
    on_ring_timeout();
    lock.lock();
  }
}

bool call_monitor::on_ring(const std::string& caller) {
  if (!transition(call_phase_t::idle, call_phase_t::ringing)) {
    spdlog::warn("Ignoring ring while a call is {}", to_string(phase()));
    return false;
  }
  hangup_ = false;
  set_state(call_ringing_t{.started_at = clock_(), .caller = caller});
  spdlog::info("Incoming call");
  if (settings_.auto_pickup_enabled) {
    arm(std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(settings_.auto_pickup_delay)});
  }
  return true;
}

bool call_monitor::on_user_answered() {
  if (!transition(call_phase_t::ringing, call_phase_t::user_answered)) {
    return false;
  }
  disarm();
  auto lock = std::scoped_lock{state_mutex_};
  if (auto* ringing = std::get_if<call_ringing_t>(&state_)) {
    state_ = call_user_answered_t{.caller = ringing->caller};
  }
  spdlog::info("Call answered by the owner");
  return true;
}

bool call_monitor::on_hangup() {
  if (transition(call_phase_t::ringing, call_phase_t::idle)) {
    disarm();
    auto caller = std::string{};
    {
      auto lock = std::scoped_lock{state_mutex_};
      if (auto* ringing = std::get_if<call_ringing_t>(&state_)) {
        caller = ringing->caller;
      }
      state_ = call_idle_t{};
    }
    spdlog::info("Missed call");
    if (!dispatcher_.notify(settings_.owner, "Missed call from " + caller)) {
      spdlog::warn("Failed to deliver missed call notification");
    }
    return true;
  }
  auto current = phase();
  if (current == call_phase_t::auto_pickup_pending ||
      current == call_phase_t::in_conversation) {
    hangup_ = true;
    return true;
  }
  return false;
}

bool call_monitor::on_ring_timeout() {
  if (!transition(call_phase_t::ringing, call_phase_t::auto_pickup_pending)) {
    return false;
  }
  disarm();

  auto ringing = call_ringing_t{};
  {
    auto lock = std::scoped_lock{state_mutex_};
    if (auto* current = std::get_if<call_ringing_t>(&state_)) {
      ringing = *current;
    }
    state_ = call_auto_pickup_pending_t{
        .started_at = ringing.started_at,
        .deadline = ringing.started_at + settings_.auto_pickup_delay,
        .caller = ringing.caller};
  }

  auto decision = engine_.authorize(
      settings_.owner,
      action_request_t{.kind = std::string{kCallPickupAction},
                       .payload = ringing.caller,
                       .requested_at = clock_(),
                       .origin = action_origin_t::system,
                       .triggered_at = ringing.started_at});

  if (auto* pending = std::get_if<denied_pending_delay_t>(&decision)) {
    // Timer fired ahead of the wall clock; ring for the remainder.
    if (transition(call_phase_t::auto_pickup_pending, call_phase_t::ringing)) {
      set_state(ringing);
      arm(std::chrono::milliseconds{
          static_cast<std::chrono::milliseconds::rep>(pending->remaining)});
    }
    return true;
  }

  if (!is_granted(decision)) {
    reject(ringing.caller, describe(decision));
    return true;
  }

  if (hangup_.load()) {
    set_state(call_idle_t{});
    phase_ = call_phase_t::idle;
    spdlog::info("Caller hung up before pickup");
    return true;
  }

  if (!telephony_.pickup()) {
    spdlog::error("Telephony refused to pick up the call");
    reject(ringing.caller, "pickup failed");
    return true;
  }

  converse(ringing.caller, ringing.started_at);
  return true;
}

void call_monitor::reject(const std::string& caller, const std::string& reason) {
  spdlog::warn("Auto-pickup refused: {}", reason);
  if (!telephony_.reject()) {
    spdlog::error("Telephony failed to reject the call");
  }
  set_state(call_rejected_t{.caller = caller, .reason = reason});
  phase_ = call_phase_t::rejected;
  if (!dispatcher_.notify(settings_.owner,
                          "Missed call from " + caller + " (" + reason + ")")) {
    spdlog::warn("Failed to deliver rejected call notification");
  }
}

void call_monitor::converse(const std::string& caller,
                            const timestamp_milliseconds_t started_at) {
  if (!transition(call_phase_t::auto_pickup_pending,
                  call_phase_t::in_conversation)) {
    return;
  }
  set_state(call_in_conversation_t{.started_at = started_at, .caller = caller});
  spdlog::info("Call picked up automatically");

  auto summary = conversation_.run(
      caller, started_at, hangup_, [this](const utterance_t& turn) {
        auto lock = std::scoped_lock{state_mutex_};
        if (auto* active = std::get_if<call_in_conversation_t>(&state_)) {
          active->transcript.push_back(turn);
        }
      });

  phase_ = call_phase_t::summarizing;
  set_state(call_summarizing_t{.caller = caller});

  auto sequence = archive_.store(summary);
  if (sequence) {
    summary.sequence = *sequence;
  }

  auto record = audit_record_t{
      .event = audit_event_type_t::call,
      .principal_id = settings_.owner,
      .action_kind = std::string{kCallPickupAction},
      .required_level = permission_level_t::l4,
      .outcome = summary.complete ? audit_outcome_t::granted
                                  : audit_outcome_t::error,
      .reason = "call ended: " + std::string{to_string(summary.end_reason)}};
  if (!audit_.append(std::move(record))) {
    spdlog::error("Failed to audit the end of an auto-answered call");
  }

  if (!dispatcher_.notify_call_summary(settings_.owner, summary)) {
    spdlog::warn("Failed to deliver call summary");
  }

  set_state(call_completed_t{.summary = std::move(summary)});
  phase_ = call_phase_t::completed;
}

bool call_monitor::on_idle() {
  auto current = phase();
  if (!is_terminal(current) || !transition(current, call_phase_t::idle)) {
    return false;
  }
  set_state(call_idle_t{});
  return true;
}

}  // namespace warden::call
