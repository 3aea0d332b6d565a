#include <spdlog/spdlog.h>
#include <warden/schema/key/keys.hpp>
#include <warden/security/session_store.hpp>

using namespace warden::schema;

namespace warden::security {

session_store::session_store(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
    settings config,
    warden::common::time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      settings_{config},
      clock_{std::move(clock)} {}

std::shared_ptr<session_store::entry> session_store::entry_for(
    const std::string_view principal_id) {
  auto lock = std::scoped_lock{map_mutex_};
  auto it = entries_.find(principal_id);
  if (it != std::end(entries_)) {
    return it->second;
  }

  auto created = std::make_shared<entry>();
  auto session_key = key::make_session_key(principal_id);
  auto stored = storage_.get<session_t>(encoder_, make_bytes_view(session_key));
  if (stored) {
    created->session = std::move(*stored);
  } else {
    created->session.principal_id = std::string{principal_id};
    created->session.created_at = clock_();
    created->session.expires_at = created->session.created_at;
  }
  auto pin_key = key::make_pin_key(principal_id);
  created->pin = storage_.get<pin_record_t>(encoder_, make_bytes_view(pin_key));

  entries_.emplace(std::string{principal_id}, created);
  return created;
}

bool session_store::valid_locked(const entry& e,
                                 const timestamp_milliseconds_t now) const {
  return e.session.verified_level > permission_level_t::l1 &&
         now < e.session.expires_at;
}

void session_store::persist(const session_t& session) {
  auto storage_key = key::make_session_key(session.principal_id);
  storage_.put(encoder_, make_bytes_view(storage_key), session);
}

session_t session_store::get_or_create(const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  return e->session;
}

verify_result_t session_store::verify(const std::string_view principal_id,
                                      const std::string_view pin) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  auto now = clock_();
  auto& session = e->session;

  if (session.locked_until) {
    if (now < *session.locked_until) {
      spdlog::warn("PIN attempt for '{}' rejected during lockout",
                   principal_id);
      return auth_error_t::locked;
    }
    session.locked_until.reset();
    session.failed_attempts = 0;
  }

  if (!e->pin) {
    return auth_error_t::not_enrolled;
  }

  if (!warden::crypto::verify_pin(pin, *e->pin)) {
    ++session.failed_attempts;
    if (session.failed_attempts >= settings_.max_pin_retries) {
      session.locked_until = now + settings_.lockout;
      session.verified_level = permission_level_t::l1;
      session.expires_at = now;
      spdlog::warn("'{}' locked out after {} failed PIN attempts", principal_id,
                   session.failed_attempts);
    } else {
      spdlog::warn("Invalid PIN for '{}' ({}/{})", principal_id,
                   session.failed_attempts, settings_.max_pin_retries);
    }
    persist(session);
    return auth_error_t::invalid_pin;
  }

  session.verified_level = permission_level_t::l4;
  session.expires_at = now + settings_.session_timeout;
  session.failed_attempts = 0;
  persist(session);
  spdlog::info("'{}' verified until {}", principal_id, session.expires_at);
  return session.verified_level;
}

void session_store::touch(const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  auto now = clock_();
  if (!valid_locked(*e, now)) {
    return;
  }
  e->session.expires_at = now + settings_.session_timeout;
  persist(e->session);
}

bool session_store::is_valid(const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  return valid_locked(*e, clock_());
}

permission_level_t session_store::effective_level(
    const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  if (valid_locked(*e, clock_())) {
    return e->session.verified_level;
  }
  if (e->session.verified_level != permission_level_t::l1) {
    spdlog::info("Session for '{}' expired", principal_id);
    e->session.verified_level = permission_level_t::l1;
    persist(e->session);
  }
  return permission_level_t::l1;
}

void session_store::logout(const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  e->session.verified_level = permission_level_t::l1;
  e->session.expires_at = clock_();
  persist(e->session);
}

void session_store::enroll(const std::string_view principal_id,
                           const pin_record_t& record) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  e->pin = record;
  auto storage_key = key::make_pin_key(principal_id);
  storage_.put(encoder_, make_bytes_view(storage_key), record);
}

std::optional<auth_error_t> session_store::set_pin(
    const std::string_view principal_id,
    const std::string_view pin,
    const uint32_t iterations) {
  if (pin.size() < warden::crypto::kMinPinLength) {
    return auth_error_t::pin_too_short;
  }
  enroll(principal_id, warden::crypto::make_pin_record(pin, iterations));
  return std::nullopt;
}

bool session_store::is_enrolled(const std::string_view principal_id) {
  auto e = entry_for(principal_id);
  auto lock = std::scoped_lock{e->mutex};
  return e->pin.has_value();
}

}  // namespace warden::security
