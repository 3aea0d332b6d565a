#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/random.hpp>
#include <warden/dispatch/dispatcher.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::dispatch {

dispatcher::dispatcher(transport& outbound,
                       settings config,
                       warden::common::time_source_t clock)
    : transport_{outbound}, settings_{config}, clock_{std::move(clock)} {}

hash32_t dispatcher::payload_digest(const std::string_view payload) {
  return warden::blake3::hash(payload);
}

bool dispatcher::notify(const std::string_view principal_id,
                        const std::string_view message) {
  auto delivered = transport_.deliver(principal_id, message);
  if (!delivered) {
    spdlog::error("Failed to deliver notification to '{}'", principal_id);
  }
  return delivered;
}

std::string dispatcher::request_confirmation(const std::string_view principal_id,
                                             const action_t& action,
                                             const std::string_view description) {
  auto now = clock_();
  auto confirmation =
      confirmation_t{.token = warden::crypto::make_token(),
                     .principal_id = std::string{principal_id},
                     .action_kind = action.kind,
                     .payload_digest = payload_digest(action.payload),
                     .issued_at = now,
                     .expires_at = now + settings_.confirmation_timeout};
  auto token = confirmation.token;
  {
    auto lock = std::scoped_lock{mutex_};
    confirmations_.emplace(token, std::move(confirmation));
  }

  auto prompt = fmt::format("{} ({}, {})", description, action.kind,
                            to_string(action.required_level));
  if (!transport_.deliver_confirmation_prompt(principal_id, token, prompt)) {
    spdlog::error("Failed to deliver confirmation prompt for '{}' to '{}'",
                  action.kind, principal_id);
  }
  return token;
}

confirmation_status_t dispatcher::resolve_confirmation(
    const std::string_view principal_id,
    const std::string_view token,
    const bool approved) {
  auto lock = std::scoped_lock{mutex_};
  auto it = confirmations_.find(token);
  if (it == std::end(confirmations_)) {
    return confirmation_status_t::unknown_token;
  }
  auto& confirmation = it->second;
  if (confirmation.principal_id != principal_id) {
    return confirmation_status_t::wrong_principal;
  }
  auto now = clock_();
  if (now >= confirmation.expires_at) {
    confirmations_.erase(it);
    return confirmation_status_t::expired;
  }
  if (!approved) {
    confirmation.rejected = true;
    return confirmation_status_t::rejected;
  }
  confirmation.confirmed_at = now;
  return confirmation_status_t::confirmed;
}

std::optional<confirmation_t> dispatcher::find_confirmation(
    const std::string_view token) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = confirmations_.find(token);
  if (it == std::end(confirmations_)) {
    return std::nullopt;
  }
  return it->second;
}

void dispatcher::consume_confirmation(const std::string_view token) {
  auto lock = std::scoped_lock{mutex_};
  auto it = confirmations_.find(token);
  if (it != std::end(confirmations_)) {
    confirmations_.erase(it);
  }
}

std::optional<confirmation_t> dispatcher::take_confirmation(
    const std::string_view token) {
  auto lock = std::scoped_lock{mutex_};
  auto it = confirmations_.find(token);
  if (it == std::end(confirmations_) || !it->second.confirmed_at ||
      it->second.rejected) {
    return std::nullopt;
  }
  auto taken = std::move(it->second);
  confirmations_.erase(it);
  return taken;
}

std::size_t dispatcher::expire_confirmations() {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  return std::erase_if(confirmations_, [now](const auto& item) {
    return now >= item.second.expires_at;
  });
}

std::size_t dispatcher::pending_confirmations(
    const std::string_view principal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<std::size_t>(
      std::ranges::count_if(confirmations_, [&](const auto& item) {
        return item.second.principal_id == principal_id &&
               !item.second.rejected;
      }));
}

std::string dispatcher::format_call_summary(const call_summary_t& summary) {
  auto text = fmt::format("Call from {} ({}s, {})\n{}", summary.caller,
                          summary.duration / 1000, to_string(summary.sentiment),
                          summary.summary);
  if (!summary.action_items.empty()) {
    text += "\nAction items:";
    for (const auto& item : summary.action_items) {
      text += "\n- " + item;
    }
  }
  if (!summary.blocked_requests.empty()) {
    text += fmt::format("\nRefused {} request(s) for private information.",
                        summary.blocked_requests.size());
  }
  if (!summary.complete) {
    text += fmt::format("\nCall handling ended early ({}).",
                        to_string(summary.end_reason));
  }
  return text;
}

bool dispatcher::notify_call_summary(const std::string_view principal_id,
                                     const call_summary_t& summary) {
  return notify(principal_id, format_call_summary(summary));
}

}  // namespace warden::dispatch
