#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/whatsapp_poller.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::execution {

namespace {

constexpr auto kReadWhatsappAction = std::string_view{"read_whatsapp"};
constexpr auto kPreviewLength = std::size_t{160};

bool contains_any(const std::string& lowered,
                  const std::vector<std::string>& keywords) {
  return std::ranges::any_of(keywords, [&](const auto& keyword) {
    return !keyword.empty() && lowered.find(keyword) != std::string::npos;
  });
}

}  // namespace

std::vector<std::string> whatsapp_poller::default_urgent_keywords() {
  return {"urgent",      "emergency",       "asap",        "immediately",
          "critical",    "important",       "priority",    "alert",
          "call me",     "call now",        "need help",   "help me",
          "trouble",     "accident",        "hospital",    "police",
          "fire",        "danger",          "deadline",    "overdue",
          "meeting now", "meeting started", "join now",    "starting now"};
}

std::vector<std::string> whatsapp_poller::default_spam_keywords() {
  return {"winner",      "congratulations", "you won",     "prize",
          "lottery",     "click here",      "limited time", "act now",
          "urgent offer", "claim now",      "claim your",  "cash prize",
          "inheritance", "make money fast", "guaranteed"};
}

whatsapp_poller::whatsapp_poller(warden::security::authorization_engine& engine,
                                 warden::capability::reader& reader,
                                 warden::dispatch::dispatcher& dispatcher,
                                 settings config,
                                 warden::common::time_source_t clock)
    : engine_{engine},
      reader_{reader},
      dispatcher_{dispatcher},
      settings_{std::move(config)},
      clock_{std::move(clock)} {
  for (auto* keywords : {&settings_.urgent_keywords, &settings_.spam_keywords}) {
    for (auto& keyword : *keywords) {
      keyword = to_lower(keyword);
    }
  }
}

whatsapp_poller::~whatsapp_poller() {
  stop();
}

bool whatsapp_poller::is_urgent(const std::string& message) const {
  auto lowered = to_lower(message);
  if (contains_any(lowered, settings_.spam_keywords)) {
    return false;
  }
  return contains_any(lowered, settings_.urgent_keywords);
}

poll_report_t whatsapp_poller::poll_once() {
  auto report = poll_report_t{};
  auto decision = engine_.authorize(
      settings_.owner,
      action_request_t{.kind = std::string{kReadWhatsappAction},
                       .requested_at = clock_(),
                       .origin = action_origin_t::system});
  if (!is_granted(decision)) {
    spdlog::debug("WhatsApp poll skipped: {}", describe(decision));
    return report;
  }
  report.authorized = true;

  auto& reader = reader_;
  auto messages = runner_.run(
      [&reader](std::stop_token stop) { return reader.read("unread", stop); },
      settings_.read_timeout);
  if (!messages) {
    spdlog::warn("WhatsApp reader unavailable");
    return report;
  }
  report.read = messages->size();

  for (const auto& message : *messages) {
    auto digest = warden::blake3::hash(message);
    {
      auto lock = std::scoped_lock{mutex_};
      if (!seen_.insert(digest).second) {
        continue;
      }
      if (seen_.size() > settings_.remembered_messages) {
        seen_.clear();
        seen_.insert(digest);
      }
    }
    ++report.fresh;
    if (!is_urgent(message)) {
      continue;
    }
    auto preview = message.size() > kPreviewLength
                       ? message.substr(0, kPreviewLength) + "..."
                       : message;
    if (dispatcher_.notify(settings_.owner, "Urgent WhatsApp message:\n" + preview)) {
      ++report.forwarded;
    } else {
      spdlog::warn("Failed to forward urgent WhatsApp message");
    }
  }
  if (report.fresh > 0) {
    spdlog::info("WhatsApp poll: {} new, {} forwarded", report.fresh,
                 report.forwarded);
  }
  return report;
}

void whatsapp_poller::start() {
  auto lock = std::scoped_lock{mutex_};
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread{[this] { run(); }};
}

void whatsapp_poller::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    running_ = false;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  runner_.join_all();
}

void whatsapp_poller::run() {
  while (true) {
    poll_once();
    auto lock = std::unique_lock{mutex_};
    if (wake_.wait_for(lock, settings_.interval, [this] { return !running_; })) {
      return;
    }
  }
}

}  // namespace warden::execution
