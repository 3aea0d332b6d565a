#pragma once

#include <warden/capability/reader.hpp>
#include <warden/common/await.hpp>
#include <warden/common/clock.hpp>
#include <warden/dispatch/dispatcher.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/security/authorization_engine.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace warden::execution {

struct poll_report_t final {
  bool authorized{false};
  std::size_t read{};
  std::size_t fresh{};
  std::size_t forwarded{};
};

/// Background loop that reads new WhatsApp messages and forwards the urgent
/// ones to the owner. Every read goes through `read_whatsapp` authorization
/// with system origin, so it only succeeds while the owner holds a verified
/// session.
class whatsapp_poller final {
 public:
  struct settings final {
    std::string owner;
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds read_timeout{10000};
    std::vector<std::string> urgent_keywords{default_urgent_keywords()};
    std::vector<std::string> spam_keywords{default_spam_keywords()};
    std::size_t remembered_messages{4096};
  };

  static std::vector<std::string> default_urgent_keywords();
  static std::vector<std::string> default_spam_keywords();

  whatsapp_poller(warden::security::authorization_engine& engine,
                  warden::capability::reader& reader,
                  warden::dispatch::dispatcher& dispatcher,
                  settings config,
                  warden::common::time_source_t clock);
  ~whatsapp_poller();

  whatsapp_poller(const whatsapp_poller&) = delete;
  whatsapp_poller& operator=(const whatsapp_poller&) = delete;

  /// One authorize-read-forward cycle.
  poll_report_t poll_once();

  bool is_urgent(const std::string& message) const;

  void start();
  /// Stop the loop and wait for any read still in flight.
  void stop();

 private:
  void run();

  warden::security::authorization_engine& engine_;
  warden::capability::reader& reader_;
  warden::dispatch::dispatcher& dispatcher_;
  settings settings_;
  warden::common::time_source_t clock_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool running_{false};
  std::set<warden::schema::hash32_t> seen_;
  std::thread worker_;
  warden::common::deadline_runner runner_;
};

}  // namespace warden::execution
