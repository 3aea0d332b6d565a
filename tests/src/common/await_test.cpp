#include <gtest/gtest.h>
#include <warden/common/await.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

using warden::common::deadline_runner;
using namespace std::chrono_literals;

TEST(deadline_runner, returns_value_before_deadline) {
  auto runner = deadline_runner{};
  auto value =
      runner.run([](std::stop_token) { return std::optional<int>{7}; }, 1s);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
}

TEST(deadline_runner, empty_result_is_passed_through) {
  auto runner = deadline_runner{};
  auto value =
      runner.run([](std::stop_token) { return std::optional<int>{}; }, 1s);
  EXPECT_FALSE(value.has_value());
}

TEST(deadline_runner, timeout_signals_stop_and_keeps_worker) {
  auto runner = deadline_runner{};
  auto saw_stop = std::atomic<bool>{false};
  auto value = runner.run(
      [&saw_stop](std::stop_token stop) -> std::optional<int> {
        auto give_up = std::chrono::steady_clock::now() + 5s;
        while (!stop.stop_requested() &&
               std::chrono::steady_clock::now() < give_up) {
          std::this_thread::sleep_for(1ms);
        }
        saw_stop = stop.stop_requested();
        return 1;
      },
      20ms);
  EXPECT_FALSE(value.has_value());
  EXPECT_EQ(runner.outstanding(), 1u);

  runner.join_all();
  EXPECT_TRUE(saw_stop.load());
  EXPECT_EQ(runner.outstanding(), 0u);
}

TEST(deadline_runner, destruction_waits_for_stalled_worker) {
  auto finished = std::atomic<bool>{false};
  {
    auto runner = deadline_runner{};
    auto value = runner.run(
        [&finished](std::stop_token) -> std::optional<int> {
          std::this_thread::sleep_for(200ms);
          finished = true;
          return 1;
        },
        20ms);
    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(finished.load());
  }
  EXPECT_TRUE(finished.load());
}

TEST(deadline_runner, finished_workers_are_joined_on_next_call) {
  auto runner = deadline_runner{};
  for (auto i = 0; i < 3; ++i) {
    auto value =
        runner.run([](std::stop_token) { return std::optional<int>{1}; }, 1s);
    EXPECT_TRUE(value.has_value());
    std::this_thread::sleep_for(50ms);
  }
  EXPECT_EQ(runner.outstanding(), 1u);
}
