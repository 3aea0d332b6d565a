#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace warden::common {

namespace detail {

template <typename T>
struct await_state final {
  std::mutex mutex;
  std::condition_variable ready;
  std::optional<T> value;
  bool done{false};
};

}  // namespace detail

/// Runs capability calls on worker threads and waits for each at most a
/// given timeout.
///
/// A worker that misses its deadline is signalled through its stop token and
/// kept until it returns. Finished workers are joined on the next call, and
/// the rest are joined by `join_all` or the destructor. Whatever a worker
/// references must therefore outlive the runner. Owners declare the runner
/// as their last member so that it is destroyed first.
class deadline_runner final {
 public:
  deadline_runner() = default;
  deadline_runner(const deadline_runner&) = delete;
  deadline_runner& operator=(const deadline_runner&) = delete;
  ~deadline_runner() { join_all(); }

  /// Run `fn(stop_token)`, which returns `std::optional<T>`. An empty result
  /// and a timeout both yield `std::nullopt`.
  template <typename Fn>
  auto run(Fn&& fn, std::chrono::milliseconds timeout)
      -> std::invoke_result_t<Fn&, std::stop_token>;

  /// Signal every outstanding worker and wait for all of them.
  void join_all() {
    auto pending = std::vector<worker>{};
    {
      auto lock = std::scoped_lock{mutex_};
      pending.swap(workers_);
    }
    for (auto& w : pending) {
      w.thread.request_stop();
    }
    // jthread destructors join.
  }

  /// Workers started and not yet joined.
  std::size_t outstanding() const {
    auto lock = std::scoped_lock{mutex_};
    return workers_.size();
  }

 private:
  struct worker final {
    std::shared_ptr<std::atomic<bool>> finished;
    std::jthread thread;
  };

  mutable std::mutex mutex_;
  std::vector<worker> workers_;
};

template <typename Fn>
auto deadline_runner::run(Fn&& fn, const std::chrono::milliseconds timeout)
    -> std::invoke_result_t<Fn&, std::stop_token> {
  using result_t = std::invoke_result_t<Fn&, std::stop_token>;
  using value_t = typename result_t::value_type;

  auto state = std::make_shared<detail::await_state<value_t>>();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  auto thread = std::jthread{[state, finished, fn = std::forward<Fn>(fn)](
                                 std::stop_token stop) mutable {
    auto result = fn(stop);
    {
      auto lock = std::scoped_lock{state->mutex};
      state->value = std::move(result);
      state->done = true;
    }
    state->ready.notify_all();
    finished->store(true);
  }};
  auto stop = thread.get_stop_source();
  {
    auto lock = std::scoped_lock{mutex_};
    std::erase_if(workers_, [](const worker& w) { return w.finished->load(); });
    workers_.push_back(worker{std::move(finished), std::move(thread)});
  }

  auto lock = std::unique_lock{state->mutex};
  if (!state->ready.wait_for(lock, timeout, [&] { return state->done; })) {
    stop.request_stop();
    return std::nullopt;
  }
  return std::move(state->value);
}

}  // namespace warden::common
