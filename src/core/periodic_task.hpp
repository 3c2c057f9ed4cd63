#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include "exception_logging_utils.hpp"
#include "utils/logger.hpp"

namespace gpusched {

// =============================================================================
// PeriodicTask: runs `tick` every `interval` on its own jthread until stopped.
// A throwing tick is logged and the next one still runs.
// =============================================================================

class PeriodicTask {
 public:
  using Tick = std::function<void()>;

  PeriodicTask(
      std::string name, std::chrono::milliseconds interval, Tick tick,
      VerbosityLevel verbosity = VerbosityLevel::Silent)
      : name_(std::move(name)), interval_(interval), tick_(std::move(tick)),
        verbosity_(verbosity)
  {
  }

  PeriodicTask(const PeriodicTask&) = delete;
  auto operator=(const PeriodicTask&) -> PeriodicTask& = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  auto operator=(PeriodicTask&&) -> PeriodicTask& = delete;

  ~PeriodicTask() { stop(); }

  void start()
  {
    if (thread_.joinable() || !tick_ || interval_.count() <= 0) {
      return;
    }
    log_debug(
        verbosity_, "Starting " + name_ + " every " +
                        std::to_string(interval_.count()) + " ms");
    thread_ = std::jthread(
        [this](const std::stop_token& stop) { this->loop(stop); });
  }

  void stop()
  {
    if (!thread_.joinable()) {
      return;
    }
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
    log_debug(verbosity_, "Stopped " + name_);
  }

  [[nodiscard]] auto running() const -> bool { return thread_.joinable(); }

 private:
  void loop(const std::stop_token& stop)
  {
    const std::string prefix = name_ + ": ";
    while (!stop.stop_requested()) {
      {
        std::unique_lock lock(mutex_);
        if (cv_.wait_for(lock, stop, interval_, [&stop] {
              return stop.stop_requested();
            })) {
          break;
        }
      }
      if (stop.stop_requested()) {
        break;
      }
      run_with_logged_exceptions(
          tick_, ExceptionLoggingMessages{prefix});
    }
  }

  std::string name_;
  std::chrono::milliseconds interval_;
  Tick tick_;
  VerbosityLevel verbosity_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::jthread thread_;
};

}  // namespace gpusched
