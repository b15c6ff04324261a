// Repository: Reelmix
// Component: Termination Watcher
// Purpose: Turns a signal-set flag into a shutdown call on a normal thread.
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_UTIL_TERMINATION_WATCHER_HPP_
#define REELMIX_UTIL_TERMINATION_WATCHER_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace reelmix::util {

constexpr std::chrono::milliseconds kDefaultTerminationPollInterval{100};

// Signal handlers may only store to a lock-free atomic. TerminationWatcher
// polls that flag from its own thread and runs on_terminate once when it is
// seen set. Destruction stops polling and joins; on_terminate is not run if
// the flag was never set.
class TerminationWatcher {
 public:
  TerminationWatcher(const std::atomic<bool>& requested,
                     std::function<void()> on_terminate,
                     std::chrono::milliseconds poll_interval = kDefaultTerminationPollInterval);
  ~TerminationWatcher();

  TerminationWatcher(const TerminationWatcher&) = delete;
  TerminationWatcher& operator=(const TerminationWatcher&) = delete;

  bool fired() const { return fired_.load(std::memory_order_acquire); }

 private:
  void Run();

  const std::atomic<bool>& requested_;
  std::function<void()> on_terminate_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

}  // namespace reelmix::util

#endif  // REELMIX_UTIL_TERMINATION_WATCHER_HPP_
