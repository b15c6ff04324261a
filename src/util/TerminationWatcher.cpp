// Repository: Reelmix
// Component: Termination Watcher Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/util/TerminationWatcher.hpp"

#include <utility>

namespace reelmix::util {

TerminationWatcher::TerminationWatcher(const std::atomic<bool>& requested,
                                       std::function<void()> on_terminate,
                                       std::chrono::milliseconds poll_interval)
    : requested_(requested),
      on_terminate_(std::move(on_terminate)),
      poll_interval_(poll_interval),
      thread_(&TerminationWatcher::Run, this) {}

TerminationWatcher::~TerminationWatcher() {
  stopping_.store(true, std::memory_order_release);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TerminationWatcher::Run() {
  while (!stopping_.load(std::memory_order_acquire)) {
    if (requested_.load(std::memory_order_acquire)) {
      fired_.store(true, std::memory_order_release);
      if (on_terminate_) on_terminate_();
      return;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

}  // namespace reelmix::util
