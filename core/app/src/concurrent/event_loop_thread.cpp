#include "tradegate/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace tradegate {

namespace {

// Idle wait between queue polls. Bounds stop() latency when the queue is
// empty.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  state_cv_.notify_all();
  thread_.join();

  // Anything left in the queue will not be handled; release drain() waiters.
  std::size_t dropped = 0;
  while (queue_.try_pop()) {
    ++dropped;
  }
  {
    std::lock_guard lock(state_mutex_);
    pending_ = 0;
  }
  state_cv_.notify_all();

  if (dropped > 0) {
    std::cerr << "[EventLoopThread] " << name_ << ": dropped " << dropped
              << " unprocessed event(s) on stop.\n";
  }
}

void EventLoopThread::push(Event event) {
  {
    std::lock_guard lock(state_mutex_);
    ++pending_;
  }
  queue_.push(std::move(event));
  state_cv_.notify_all();
}

void EventLoopThread::drain() {
  std::unique_lock lock(state_mutex_);
  state_cv_.wait(lock, [this] { return pending_ == 0 || !running_.load(); });
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      // A throwing subscriber must not kill the worker; report it and keep
      // the loop alive.
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[EventLoopThread] " << name_
                  << ": subscriber threw: " << e.what() << "\n";
      }
      {
        std::lock_guard lock(state_mutex_);
        if (pending_ > 0) {
          --pending_;
        }
      }
      state_cv_.notify_all();
      continue;
    }

    std::unique_lock lock(state_mutex_);
    state_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || pending_ > 0;
    });
  }
}

}  // namespace tradegate
