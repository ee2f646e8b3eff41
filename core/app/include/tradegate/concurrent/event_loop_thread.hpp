#pragma once

#include "tradegate/concurrent/thread_safe_queue.hpp"
#include "tradegate/eventbus/event_bus.hpp"
#include "tradegate/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace tradegate {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread that drains a ThreadSafeQueue<Event> and
// publishes each event on its own EventBus. The AdmissionEngine runs several
// of these and subscribes the same handlers to each bus, so streamed signals
// for one account are evaluated concurrently and contend on its ledger.
//
// Thread model: start() and stop() may be called from any thread; both are
// idempotent. push() is thread-safe. Bus callbacks run on the loop thread.
// stop() finishes the event in flight; events still queued are dropped
// unless drain() was called first.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  explicit EventLoopThread(std::string name) : name_(std::move(name)) {}

  // Stops and joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // @brief  Blocks until every event pushed before the call has been
  //         published and its callbacks have returned.
  //
  // Thread-safety: Safe from any thread except the loop thread itself
  //                (it would wait for its own callback).
  // -------------------------------------------------------------------------
  void drain();

  void push(Event event);

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }
  const std::string& name() const { return name_; }

 private:
  // Worker body: try_pop, publish; when idle, wait up to kIdleWaitTimeout
  // for stop() or a new push.
  void run();

  std::string name_{"event-loop"};

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};

  // pending_ counts pushed-but-not-yet-handled events; drain() waits on it.
  std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::size_t pending_{0};

  std::thread thread_;
};

}  // namespace tradegate
