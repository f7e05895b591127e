#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace hacktracker::runtime {

/*
  Single logical thread that runs every collection, mutation and cache step.

  Post() is the only thread-safe entry point: transports completing on their
  own threads hop back here through it. Everything else (timers, running)
  belongs to the loop thread.

  Time comes from the injected NowFn; a test advances its clock and calls
  RunUntilIdle() to fire due timers.
*/
class EventLoop {
 public:
  using Task    = std::function<void()>;
  using TimerId = std::uint64_t;

  explicit EventLoop(util::NowFn now = util::Now);

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Post(Task task);

  TimerId PostDelayed(util::Clock::duration delay, Task task);

  // false when the timer already fired or was cancelled
  bool Cancel(TimerId id);

  // Runs ready tasks and due timers until nothing is runnable.
  // Returns the number of tasks executed.
  std::size_t RunUntilIdle();

  // Blocks until Shutdown().
  void Run();
  void Shutdown();

  std::size_t PendingTimers() const;
  util::TimePoint Now() const {
    return now_();
  }

 private:
  struct Timer {
    util::TimePoint deadline;
    Task            task;
  };

  bool PromoteDueTimersLocked(util::TimePoint now);
  void Execute(Task& task);

  util::NowFn now_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Task>        ready_;

  // deadline order, insertion order among equal deadlines
  std::multimap<util::TimePoint, TimerId> deadlines_;
  std::unordered_map<TimerId, Timer>      timers_;
  TimerId                                 next_timer_id_ = 1;
  bool                                    shutdown_      = false;
};

} // namespace hacktracker::runtime
