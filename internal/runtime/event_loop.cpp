#include "event_loop.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace hacktracker::runtime {

EventLoop::EventLoop(util::NowFn now) : now_(std::move(now)) {
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    ready_.push_back(std::move(task));
  }
  cv_.notify_one();
}

EventLoop::TimerId EventLoop::PostDelayed(util::Clock::duration delay, Task task) {
  TimerId id;
  {
    std::lock_guard lock(mutex_);
    id                = next_timer_id_++;
    const auto when   = now_() + delay;
    timers_[id]       = Timer{when, std::move(task)};
    deadlines_.emplace(when, id);
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);

  auto it = timers_.find(id);
  if (it == timers_.end()) return false;

  auto range = deadlines_.equal_range(it->second.deadline);
  for (auto d = range.first; d != range.second; ++d) {
    if (d->second == id) {
      deadlines_.erase(d);
      break;
    }
  }
  timers_.erase(it);
  return true;
}

bool EventLoop::PromoteDueTimersLocked(util::TimePoint now) {
  bool promoted = false;
  while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
    const auto id = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());

    auto it = timers_.find(id);
    if (it == timers_.end()) continue;

    ready_.push_back(std::move(it->second.task));
    timers_.erase(it);
    promoted = true;
  }
  return promoted;
}

void EventLoop::Execute(Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    HACKTRACKER_LOG_ERROR("event loop task failed", {observability::StringField("error", e.what())});
  }
}

std::size_t EventLoop::RunUntilIdle() {
  std::size_t executed = 0;

  while (true) {
    Task task;
    {
      std::lock_guard lock(mutex_);
      PromoteDueTimersLocked(now_());
      if (ready_.empty()) break;

      task = std::move(ready_.front());
      ready_.pop_front();
    }

    Execute(task);
    ++executed;
  }

  return executed;
}

void EventLoop::Run() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);

      while (!shutdown_ && ready_.empty()) {
        PromoteDueTimersLocked(now_());
        if (!ready_.empty()) break;

        if (deadlines_.empty()) {
          cv_.wait(lock);
        } else {
          cv_.wait_for(lock, deadlines_.begin()->first - now_());
        }
      }

      if (shutdown_) return;

      task = std::move(ready_.front());
      ready_.pop_front();
    }

    Execute(task);
  }
}

void EventLoop::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t EventLoop::PendingTimers() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

} // namespace hacktracker::runtime
