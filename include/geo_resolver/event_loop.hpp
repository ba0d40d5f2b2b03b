#pragma once

#include "geo_resolver/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace geo_resolver {

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

class ManualClock final : public IClock {
public:
  explicit ManualClock(TimePoint start = from_epoch_ms(1700000000000))
      : now_(start) {}
  TimePoint now() const override { return now_; }
  void set(TimePoint t) { now_ = t; }
  void advance(Millis d) { now_ += d; }

private:
  TimePoint now_;
};

using TimerId = std::uint64_t;

enum FdEvents : unsigned { kFdRead = 1u, kFdWrite = 2u };

class EventLoop {
public:
  explicit EventLoop(std::unique_ptr<IClock> clock = std::make_unique<SystemClock>());

  TimePoint now() const { return clock_->now(); }

  TimerId schedule(Millis delay, std::function<void()> fn);
  TimerId schedule_at(TimePoint deadline, std::function<void()> fn);
  void post(std::function<void()> fn) { schedule(Millis(0), std::move(fn)); }
  bool cancel(TimerId id);

  // Level-triggered; fn receives the ready FdEvents mask.
  void watch(int fd, unsigned events, std::function<void(unsigned)> fn);
  void unwatch(int fd);

  std::size_t run_due();
  void run_once(Millis max_wait);

  // Manual clock only: moves time forward, firing every timer up to the
  // target in deadline order. Returns false on a system clock.
  bool advance(Millis delay);

  std::size_t pending_timers() const { return callbacks_.size(); }
  std::size_t watched_fds() const { return watches_.size(); }
  bool idle() const { return callbacks_.empty() && watches_.empty(); }
  std::optional<TimePoint> next_deadline();

private:
  struct TimerNode {
    TimePoint deadline;
    TimerId id;
    bool operator>(const TimerNode &other) const {
      if (deadline == other.deadline)
        return id > other.id;
      return deadline > other.deadline;
    }
  };
  struct Watch {
    unsigned events{0};
    std::function<void(unsigned)> fn;
    std::uint64_t id{0};
  };

  void drop_cancelled();

  std::unique_ptr<IClock> clock_;
  ManualClock *manual_{nullptr};
  std::priority_queue<TimerNode, std::vector<TimerNode>, std::greater<TimerNode>>
      timers_;
  std::unordered_map<TimerId, std::function<void()>> callbacks_;
  std::unordered_map<int, Watch> watches_;
  TimerId next_id_{0};
  std::uint64_t next_watch_id_{0};
};

} // namespace geo_resolver
