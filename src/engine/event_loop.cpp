#include "geo_resolver/event_loop.hpp"

#include <algorithm>

#include <sys/select.h>

namespace geo_resolver {

EventLoop::EventLoop(std::unique_ptr<IClock> clock) : clock_(std::move(clock)) {
  manual_ = dynamic_cast<ManualClock *>(clock_.get());
}

TimerId EventLoop::schedule(Millis delay, std::function<void()> fn) {
  return schedule_at(now() + std::max(delay, Millis(0)), std::move(fn));
}

TimerId EventLoop::schedule_at(TimePoint deadline, std::function<void()> fn) {
  const TimerId id = ++next_id_;
  callbacks_[id] = std::move(fn);
  timers_.push({deadline, id});
  return id;
}

bool EventLoop::cancel(TimerId id) { return callbacks_.erase(id) > 0; }

void EventLoop::watch(int fd, unsigned events, std::function<void(unsigned)> fn) {
  watches_[fd] = {events, std::move(fn), ++next_watch_id_};
}

void EventLoop::unwatch(int fd) { watches_.erase(fd); }

void EventLoop::drop_cancelled() {
  while (!timers_.empty() && !callbacks_.contains(timers_.top().id))
    timers_.pop();
}

std::optional<TimePoint> EventLoop::next_deadline() {
  drop_cancelled();
  if (timers_.empty())
    return std::nullopt;
  return timers_.top().deadline;
}

std::size_t EventLoop::run_due() {
  std::size_t fired = 0;
  while (true) {
    drop_cancelled();
    if (timers_.empty() || timers_.top().deadline > now())
      break;
    const auto id = timers_.top().id;
    timers_.pop();
    auto it = callbacks_.find(id);
    auto fn = std::move(it->second);
    callbacks_.erase(it);
    fn();
    ++fired;
  }
  return fired;
}

void EventLoop::run_once(Millis max_wait) {
  run_due();
  Millis wait = max_wait;
  if (auto next = next_deadline()) {
    auto until = std::chrono::duration_cast<Millis>(*next - now());
    wait = std::clamp(until, Millis(0), max_wait);
  }

  fd_set readfds, writefds;
  FD_ZERO(&readfds);
  FD_ZERO(&writefds);
  int maxfd = -1;
  for (const auto &[fd, w] : watches_) {
    if (w.events & kFdRead)
      FD_SET(fd, &readfds);
    if (w.events & kFdWrite)
      FD_SET(fd, &writefds);
    maxfd = std::max(maxfd, fd);
  }
  timeval tv{static_cast<time_t>(wait.count() / 1000),
             static_cast<suseconds_t>((wait.count() % 1000) * 1000)};
  const int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
  if (n > 0) {
    struct Ready {
      int fd;
      std::uint64_t id;
      unsigned mask;
    };
    std::vector<Ready> ready;
    for (const auto &[fd, w] : watches_) {
      unsigned mask = 0;
      if (FD_ISSET(fd, &readfds))
        mask |= kFdRead;
      if (FD_ISSET(fd, &writefds))
        mask |= kFdWrite;
      if (mask)
        ready.push_back({fd, w.id, mask});
    }
    for (const auto &[fd, id, mask] : ready) {
      // An earlier callback may have closed or replaced this watch; a
      // replacement on a reused fd was not part of this select().
      auto it = watches_.find(fd);
      if (it == watches_.end() || it->second.id != id)
        continue;
      auto fn = it->second.fn;
      fn(mask);
    }
  }
  run_due();
}

bool EventLoop::advance(Millis delay) {
  if (!manual_)
    return false;
  const TimePoint target = now() + delay;
  run_due();
  while (true) {
    auto next = next_deadline();
    if (!next.has_value() || *next > target)
      break;
    if (*next > now())
      manual_->set(*next);
    run_due();
  }
  manual_->set(target);
  run_due();
  return true;
}

} // namespace geo_resolver
