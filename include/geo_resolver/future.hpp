#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace geo_resolver {

// Single-threaded promise/future pair. Both sides are cheap handles onto one
// shared state, so they can be copied into callbacks freely. Continuations
// run on the thread that fulfils the promise, in registration order.

namespace detail {
template <typename T> struct SharedState {
  std::optional<T> value;
  std::vector<std::function<void(const T &)>> callbacks;
};
} // namespace detail

template <typename T> class Promise;

template <typename T> class Future {
public:
  Future() = default;

  bool valid() const { return state_ != nullptr; }
  bool ready() const { return state_ && state_->value.has_value(); }
  const T &get() const { return *state_->value; }

  // Runs fn immediately when the value is already available.
  void then(std::function<void(const T &)> fn) const {
    if (ready()) {
      fn(*state_->value);
      return;
    }
    state_->callbacks.push_back(std::move(fn));
  }

  bool same_state(const Future &other) const { return state_ == other.state_; }

private:
  friend class Promise<T>;
  explicit Future(std::shared_ptr<detail::SharedState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::SharedState<T>> state_;
};

template <typename T> class Promise {
public:
  Promise() : state_(std::make_shared<detail::SharedState<T>>()) {}

  Future<T> future() const { return Future<T>(state_); }
  bool fulfilled() const { return state_->value.has_value(); }

  // First value wins; later calls return false and are dropped.
  bool set_value(T value) const {
    if (state_->value.has_value())
      return false;
    auto state = state_;
    state->value = std::move(value);
    auto callbacks = std::move(state->callbacks);
    state->callbacks.clear();
    for (auto &cb : callbacks)
      cb(*state->value);
    return true;
  }

private:
  std::shared_ptr<detail::SharedState<T>> state_;
};

template <typename T> Future<T> make_ready_future(T value) {
  Promise<T> p;
  p.set_value(std::move(value));
  return p.future();
}

} // namespace geo_resolver
