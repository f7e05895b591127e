#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hacktracker::state {

/*
  Loading | Data(T) | Error(message)
*/
template <typename T>
class AsyncValue {
 public:
  enum class Kind { kLoading, kData, kError };

  static AsyncValue Loading() {
    return AsyncValue(Kind::kLoading, std::nullopt, {});
  }
  static AsyncValue Data(T value) {
    return AsyncValue(Kind::kData, std::move(value), {});
  }
  static AsyncValue Error(std::string message) {
    return AsyncValue(Kind::kError, std::nullopt, std::move(message));
  }

  Kind kind() const {
    return kind_;
  }
  bool IsLoading() const {
    return kind_ == Kind::kLoading;
  }
  bool HasData() const {
    return kind_ == Kind::kData;
  }
  bool HasError() const {
    return kind_ == Kind::kError;
  }

  const T& value() const {
    if (!value_) throw std::logic_error("AsyncValue holds no data");
    return *value_;
  }

  const std::string& error() const {
    return error_;
  }

 private:
  AsyncValue(Kind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {
  }

  Kind             kind_;
  std::optional<T> value_;
  std::string      error_;
};

/*
  Handle returned by Subscribe(). Destroying or resetting it detaches the
  listener. Move-only.
*/
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {
  }
  ~Subscription() {
    Reset();
  }

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
  }
  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      Reset();
      cancel_       = std::move(other.cancel_);
      other.cancel_ = nullptr;
    }
    return *this;
  }

  void Reset() {
    if (cancel_) {
      auto cancel = std::move(cancel_);
      cancel_     = nullptr;
      cancel();
    }
  }

  bool Active() const {
    return static_cast<bool>(cancel_);
  }

 private:
  std::function<void()> cancel_;
};

/*
  Published value of one collection or derived result.

  Single writer (the loop thread), any number of listeners. Set() notifies
  listeners synchronously with (previous, next). A listener detached while
  a notification is in progress is not called for that notification.

  Always owned through a shared_ptr (see Create) so subscriptions and
  in-flight mutations can outlive whoever created the value.
*/
template <typename T>
class PublishedValue : public std::enable_shared_from_this<PublishedValue<T>> {
 public:
  using State    = AsyncValue<T>;
  using Listener = std::function<void(const State& previous, const State& next)>;

  static std::shared_ptr<PublishedValue> Create() {
    return std::shared_ptr<PublishedValue>(new PublishedValue());
  }

  const State& state() const {
    return state_;
  }
  bool HasData() const {
    return state_.HasData();
  }
  const T& Data() const {
    return state_.value();
  }

  void Set(State next) {
    State previous = std::move(state_);
    state_         = std::move(next);

    std::vector<std::pair<std::uint64_t, std::shared_ptr<Listener>>> snapshot(listeners_.begin(), listeners_.end());
    for (const auto& [id, listener] : snapshot) {
      if (listeners_.count(id) == 0) continue;
      (*listener)(previous, state_);
    }
  }

  void SetData(T value) {
    Set(State::Data(std::move(value)));
  }

  Subscription Subscribe(Listener listener) {
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::make_shared<Listener>(std::move(listener)));

    std::weak_ptr<PublishedValue> weak = this->weak_from_this();
    return Subscription([weak, id] {
      if (auto self = weak.lock()) {
        self->listeners_.erase(id);
      }
    });
  }

  std::size_t ListenerCount() const {
    return listeners_.size();
  }

 private:
  PublishedValue() : state_(State::Loading()) {
  }

  State                                                state_;
  std::map<std::uint64_t, std::shared_ptr<Listener>>  listeners_;
  std::uint64_t                                        next_listener_id_ = 1;
};

} // namespace hacktracker::state
