#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "core/error.hpp"

namespace remex {

using Clock = std::chrono::steady_clock;

enum class FutureStatus {
  Pending,
  Running,
  Finished,
  Cancelled,
};

auto to_string(FutureStatus status) -> std::string_view;

/// Convert a relative wait budget into an absolute deadline (unset waits forever).
inline auto deadline_after(std::optional<Clock::duration> timeout)
    -> std::optional<Clock::time_point> {
  if (!timeout) {
    return std::nullopt;
  }
  return Clock::now() + *timeout;
}

/// Type-erased shared state behind every result-handle.
///
/// A state resolves exactly once: to a value (held by TypedState<T>), to an
/// ExecError, or to Cancelled. Done callbacks run outside the lock, once, in
/// registration order.
class FutureState {
public:
  FutureState() = default;
  virtual ~FutureState() = default;

  FutureState(const FutureState &) = delete;
  auto operator=(const FutureState &) -> FutureState & = delete;

  auto status() const -> FutureStatus;
  auto running() const -> bool;
  auto cancelled() const -> bool;
  /// True once Finished or Cancelled.
  auto done() const -> bool;

  /// Cancel while still Pending. Returns true when the state ends up
  /// cancelled; false when it is already running or finished.
  auto cancel() -> bool;
  /// Pending -> Running. Returns false when the state was cancelled first.
  auto set_running_or_notify_cancel() -> bool;
  /// Resolve with an error. Returns false when already done.
  auto set_error(ExecError error) -> bool;

  /// Block until done.
  auto wait() const -> void;
  /// Block until done or the deadline passes. Returns true when done.
  auto wait_until(std::optional<Clock::time_point> deadline) const -> bool;

  /// Run the callback once done (immediately, on this thread, when already done).
  auto add_done_callback(std::function<void()> callback) -> void;

  /// Error the state finished with; nullopt while unresolved or on success.
  auto error() const -> std::optional<ExecError>;

protected:
  auto done_locked() const -> bool {
    return status_ == FutureStatus::Finished ||
           status_ == FutureStatus::Cancelled;
  }

  /// Mark Finished (with an optional error), wake waiters, release the lock
  /// and fire callbacks.
  auto finish_locked(std::unique_lock<std::mutex> &lock,
                     std::optional<ExecError> error) -> void;

  mutable std::mutex mutex_;
  FutureStatus status_ = FutureStatus::Pending;
  std::optional<ExecError> error_;

private:
  auto settle_locked(std::unique_lock<std::mutex> &lock, FutureStatus status)
      -> void;

  mutable std::condition_variable cv_;
  std::vector<std::function<void()>> callbacks_;
};

template <typename T> class TypedState final : public FutureState {
public:
  using Stored = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  auto set_value(Stored value) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    if (done_locked()) {
      return false;
    }
    value_.emplace(std::move(value));
    finish_locked(lock, std::nullopt);
    return true;
  }

  auto get(std::optional<Clock::time_point> deadline) const -> Expected<T> {
    if (!wait_until(deadline)) {
      return tl::unexpected(make_error(ErrorCode::Timeout,
                                       "result not available before the deadline"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == FutureStatus::Cancelled) {
      return tl::unexpected(make_error(ErrorCode::Cancelled, "task was cancelled"));
    }
    if (error_) {
      return tl::unexpected(*error_);
    }
    if constexpr (std::is_void_v<T>) {
      return {};
    } else {
      return *value_;
    }
  }

private:
  std::optional<Stored> value_;
};

/// Caller-facing result-handle. Copies share the same state.
template <typename T> class Future {
public:
  Future() = default;
  explicit Future(std::shared_ptr<TypedState<T>> state)
      : state_(std::move(state)) {}

  auto valid() const -> bool { return state_ != nullptr; }

  /// Wait up to `timeout` and return the value or the error the task produced.
  auto result(std::optional<Clock::duration> timeout = std::nullopt) const
      -> Expected<T> {
    return state_->get(deadline_after(timeout));
  }

  auto result_until(std::optional<Clock::time_point> deadline) const
      -> Expected<T> {
    return state_->get(deadline);
  }

  /// Error of a failed task; nullopt on success. Timeout or Cancelled errors
  /// are returned when the wait expires or the task was cancelled.
  auto exception(std::optional<Clock::duration> timeout = std::nullopt) const
      -> std::optional<ExecError> {
    auto value = result(timeout);
    if (value) {
      return std::nullopt;
    }
    return value.error();
  }

  auto wait(std::optional<Clock::duration> timeout = std::nullopt) const
      -> bool {
    return state_->wait_until(deadline_after(timeout));
  }

  auto cancel() const -> bool { return state_->cancel(); }
  auto cancelled() const -> bool { return state_->cancelled(); }
  auto running() const -> bool { return state_->running(); }
  auto done() const -> bool { return state_->done(); }
  auto status() const -> FutureStatus { return state_->status(); }

  auto add_done_callback(std::function<void(const Future<T> &)> callback) const
      -> void {
    std::weak_ptr<TypedState<T>> weak = state_;
    state_->add_done_callback([weak, callback = std::move(callback)]() {
      if (auto state = weak.lock()) {
        callback(Future<T>(std::move(state)));
      }
    });
  }

  auto state() const -> std::shared_ptr<FutureState> { return state_; }

private:
  std::shared_ptr<TypedState<T>> state_;
};

/// Producer side of a result-handle. Copies share the same state.
template <typename T> class Promise {
public:
  Promise() : state_(std::make_shared<TypedState<T>>()) {}

  auto get_future() const -> Future<T> { return Future<T>(state_); }

  auto set_running_or_notify_cancel() const -> bool {
    return state_->set_running_or_notify_cancel();
  }

  auto set_value(typename TypedState<T>::Stored value) const -> bool
    requires(!std::is_void_v<T>)
  {
    return state_->set_value(std::move(value));
  }

  auto set_value() const -> bool
    requires std::is_void_v<T>
  {
    return state_->set_value(std::monostate{});
  }

  auto set_error(ExecError error) const -> bool {
    return state_->set_error(std::move(error));
  }

  auto state() const -> std::shared_ptr<FutureState> { return state_; }

private:
  std::shared_ptr<TypedState<T>> state_;
};

} // namespace remex
