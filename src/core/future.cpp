#include "core/future.hpp"

#include <exception>

#include "common/logging/log.hpp"

namespace remex {

auto to_string(FutureStatus status) -> std::string_view {
  switch (status) {
  case FutureStatus::Pending:
    return "PENDING";
  case FutureStatus::Running:
    return "RUNNING";
  case FutureStatus::Finished:
    return "FINISHED";
  case FutureStatus::Cancelled:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

auto FutureState::status() const -> FutureStatus {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

auto FutureState::running() const -> bool {
  return status() == FutureStatus::Running;
}

auto FutureState::cancelled() const -> bool {
  return status() == FutureStatus::Cancelled;
}

auto FutureState::done() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_locked();
}

auto FutureState::cancel() -> bool {
  std::unique_lock<std::mutex> lock(mutex_);
  if (status_ == FutureStatus::Cancelled) {
    return true;
  }
  if (status_ != FutureStatus::Pending) {
    return false;
  }
  settle_locked(lock, FutureStatus::Cancelled);
  return true;
}

auto FutureState::set_running_or_notify_cancel() -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ != FutureStatus::Pending) {
    return false;
  }
  status_ = FutureStatus::Running;
  return true;
}

auto FutureState::set_error(ExecError error) -> bool {
  std::unique_lock<std::mutex> lock(mutex_);
  if (done_locked()) {
    return false;
  }
  finish_locked(lock, std::move(error));
  return true;
}

auto FutureState::wait() const -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return done_locked(); });
}

auto FutureState::wait_until(std::optional<Clock::time_point> deadline) const
    -> bool {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!deadline) {
    cv_.wait(lock, [this]() { return done_locked(); });
    return true;
  }
  return cv_.wait_until(lock, *deadline, [this]() { return done_locked(); });
}

auto FutureState::add_done_callback(std::function<void()> callback) -> void {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!done_locked()) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback();
}

auto FutureState::error() const -> std::optional<ExecError> {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

auto FutureState::finish_locked(std::unique_lock<std::mutex> &lock,
                                std::optional<ExecError> error) -> void {
  error_ = std::move(error);
  settle_locked(lock, FutureStatus::Finished);
}

auto FutureState::settle_locked(std::unique_lock<std::mutex> &lock,
                                FutureStatus status) -> void {
  status_ = status;
  auto callbacks = std::move(callbacks_);
  callbacks_.clear();
  cv_.notify_all();
  lock.unlock();

  for (auto &callback : callbacks) {
    try {
      callback();
    } catch (const std::exception &ex) {
      remex::log::error("done callback raised: {}", ex.what());
    } catch (...) {
      remex::log::error("done callback raised: unknown exception");
    }
  }
}

} // namespace remex
