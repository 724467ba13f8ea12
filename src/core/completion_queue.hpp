#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "core/error.hpp"
#include "core/future.hpp"

namespace remex {

/// Hands out pushed futures in the order they finish.
///
/// Copies share the same queue. Futures keep resolving independently of the
/// queue; dropping the queue only stops the bookkeeping.
template <typename T> class CompletionQueue {
public:
  CompletionQueue() : shared_(std::make_shared<Shared>()) {}

  auto push(Future<T> future) -> void {
    {
      std::lock_guard<std::mutex> lock(shared_->mutex);
      shared_->outstanding += 1;
    }
    std::weak_ptr<Shared> weak = shared_;
    future.add_done_callback([weak](const Future<T> &done) {
      auto shared = weak.lock();
      if (!shared) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->ready.push_back(done);
      }
      shared->cv.notify_all();
    });
  }

  /// True while some pushed future has not been returned by next().
  auto has_next() const -> bool {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->outstanding > 0;
  }

  auto outstanding() const -> std::size_t {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->outstanding;
  }

  /// Block until a pushed future is done or the deadline passes.
  auto next(std::optional<Clock::time_point> deadline) -> Expected<Future<T>> {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    if (shared_->outstanding == 0) {
      return tl::unexpected(
          make_error(ErrorCode::IllegalState, "no outstanding results"));
    }
    auto ready = [this]() { return !shared_->ready.empty(); };
    if (!deadline) {
      shared_->cv.wait(lock, ready);
    } else if (!shared_->cv.wait_until(lock, *deadline, ready)) {
      return tl::unexpected(make_error(
          ErrorCode::Timeout, "no result completed before the deadline"));
    }
    auto future = std::move(shared_->ready.front());
    shared_->ready.pop_front();
    shared_->outstanding -= 1;
    return future;
  }

private:
  struct Shared {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Future<T>> ready;
    std::size_t outstanding = 0;
  };

  std::shared_ptr<Shared> shared_;
};

} // namespace remex
