#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/completion_queue.hpp"
#include "core/error.hpp"
#include "core/future.hpp"

namespace remex {

/// Lazy sequence of results produced by Executor::map.
///
/// Two orderings exist: submission order (handles awaited one by one, each
/// cancelled once consumed) and completion order (driven by a
/// CompletionQueue). Both share one deadline for the whole sequence, checked
/// at each element. An error element ends the sequence.
template <typename R> class MapResult {
public:
  /// What collect() gathers: the values, or only how many tasks succeeded
  /// when `R` is void.
  using Collected =
      std::conditional_t<std::is_void_v<R>, std::size_t, std::vector<R>>;

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Expected<R>;
    using difference_type = std::ptrdiff_t;
    using pointer = const Expected<R> *;
    using reference = const Expected<R> &;

    iterator() = default;
    explicit iterator(MapResult *owner) : owner_(owner) { advance(); }

    auto operator*() const -> reference { return *current_; }
    auto operator->() const -> pointer { return &*current_; }

    auto operator++() -> iterator & {
      advance();
      return *this;
    }
    auto operator++(int) -> void { advance(); }

    friend auto operator==(const iterator &it, std::default_sentinel_t)
        -> bool {
      return !it.current_.has_value();
    }

  private:
    auto advance() -> void { current_ = owner_->next(); }

    MapResult *owner_ = nullptr;
    std::optional<Expected<R>> current_;
  };

  /// `futures` in submission order.
  static auto in_submission_order(std::vector<Future<R>> futures,
                                  std::optional<Clock::time_point> deadline)
      -> MapResult {
    MapResult result(deadline);
    result.reversed_.assign(std::make_move_iterator(futures.rbegin()),
                            std::make_move_iterator(futures.rend()));
    return result;
  }

  static auto in_completion_order(CompletionQueue<R> queue,
                                  std::optional<Clock::time_point> deadline)
      -> MapResult {
    MapResult result(deadline);
    result.queue_ = std::move(queue);
    return result;
  }

  MapResult(const MapResult &) = delete;
  auto operator=(const MapResult &) -> MapResult & = delete;

  MapResult(MapResult &&other) noexcept
      : reversed_(std::move(other.reversed_)), queue_(std::move(other.queue_)),
        deadline_(other.deadline_), finished_(other.finished_) {
    other.reversed_.clear();
    other.finished_ = true;
  }

  auto operator=(MapResult &&other) noexcept -> MapResult & {
    if (this != &other) {
      cancel_remaining();
      reversed_ = std::move(other.reversed_);
      queue_ = std::move(other.queue_);
      deadline_ = other.deadline_;
      finished_ = other.finished_;
      other.reversed_.clear();
      other.finished_ = true;
    }
    return *this;
  }

  /// Cancels the submission-order handles that were never consumed.
  ~MapResult() { cancel_remaining(); }

  /// Next element, or nullopt once the sequence is over.
  auto next() -> std::optional<Expected<R>> {
    if (finished_) {
      return std::nullopt;
    }
    if (queue_) {
      return next_completed();
    }
    if (reversed_.empty()) {
      finished_ = true;
      return std::nullopt;
    }
    auto future = std::move(reversed_.back());
    reversed_.pop_back();
    auto value = future.result_until(deadline_);
    future.cancel();
    if (!value) {
      cancel_remaining();
      finished_ = true;
    }
    return value;
  }

  /// Drain the sequence, stopping at the first error.
  auto collect() -> Expected<Collected> {
    Collected collected{};
    while (auto item = next()) {
      if (!*item) {
        return tl::unexpected(item->error());
      }
      if constexpr (std::is_void_v<R>) {
        collected += 1;
      } else {
        collected.push_back(std::move(**item));
      }
    }
    return collected;
  }

  auto begin() -> iterator { return iterator(this); }
  auto end() -> std::default_sentinel_t { return {}; }

  /// Elements not handed out yet.
  auto remaining() const -> std::size_t {
    if (finished_) {
      return 0;
    }
    return queue_ ? queue_->outstanding() : reversed_.size();
  }

private:
  explicit MapResult(std::optional<Clock::time_point> deadline)
      : deadline_(deadline) {}

  auto next_completed() -> std::optional<Expected<R>> {
    if (!queue_->has_next()) {
      finished_ = true;
      return std::nullopt;
    }
    auto done = queue_->next(deadline_);
    if (!done) {
      finished_ = true;
      return Expected<R>(tl::unexpected(done.error()));
    }
    auto value = done->result();
    if (!value) {
      finished_ = true;
    }
    return value;
  }

  auto cancel_remaining() -> void {
    for (auto &future : reversed_) {
      future.cancel();
    }
    reversed_.clear();
  }

  std::vector<Future<R>> reversed_;
  std::optional<CompletionQueue<R>> queue_;
  std::optional<Clock::time_point> deadline_;
  bool finished_ = false;
};

} // namespace remex
