#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "backend/remote.hpp"
#include "backend/session.hpp"
#include "backend/worker_pool.hpp"
#include "core/completion_queue.hpp"
#include "core/error.hpp"
#include "core/future.hpp"
#include "core/json.hpp"
#include "runtime/map_result.hpp"

namespace remex {

struct ExecutorConfig {
  /// Fixed worker count. Unset spreads tasks over the cluster's CPU slots.
  std::optional<int> max_workers;
  /// Tear the backend session down on shutdown(). When false, shutdown()
  /// only forgets the issued handles.
  bool shutdown_backend = false;
  /// Backend init options, see backend::parse_init_options.
  Json backend;
};

struct MapOptions {
  /// Budget for the whole result sequence (unset waits forever).
  std::optional<Clock::duration> timeout;
  /// Accepted for interface compatibility; ignored.
  int chunksize = 1;
};

struct ShutdownOptions {
  bool wait = true;
  bool cancel_futures = false;
};

template <typename Fn, typename... Ranges>
using map_result_t = std::invoke_result_t<
    Fn &, std::remove_cvref_t<std::ranges::range_reference_t<Ranges>> &...>;

/// Executor that runs tasks on the backend cluster.
///
/// Without `max_workers` every task is an independent remote call and map()
/// yields results in submission order. With `max_workers` tasks go through a
/// fixed WorkerPool and map() yields results as they complete.
class Executor {
public:
  /// Initialize (or attach to) the backend session and build the executor.
  static auto create(ExecutorConfig config = {})
      -> Expected<std::unique_ptr<Executor>>;

  Executor(const Executor &) = delete;
  auto operator=(const Executor &) -> Executor & = delete;
  Executor(Executor &&) = delete;
  auto operator=(Executor &&) -> Executor & = delete;

  /// Runs shutdown() with default options.
  ~Executor();

  /// Schedule `fn(args...)`. Arguments are copied into the task.
  template <typename Fn, typename... Args>
  auto submit(Fn fn, Args... args)
      -> Expected<Future<std::invoke_result_t<Fn &, Args &...>>> {
    return submit_named(backend::detail::callable_name<Fn>(), std::move(fn),
                        std::move(args)...);
  }

  template <typename Fn, typename... Args>
  auto submit_named(std::string name, Fn fn, Args... args)
      -> Expected<Future<std::invoke_result_t<Fn &, Args &...>>> {
    auto task = [fn = std::move(fn), ... args = std::move(args)]() mutable {
      return std::invoke(fn, args...);
    };
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return tl::unexpected(after_shutdown());
    }
    auto future = dispatch_locked(std::move(name), std::move(task));
    futures_.push_back(future.state());
    return future;
  }

  /// Apply `fn` to the zipped `ranges`; the shortest range bounds the count.
  /// The timeout runs from this call. The ranges are read before the
  /// executor is locked, and every task is submitted before this returns.
  template <typename Fn, std::ranges::input_range... Ranges>
  auto map(MapOptions options, Fn fn, Ranges &&...ranges)
      -> Expected<MapResult<map_result_t<Fn, Ranges...>>> {
    static_assert(sizeof...(Ranges) > 0,
                  "map needs at least one input range");
    using R = map_result_t<Fn, Ranges...>;
    using ArgTuple =
        std::tuple<std::remove_cvref_t<std::ranges::range_reference_t<Ranges>>...>;

    const auto deadline = deadline_after(options.timeout);
    std::vector<ArgTuple> inputs;
    auto its = std::make_tuple(std::ranges::begin(ranges)...);
    const auto ends = std::make_tuple(std::ranges::end(ranges)...);
    while (!any_at_end(its, ends)) {
      std::apply([&](auto &...it) { inputs.emplace_back(*it...); }, its);
      std::apply([](auto &...it) { (++it, ...); }, its);
    }

    const auto name = backend::detail::callable_name<Fn>();
    std::vector<Future<R>> futures;
    futures.reserve(inputs.size());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_) {
        return tl::unexpected(after_shutdown());
      }
      for (auto &args : inputs) {
        auto future = dispatch_locked(
            name, [fn, args = std::move(args)]() mutable {
              return std::apply(fn, args);
            });
        futures_.push_back(future.state());
        futures.push_back(std::move(future));
      }
    }

    if (!pool_) {
      return MapResult<R>::in_submission_order(std::move(futures), deadline);
    }
    CompletionQueue<R> queue;
    for (auto &future : futures) {
      queue.push(std::move(future));
    }
    return MapResult<R>::in_completion_order(std::move(queue), deadline);
  }

  template <typename Fn, std::ranges::input_range... Ranges>
    requires(!std::same_as<std::remove_cvref_t<Fn>, MapOptions>)
  auto map(Fn fn, Ranges &&...ranges)
      -> Expected<MapResult<map_result_t<Fn, Ranges...>>> {
    return map(MapOptions{}, std::move(fn), std::forward<Ranges>(ranges)...);
  }

  /// Idempotent. Only an executor configured with `shutdown_backend` stops
  /// accepting work and tears the backend down; otherwise the issued handles
  /// are forgotten and nothing else happens.
  auto shutdown(ShutdownOptions options = {}) -> void;

  auto is_shutdown() const -> bool;
  auto max_workers() const -> std::optional<int> { return config_.max_workers; }
  auto context() const -> const std::shared_ptr<backend::Context> & {
    return context_;
  }
  /// Null without `max_workers`.
  auto worker_pool() const -> backend::WorkerPool * { return pool_.get(); }
  /// Handles issued since the last shutdown().
  auto outstanding() const -> std::size_t;

private:
  Executor(ExecutorConfig config, std::shared_ptr<backend::Context> context,
           std::shared_ptr<backend::Cluster> cluster,
           std::unique_ptr<backend::WorkerPool> pool);

  static auto after_shutdown() -> ExecError;

  template <typename Task>
  auto dispatch_locked(std::string name, Task task)
      -> Future<std::invoke_result_t<Task &>> {
    if (pool_) {
      auto submitted = pool_->submit_task(std::move(name), std::move(task));
      return std::move(submitted.second);
    }
    return backend::submit_remote(*cluster_, std::move(name), std::move(task));
  }

  template <typename Its, typename Ends>
  static auto any_at_end(const Its &its, const Ends &ends) -> bool {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
      return ((std::get<I>(its) == std::get<I>(ends)) || ...);
    }(std::make_index_sequence<std::tuple_size_v<Its>>{});
  }

  ExecutorConfig config_;
  std::shared_ptr<backend::Context> context_;
  std::shared_ptr<backend::Cluster> cluster_;
  std::unique_ptr<backend::WorkerPool> pool_;

  mutable std::mutex mutex_;
  bool shutdown_ = false;
  std::vector<std::shared_ptr<FutureState>> futures_;
};

} // namespace remex
