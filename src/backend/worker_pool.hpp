#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "backend/cluster.hpp"
#include "backend/remote.hpp"
#include "core/error.hpp"
#include "core/future.hpp"

namespace remex::backend {

using TaskIndex = std::uint64_t;

namespace detail {
struct PoolState;
} // namespace detail

/// Work item for a pool: `start` is called once with the worker chosen for
/// the job, and `handle` tells the pool when the worker is free again.
struct PoolJob {
  std::shared_ptr<FutureState> handle;
  std::function<void(const WorkerHandle &)> start;
};

/// Fixed set of workers that run queued jobs on whichever worker is idle.
///
/// A worker goes back to the idle set when the handle of its job is done
/// (finished or cancelled) and immediately picks up the oldest pending job
/// that has not been cancelled. The pool state outlives the WorkerPool
/// object while jobs are still in flight.
class WorkerPool {
public:
  static auto create(Cluster &cluster, int size)
      -> Expected<std::unique_ptr<WorkerPool>>;

  WorkerPool(const WorkerPool &) = delete;
  auto operator=(const WorkerPool &) -> WorkerPool & = delete;

  ~WorkerPool();

  /// Hand the job to an idle worker or queue it. Returns the job's index.
  auto submit(PoolJob job) -> TaskIndex;

  /// Run `fn` on the next free worker.
  template <typename Fn>
  auto submit_task(std::string name, Fn fn)
      -> std::pair<TaskIndex, Future<std::invoke_result_t<Fn &>>> {
    using R = std::invoke_result_t<Fn &>;
    Promise<R> promise;
    auto future = promise.get_future();
    PoolJob job;
    job.handle = promise.state();
    job.start = [promise, name = std::move(name),
                 fn = std::move(fn)](const WorkerHandle &worker) mutable {
      worker.invoke(detail::make_envelope<R>(std::move(name), promise,
                                             std::move(fn)));
    };
    auto index = submit(std::move(job));
    return {index, std::move(future)};
  }

  auto size() const -> std::size_t;
  auto idle_count() const -> std::size_t;
  auto pending_count() const -> std::size_t;
  auto has_free() const -> bool;
  /// Index the next submitted job will receive.
  auto next_task_index() const -> TaskIndex;

private:
  explicit WorkerPool(std::shared_ptr<detail::PoolState> state);

  std::shared_ptr<detail::PoolState> state_;
};

} // namespace remex::backend
