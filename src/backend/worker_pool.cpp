#include "backend/worker_pool.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <vector>

#include "common/logging/log.hpp"

namespace remex::backend {

namespace detail {

struct PoolState {
  mutable std::mutex mutex;
  std::vector<WorkerHandle> workers;
  std::deque<WorkerHandle> idle;
  std::deque<PoolJob> pending;
  TaskIndex next_index = 0;
};

} // namespace detail

namespace {

using StateRef = std::shared_ptr<detail::PoolState>;

auto no_workers_left() -> ExecError {
  return make_error(ErrorCode::WorkerDied,
                    "every worker in the pool has died");
}

auto release(const StateRef &state, const WorkerHandle &worker) -> void;

// The done callback keeps the pool state alive until the job settles.
auto dispatch(const StateRef &state, const WorkerHandle &worker, PoolJob job)
    -> void {
  job.start(worker);
  job.handle->add_done_callback(
      [state, worker]() { release(state, worker); });
}

auto release(const StateRef &state, const WorkerHandle &worker) -> void {
  const bool alive = worker.alive();
  std::vector<PoolJob> orphaned;
  std::optional<PoolJob> next;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (!alive) {
      std::erase(state->workers, worker);
      remex::log::warn("dropped dead worker {} from pool ({} left)",
                       worker.id(), state->workers.size());
      if (state->workers.empty()) {
        orphaned.assign(std::make_move_iterator(state->pending.begin()),
                        std::make_move_iterator(state->pending.end()));
        state->pending.clear();
      }
    } else {
      while (!state->pending.empty()) {
        auto job = std::move(state->pending.front());
        state->pending.pop_front();
        if (job.handle->done()) {
          continue;
        }
        next = std::move(job);
        break;
      }
      if (!next) {
        state->idle.push_back(worker);
      }
    }
  }

  for (auto &job : orphaned) {
    job.handle->set_error(no_workers_left());
  }
  if (next) {
    dispatch(state, worker, std::move(*next));
  }
}

} // namespace

WorkerPool::WorkerPool(std::shared_ptr<detail::PoolState> state)
    : state_(std::move(state)) {}

WorkerPool::~WorkerPool() = default;

auto WorkerPool::create(Cluster &cluster, int size)
    -> Expected<std::unique_ptr<WorkerPool>> {
  if (size < 1) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        std::format("pool size={} is given; pool size must be >= 1", size)));
  }
  auto state = std::make_shared<detail::PoolState>();
  state->workers.reserve(static_cast<std::size_t>(size));
  for (int i = 0; i < size; ++i) {
    auto worker = cluster.spawn_worker();
    if (!worker) {
      return tl::unexpected(worker.error());
    }
    state->workers.push_back(*worker);
    state->idle.push_back(*worker);
  }
  remex::log::info("worker pool created", {{"address", cluster.address()},
                                           {"size", std::to_string(size)}});
  return std::unique_ptr<WorkerPool>(new WorkerPool(std::move(state)));
}

auto WorkerPool::submit(PoolJob job) -> TaskIndex {
  TaskIndex index = 0;
  std::optional<WorkerHandle> worker;
  bool orphaned = false;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    index = state_->next_index++;
    if (state_->workers.empty()) {
      orphaned = true;
    } else if (!state_->idle.empty()) {
      worker = std::move(state_->idle.front());
      state_->idle.pop_front();
    } else {
      state_->pending.push_back(std::move(job));
    }
  }

  if (orphaned) {
    job.handle->set_error(no_workers_left());
  } else if (worker) {
    dispatch(state_, *worker, std::move(job));
  }
  return index;
}

auto WorkerPool::size() const -> std::size_t {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->workers.size();
}

auto WorkerPool::idle_count() const -> std::size_t {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->idle.size();
}

auto WorkerPool::pending_count() const -> std::size_t {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->pending.size();
}

auto WorkerPool::has_free() const -> bool {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return !state_->idle.empty();
}

auto WorkerPool::next_task_index() const -> TaskIndex {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->next_index;
}

} // namespace remex::backend
