#include "backend/cluster.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <unistd.h>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace remex::backend {
namespace detail {

struct WorkerCore {
  explicit WorkerCore(WorkerId worker_id) : id(worker_id), mailbox(1) {}

  ~WorkerCore() { stdexec::sync_wait(scope.on_empty()); }

  WorkerId id;
  exec::static_thread_pool mailbox;
  exec::async_scope scope;
  std::atomic<bool> alive{true};
};

struct ClusterCore {
  ClusterCore(ClusterOptions cluster_options, std::string cluster_address,
              int cpus)
      : options(std::move(cluster_options)),
        address(std::move(cluster_address)), num_cpus(cpus),
        pool(static_cast<std::uint32_t>(cpus)) {}

  ~ClusterCore() { stdexec::sync_wait(scope.on_empty()); }

  ClusterOptions options;
  std::string address;
  int num_cpus = 0;
  exec::static_thread_pool pool;
  exec::async_scope scope;

  std::mutex mutex;
  std::atomic<bool> running{true};
  std::unordered_map<WorkerId, std::shared_ptr<WorkerCore>> workers;
  WorkerId next_worker_id = 1;

  std::atomic<std::uint64_t> submitted{0};
  std::atomic<std::uint64_t> completed{0};
  std::atomic<std::uint64_t> aborted{0};
  std::atomic<std::uint64_t> workers_spawned{0};
};

struct WorkerLease {
  WorkerId id = 0;
  std::weak_ptr<ClusterCore> cluster;

  // Retire the worker: unregister it and let a CPU slot drain and join its
  // mailbox, so the join never runs on the mailbox thread itself.
  ~WorkerLease() {
    auto owner = cluster.lock();
    if (!owner) {
      return;
    }
    std::lock_guard<std::mutex> lock(owner->mutex);
    if (!owner->running.load(std::memory_order_acquire)) {
      return;
    }
    auto it = owner->workers.find(id);
    if (it == owner->workers.end()) {
      return;
    }
    auto retired = std::move(it->second);
    owner->workers.erase(it);
    remex::log::debug("retiring worker {} on {}", id, owner->address);
    owner->scope.spawn(stdexec::schedule(owner->pool.get_scheduler()) |
                       stdexec::then([retired = std::move(retired)]() mutable {
                         retired.reset();
                       }));
  }
};

} // namespace detail

namespace {

std::mutex g_directory_mutex;
std::vector<std::pair<std::string, std::weak_ptr<Cluster>>> g_directory;
std::atomic<std::uint64_t> g_cluster_seq{0};

auto resolve_cpus(int requested) -> int {
  if (requested > 0) {
    return requested;
  }
  auto hw = static_cast<int>(std::thread::hardware_concurrency());
  return hw > 0 ? hw : 1;
}

auto register_cluster(const std::string &address,
                      const std::shared_ptr<Cluster> &cluster) -> void {
  std::lock_guard<std::mutex> lock(g_directory_mutex);
  std::erase_if(g_directory,
                [](const auto &entry) { return entry.second.expired(); });
  g_directory.emplace_back(address, cluster);
}

auto unregister_cluster(const std::string &address) -> void {
  std::lock_guard<std::mutex> lock(g_directory_mutex);
  std::erase_if(g_directory, [&](const auto &entry) {
    return entry.first == address || entry.second.expired();
  });
}

auto worker_died(WorkerId id, const std::string &task_name) -> ExecError {
  return make_error(
      ErrorCode::WorkerDied,
      std::format("worker {} died before running task '{}'", id, task_name));
}

auto post_to_worker(detail::WorkerCore &worker, TaskEnvelope envelope)
    -> void {
  auto *target = &worker;
  worker.scope.spawn(
      stdexec::schedule(worker.mailbox.get_scheduler()) |
      stdexec::then([target, envelope = std::move(envelope)]() mutable {
        if (!target->alive.load(std::memory_order_acquire)) {
          envelope.abort(worker_died(target->id, envelope.name));
          return;
        }
        envelope.run();
      }));
}

// Workers are only reached through the cluster registry, under its lock, so
// the registry (or a retire job) always holds the last reference.
template <typename Fn>
auto with_worker(const detail::WorkerLease *lease, Fn &&fn) -> bool {
  if (lease == nullptr) {
    return false;
  }
  auto owner = lease->cluster.lock();
  if (!owner) {
    return false;
  }
  std::lock_guard<std::mutex> lock(owner->mutex);
  if (!owner->running.load(std::memory_order_acquire)) {
    return false;
  }
  auto it = owner->workers.find(lease->id);
  if (it == owner->workers.end()) {
    return false;
  }
  return fn(*it->second);
}

} // namespace

auto WorkerHandle::id() const -> WorkerId { return lease_ ? lease_->id : 0; }

auto WorkerHandle::alive() const -> bool {
  return with_worker(lease_.get(), [](detail::WorkerCore &worker) {
    return worker.alive.load(std::memory_order_acquire);
  });
}

auto WorkerHandle::invoke(TaskEnvelope envelope) const -> void {
  // Aborting runs completion callbacks, which must not see the cluster lock.
  const bool posted =
      with_worker(lease_.get(), [&envelope](detail::WorkerCore &worker) {
        if (!worker.alive.load(std::memory_order_acquire)) {
          return false;
        }
        post_to_worker(worker, std::move(envelope));
        return true;
      });
  if (!posted) {
    envelope.abort(worker_died(id(), envelope.name));
  }
}

auto WorkerHandle::kill() const -> void {
  const bool killed =
      with_worker(lease_.get(), [](detail::WorkerCore &worker) {
        return worker.alive.exchange(false, std::memory_order_acq_rel);
      });
  if (killed) {
    remex::log::info("worker {} killed", id());
  }
}

Cluster::Cluster(std::shared_ptr<detail::ClusterCore> core)
    : core_(std::move(core)) {}

Cluster::~Cluster() { stop(); }

auto Cluster::start(ClusterOptions options)
    -> Expected<std::shared_ptr<Cluster>> {
  remex::log::init();
  if (options.num_cpus < 0) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        std::format("num_cpus={} is given; num_cpus must be >= 0",
                    options.num_cpus)));
  }
  const int cpus = resolve_cpus(options.num_cpus);
  auto address = std::format("local://{}-{}", ::getpid(),
                             g_cluster_seq.fetch_add(1) + 1);

  std::shared_ptr<detail::ClusterCore> core;
  try {
    core = std::make_shared<detail::ClusterCore>(std::move(options), address,
                                                 cpus);
  } catch (const std::system_error &ex) {
    return tl::unexpected(
        make_error(ErrorCode::BackendUnavailable,
                   std::format("failed to start cluster: {}", ex.what())));
  }

  std::shared_ptr<Cluster> cluster(new Cluster(std::move(core)));
  register_cluster(address, cluster);
  remex::log::info("cluster started", {{"address", address},
                                       {"num_cpus", std::to_string(cpus)}});
  return cluster;
}

auto Cluster::find(std::string_view address) -> std::shared_ptr<Cluster> {
  std::lock_guard<std::mutex> lock(g_directory_mutex);
  for (const auto &[entry_address, weak] : g_directory) {
    if (entry_address != address) {
      continue;
    }
    auto cluster = weak.lock();
    if (cluster && cluster->running()) {
      return cluster;
    }
  }
  return nullptr;
}

auto Cluster::latest() -> std::shared_ptr<Cluster> {
  std::lock_guard<std::mutex> lock(g_directory_mutex);
  for (auto it = g_directory.rbegin(); it != g_directory.rend(); ++it) {
    auto cluster = it->second.lock();
    if (cluster && cluster->running()) {
      return cluster;
    }
  }
  return nullptr;
}

auto Cluster::address() const -> const std::string & { return core_->address; }

auto Cluster::namespace_name() const -> const std::string & {
  return core_->options.namespace_name;
}

auto Cluster::num_cpus() const -> int { return core_->num_cpus; }

auto Cluster::running() const -> bool {
  return core_->running.load(std::memory_order_acquire);
}

auto Cluster::submit(TaskEnvelope envelope) -> void {
  auto *core = core_.get();
  std::unique_lock<std::mutex> lock(core->mutex);
  if (!core->running.load(std::memory_order_acquire)) {
    lock.unlock();
    core->aborted.fetch_add(1, std::memory_order_relaxed);
    auto name = envelope.name;
    envelope.abort(make_error(
        ErrorCode::BackendUnavailable,
        std::format("cluster {} is not running; task '{}' was not scheduled",
                    core->address, name)));
    return;
  }
  core->submitted.fetch_add(1, std::memory_order_relaxed);
  core->scope.spawn(
      stdexec::schedule(core->pool.get_scheduler()) |
      stdexec::then([core, envelope = std::move(envelope)]() mutable {
        if (!core->running.load(std::memory_order_acquire)) {
          core->aborted.fetch_add(1, std::memory_order_relaxed);
          envelope.abort(make_error(
              ErrorCode::BackendUnavailable,
              std::format("cluster {} shut down before task '{}' started",
                          core->address, envelope.name)));
          return;
        }
        envelope.run();
        core->completed.fetch_add(1, std::memory_order_relaxed);
      }));
}

auto Cluster::spawn_worker() -> Expected<WorkerHandle> {
  std::shared_ptr<detail::WorkerCore> worker;
  WorkerId id = 0;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    if (!core_->running.load(std::memory_order_acquire)) {
      return tl::unexpected(make_error(
          ErrorCode::BackendUnavailable,
          std::format("cluster {} is not running", core_->address)));
    }
    id = core_->next_worker_id++;
    try {
      worker = std::make_shared<detail::WorkerCore>(id);
    } catch (const std::system_error &ex) {
      return tl::unexpected(
          make_error(ErrorCode::BackendUnavailable,
                     std::format("failed to spawn worker: {}", ex.what())));
    }
    core_->workers.emplace(id, worker);
  }
  core_->workers_spawned.fetch_add(1, std::memory_order_relaxed);

  auto lease = std::make_shared<detail::WorkerLease>();
  lease->id = id;
  lease->cluster = core_;
  remex::log::debug("spawned worker {} on {}", id, core_->address);
  return WorkerHandle(std::move(lease));
}

auto Cluster::stop() -> void {
  std::unordered_map<WorkerId, std::shared_ptr<detail::WorkerCore>> workers;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    if (!core_->running.load(std::memory_order_acquire)) {
      return;
    }
    core_->running.store(false, std::memory_order_release);
    workers.swap(core_->workers);
  }

  for (auto &[id, worker] : workers) {
    worker->alive.store(false, std::memory_order_release);
  }
  stdexec::sync_wait(core_->scope.on_empty());
  workers.clear();

  unregister_cluster(core_->address);
  remex::log::info(
      "cluster stopped",
      {{"address", core_->address},
       {"completed", std::to_string(core_->completed.load())},
       {"aborted", std::to_string(core_->aborted.load())}});
}

auto Cluster::stats() const -> ClusterStats {
  ClusterStats stats;
  stats.submitted = core_->submitted.load(std::memory_order_relaxed);
  stats.completed = core_->completed.load(std::memory_order_relaxed);
  stats.aborted = core_->aborted.load(std::memory_order_relaxed);
  stats.workers_spawned =
      core_->workers_spawned.load(std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(core_->mutex);
  for (const auto &[id, worker] : core_->workers) {
    if (worker->alive.load(std::memory_order_acquire)) {
      stats.workers_alive += 1;
    }
  }
  return stats;
}

} // namespace remex::backend
