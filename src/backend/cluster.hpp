#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "backend/task.hpp"
#include "core/error.hpp"

namespace remex::backend {

/// Configuration for a local cluster.
struct ClusterOptions {
  /// CPU slots for remote tasks (0 uses hardware concurrency).
  int num_cpus = 0;
  /// Namespace label reported through the session context.
  std::string namespace_name = "default";
};

/// Counter snapshot for a cluster.
struct ClusterStats {
  std::uint64_t submitted = 0;
  std::uint64_t completed = 0;
  std::uint64_t aborted = 0;
  std::uint64_t workers_spawned = 0;
  std::uint64_t workers_alive = 0;
};

using WorkerId = std::uint64_t;

namespace detail {
struct ClusterCore;
struct WorkerLease;
} // namespace detail

/// Handle to a long-lived worker with a single-threaded mailbox.
///
/// Copies refer to the same worker. Tasks invoked on a worker run one at a
/// time in the order they were invoked. Dropping the last copy retires the
/// worker once its queued work has drained.
class WorkerHandle {
public:
  WorkerHandle() = default;

  auto id() const -> WorkerId;
  auto alive() const -> bool;
  /// Queue a task on the mailbox. A dead worker aborts it with WorkerDied.
  auto invoke(TaskEnvelope envelope) const -> void;
  /// Terminate the worker. Tasks that have not started abort with WorkerDied.
  auto kill() const -> void;

  friend auto operator==(const WorkerHandle &lhs, const WorkerHandle &rhs)
      -> bool {
    return lhs.lease_ == rhs.lease_;
  }

private:
  friend class Cluster;

  explicit WorkerHandle(std::shared_ptr<detail::WorkerLease> lease)
      : lease_(std::move(lease)) {}

  std::shared_ptr<detail::WorkerLease> lease_;
};

/// In-process cluster: a pool of CPU slots for stateless remote tasks plus
/// a registry of workers.
class Cluster {
public:
  /// Start a cluster and register it in the process-wide directory.
  static auto start(ClusterOptions options = {})
      -> Expected<std::shared_ptr<Cluster>>;
  /// Look up a running cluster by address.
  static auto find(std::string_view address) -> std::shared_ptr<Cluster>;
  /// Most recently started cluster that is still running.
  static auto latest() -> std::shared_ptr<Cluster>;

  Cluster(const Cluster &) = delete;
  auto operator=(const Cluster &) -> Cluster & = delete;
  Cluster(Cluster &&) = delete;
  auto operator=(Cluster &&) -> Cluster & = delete;

  /// Stops the cluster.
  ~Cluster();

  auto address() const -> const std::string &;
  auto namespace_name() const -> const std::string &;
  auto num_cpus() const -> int;
  auto running() const -> bool;

  /// Schedule a task on a free CPU slot. When the cluster is stopped (or
  /// stops before the task starts) the envelope is aborted with
  /// BackendUnavailable.
  auto submit(TaskEnvelope envelope) -> void;
  /// Start a new worker.
  auto spawn_worker() -> Expected<WorkerHandle>;
  /// Refuse new work, kill workers, wait for running tasks and join all
  /// threads. Idempotent.
  auto stop() -> void;

  auto stats() const -> ClusterStats;

private:
  explicit Cluster(std::shared_ptr<detail::ClusterCore> core);

  std::shared_ptr<detail::ClusterCore> core_;
};

} // namespace remex::backend
