#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "backend/cluster.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

namespace remex::backend {

/// Options for joining (or starting) the process-wide backend session.
struct InitOptions {
  /// Cluster to attach to. Unset or "local" starts a new cluster, "auto"
  /// attaches to the most recently started one; anything else is looked up
  /// by address. Falls back to --backend_address when unset.
  std::optional<std::string> address;
  /// CPU slots for a newly started cluster (0 uses --backend_num_cpus, then
  /// hardware concurrency). Must stay 0 when attaching.
  int num_cpus = 0;
  std::string namespace_name = "anonymous";
  /// Return the existing context instead of failing when already initialized.
  bool ignore_reinit_error = false;
};

/// Parse `{"address", "num_cpus", "namespace", "ignore_reinit_error"}`.
/// A null or empty config yields defaults; unknown keys are rejected.
auto parse_init_options(const Json &config) -> Expected<InitOptions>;

/// Connection to a cluster held by the session.
class Context {
public:
  Context(std::shared_ptr<Cluster> cluster, bool owns_cluster,
          std::string namespace_name);

  Context(const Context &) = delete;
  auto operator=(const Context &) -> Context & = delete;

  auto address() const -> const std::string & { return address_; }
  auto namespace_name() const -> const std::string & { return namespace_; }
  auto num_cpus() const -> int { return num_cpus_; }
  auto owns_cluster() const -> bool { return owns_cluster_; }
  /// True until disconnected and while the cluster keeps running.
  auto connected() const -> bool;
  /// Null once disconnected.
  auto cluster() const -> std::shared_ptr<Cluster>;
  auto address_info() const -> Json;

  /// Drop the cluster reference; returns it so the caller can stop it.
  auto disconnect() -> std::shared_ptr<Cluster>;

private:
  std::string address_;
  std::string namespace_;
  int num_cpus_ = 0;
  bool owns_cluster_ = false;

  mutable std::mutex mutex_;
  std::shared_ptr<Cluster> cluster_;
};

auto init(InitOptions options = {}) -> Expected<std::shared_ptr<Context>>;
auto init(const Json &config) -> Expected<std::shared_ptr<Context>>;

auto is_initialized() -> bool;
/// Active context, or null when not initialized.
auto current_context() -> std::shared_ptr<Context>;

/// Detach the session and stop the cluster if the session started it.
/// Safe to call when not initialized.
auto shutdown() -> void;

} // namespace remex::backend
