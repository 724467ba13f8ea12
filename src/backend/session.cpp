#include "backend/session.hpp"

#include <cstdlib>
#include <format>
#include <utility>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"

DECLARE_string(backend_address);
DECLARE_int32(backend_num_cpus);

namespace remex::backend {
namespace {

std::mutex g_session_mutex;
std::shared_ptr<Context> g_context;
bool g_exit_hook_installed = false;

// Registered after the logger and the cluster directory exist, so it runs
// before their static destructors.
auto shutdown_at_exit() -> void { shutdown(); }

auto install_exit_hook_locked() -> void {
  if (g_exit_hook_installed) {
    return;
  }
  if (std::atexit(shutdown_at_exit) != 0) {
    remex::log::warn("failed to register backend teardown at exit");
    return;
  }
  g_exit_hook_installed = true;
}

auto invalid(std::string message) -> tl::unexpected<ExecError> {
  return tl::unexpected(
      make_error(ErrorCode::InvalidArgument, std::move(message)));
}

auto resolve_address(const InitOptions &options)
    -> std::optional<std::string> {
  if (options.address) {
    return options.address;
  }
  if (!FLAGS_backend_address.empty()) {
    return FLAGS_backend_address;
  }
  return std::nullopt;
}

auto start_owned(const InitOptions &options)
    -> Expected<std::shared_ptr<Context>> {
  ClusterOptions cluster_options;
  cluster_options.num_cpus =
      options.num_cpus > 0 ? options.num_cpus : FLAGS_backend_num_cpus;
  cluster_options.namespace_name = options.namespace_name;
  auto cluster = Cluster::start(std::move(cluster_options));
  if (!cluster) {
    return tl::unexpected(cluster.error());
  }
  return std::make_shared<Context>(std::move(*cluster), true,
                                   options.namespace_name);
}

auto attach(const std::string &address, const InitOptions &options)
    -> Expected<std::shared_ptr<Context>> {
  if (options.num_cpus > 0) {
    return invalid(std::format(
        "num_cpus={} cannot be set when attaching to cluster '{}'",
        options.num_cpus, address));
  }
  auto cluster = address == "auto" ? Cluster::latest() : Cluster::find(address);
  if (!cluster) {
    return tl::unexpected(
        make_error(ErrorCode::BackendUnavailable,
                   std::format("no running cluster at '{}'", address)));
  }
  return std::make_shared<Context>(std::move(cluster), false,
                                   options.namespace_name);
}

} // namespace

auto parse_init_options(const Json &config) -> Expected<InitOptions> {
  InitOptions options;
  if (config.is_null()) {
    return options;
  }
  if (!config.is_object()) {
    return invalid("backend config must be a JSON object");
  }
  for (const auto &[key, value] : config.items()) {
    if (key == "address") {
      if (value.is_null()) {
        options.address.reset();
      } else if (value.is_string()) {
        options.address = value.get<std::string>();
      } else {
        return invalid("backend config 'address' must be a string or null");
      }
    } else if (key == "num_cpus") {
      if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        return invalid(
            "backend config 'num_cpus' must be a non-negative integer");
      }
      options.num_cpus = value.get<int>();
    } else if (key == "namespace") {
      if (!value.is_string()) {
        return invalid("backend config 'namespace' must be a string");
      }
      options.namespace_name = value.get<std::string>();
    } else if (key == "ignore_reinit_error") {
      if (!value.is_boolean()) {
        return invalid(
            "backend config 'ignore_reinit_error' must be a boolean");
      }
      options.ignore_reinit_error = value.get<bool>();
    } else {
      return invalid(std::format("unknown backend config key '{}'", key));
    }
  }
  return options;
}

Context::Context(std::shared_ptr<Cluster> cluster, bool owns_cluster,
                 std::string namespace_name)
    : address_(cluster->address()), namespace_(std::move(namespace_name)),
      num_cpus_(cluster->num_cpus()), owns_cluster_(owns_cluster),
      cluster_(std::move(cluster)) {}

auto Context::connected() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return cluster_ && cluster_->running();
}

auto Context::cluster() const -> std::shared_ptr<Cluster> {
  std::lock_guard<std::mutex> lock(mutex_);
  return cluster_;
}

auto Context::address_info() const -> Json {
  return Json{{"address", address_},
              {"namespace", namespace_},
              {"num_cpus", num_cpus_},
              {"owns_cluster", owns_cluster_},
              {"connected", connected()}};
}

auto Context::disconnect() -> std::shared_ptr<Cluster> {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::exchange(cluster_, nullptr);
}

auto init(InitOptions options) -> Expected<std::shared_ptr<Context>> {
  remex::log::init();
  std::lock_guard<std::mutex> lock(g_session_mutex);
  if (g_context) {
    if (options.ignore_reinit_error) {
      remex::log::debug("backend already initialized at {}; reusing it",
                        g_context->address());
      return g_context;
    }
    return tl::unexpected(make_error(
        ErrorCode::IllegalState,
        std::format("backend already initialized at {}; set "
                    "ignore_reinit_error to reuse it",
                    g_context->address())));
  }

  auto address = resolve_address(options);
  auto context = (!address || *address == "local") ? start_owned(options)
                                                   : attach(*address, options);
  if (!context) {
    return context;
  }
  g_context = *context;
  install_exit_hook_locked();
  remex::log::info("backend session initialized",
                   {{"address", g_context->address()},
                    {"namespace", g_context->namespace_name()},
                    {"owns_cluster", g_context->owns_cluster() ? "true" : "false"}});
  return g_context;
}

auto init(const Json &config) -> Expected<std::shared_ptr<Context>> {
  auto options = parse_init_options(config);
  if (!options) {
    return tl::unexpected(options.error());
  }
  return init(std::move(*options));
}

auto is_initialized() -> bool {
  std::lock_guard<std::mutex> lock(g_session_mutex);
  return g_context != nullptr;
}

auto current_context() -> std::shared_ptr<Context> {
  std::lock_guard<std::mutex> lock(g_session_mutex);
  return g_context;
}

auto shutdown() -> void {
  std::shared_ptr<Context> context;
  {
    std::lock_guard<std::mutex> lock(g_session_mutex);
    context = std::exchange(g_context, nullptr);
  }
  if (!context) {
    return;
  }
  auto cluster = context->disconnect();
  if (cluster && context->owns_cluster()) {
    cluster->stop();
  }
  remex::log::info("backend session shut down",
                   {{"address", context->address()}});
}

} // namespace remex::backend
