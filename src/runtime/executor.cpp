#include "runtime/executor.hpp"

#include <format>
#include <utility>

#include "common/logging/log.hpp"

namespace remex {

Executor::Executor(ExecutorConfig config,
                   std::shared_ptr<backend::Context> context,
                   std::shared_ptr<backend::Cluster> cluster,
                   std::unique_ptr<backend::WorkerPool> pool)
    : config_(std::move(config)), context_(std::move(context)),
      cluster_(std::move(cluster)), pool_(std::move(pool)) {}

Executor::~Executor() { shutdown(); }

auto Executor::create(ExecutorConfig config)
    -> Expected<std::unique_ptr<Executor>> {
  if (config.max_workers && *config.max_workers < 1) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        std::format("max_workers={} is given; max_workers must be >= 1",
                    *config.max_workers)));
  }

  auto options = backend::parse_init_options(config.backend);
  if (!options) {
    return tl::unexpected(options.error());
  }
  // Executors share one backend session; only the first one starts it.
  options->ignore_reinit_error = true;
  auto context = backend::init(std::move(*options));
  if (!context) {
    return tl::unexpected(context.error());
  }
  auto cluster = (*context)->cluster();
  if (!cluster) {
    return tl::unexpected(make_error(ErrorCode::BackendUnavailable,
                                     "backend session is disconnected"));
  }

  std::unique_ptr<backend::WorkerPool> pool;
  if (config.max_workers) {
    auto created = backend::WorkerPool::create(*cluster, *config.max_workers);
    if (!created) {
      return tl::unexpected(created.error());
    }
    pool = std::move(*created);
  }

  remex::log::info(
      "executor created",
      {{"address", (*context)->address()},
       {"max_workers", config.max_workers
                           ? std::to_string(*config.max_workers)
                           : std::string("auto")},
       {"shutdown_backend", config.shutdown_backend ? "true" : "false"}});
  return std::unique_ptr<Executor>(new Executor(std::move(config),
                                                std::move(*context),
                                                std::move(cluster),
                                                std::move(pool)));
}

auto Executor::after_shutdown() -> ExecError {
  return make_error(ErrorCode::IllegalState,
                    "cannot submit new tasks after shutdown()");
}

auto Executor::shutdown(ShutdownOptions options) -> void {
  std::vector<std::shared_ptr<FutureState>> futures;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.shutdown_backend || shutdown_) {
      futures_.clear();
      return;
    }
    shutdown_ = true;
    futures.swap(futures_);
  }

  std::size_t cancelled = 0;
  if (options.cancel_futures) {
    for (const auto &future : futures) {
      if (future->cancel()) {
        cancelled += 1;
      }
    }
  }
  if (options.wait) {
    for (const auto &future : futures) {
      if (future->running()) {
        future->wait();
      }
    }
  }
  backend::shutdown();

  remex::log::info("executor shut down",
                   {{"address", context_->address()},
                    {"outstanding", std::to_string(futures.size())},
                    {"cancelled", std::to_string(cancelled)}});
}

auto Executor::is_shutdown() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_;
}

auto Executor::outstanding() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return futures_.size();
}

} // namespace remex
