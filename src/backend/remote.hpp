#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "backend/cluster.hpp"
#include "backend/task.hpp"
#include "core/future.hpp"

namespace remex::backend {

/// Run `fn` as an independent remote task on one of the cluster's CPU slots.
template <typename Fn>
auto submit_remote(Cluster &cluster, std::string name, Fn fn)
    -> Future<std::invoke_result_t<Fn &>> {
  using R = std::invoke_result_t<Fn &>;
  Promise<R> promise;
  auto future = promise.get_future();
  cluster.submit(detail::make_envelope<R>(std::move(name), promise,
                                          std::move(fn)));
  return future;
}

template <typename Fn>
auto submit_remote(Cluster &cluster, Fn fn)
    -> Future<std::invoke_result_t<Fn &>> {
  return submit_remote(cluster, detail::callable_name<Fn>(), std::move(fn));
}

/// Queue `fn` on a worker's mailbox.
template <typename Fn>
auto invoke_on(const WorkerHandle &worker, std::string name, Fn fn)
    -> Future<std::invoke_result_t<Fn &>> {
  using R = std::invoke_result_t<Fn &>;
  Promise<R> promise;
  auto future = promise.get_future();
  worker.invoke(
      detail::make_envelope<R>(std::move(name), promise, std::move(fn)));
  return future;
}

} // namespace remex::backend
