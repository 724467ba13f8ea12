#include <algorithm>
#include <mutex>
#include <set>

#include "backend/cluster.hpp"
#include "backend/worker_pool.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using remex::ErrorCode;
namespace backend = remex::backend;

struct PoolFixture {
  std::shared_ptr<backend::Cluster> cluster;
  std::unique_ptr<backend::WorkerPool> pool;
};

auto make_pool(int size, int num_cpus = 2) -> std::optional<PoolFixture> {
  auto cluster = backend::Cluster::start(backend::ClusterOptions{num_cpus});
  if (!cluster) {
    fail("cluster start", cluster.error());
    return std::nullopt;
  }
  auto pool = backend::WorkerPool::create(**cluster, size);
  if (!pool) {
    fail("pool create", pool.error());
    return std::nullopt;
  }
  return PoolFixture{std::move(*cluster), std::move(*pool)};
}

auto test_pool_rejects_zero_size() -> bool {
  auto cluster = backend::Cluster::start(backend::ClusterOptions{1});
  if (!cluster) {
    return false;
  }
  auto pool = backend::WorkerPool::create(**cluster, 0);
  return !pool && pool.error().code == ErrorCode::InvalidArgument &&
         (*cluster)->stats().workers_spawned == 0;
}

auto test_pool_assigns_indices_and_queues() -> bool {
  auto fixture = make_pool(2);
  if (!fixture) {
    return false;
  }
  auto &pool = *fixture->pool;
  if (pool.size() != 2 || pool.idle_count() != 2 || !pool.has_free()) {
    return false;
  }

  std::vector<remex::Future<std::int64_t>> futures;
  for (int i = 0; i < 5; ++i) {
    auto [index, future] =
        pool.submit_task("sleep", [i]() { return sleep_then(50, i); });
    if (index != static_cast<backend::TaskIndex>(i)) {
      std::cerr << "unexpected task index " << index << "\n";
      return false;
    }
    futures.push_back(std::move(future));
  }
  if (pool.next_task_index() != 5 || pool.has_free() ||
      pool.pending_count() != 3) {
    return false;
  }

  std::multiset<std::int64_t> values;
  for (const auto &future : futures) {
    auto value = future.result(2s);
    if (!value) {
      return fail("pool result", value.error());
    }
    values.insert(*value);
  }
  if (values != std::multiset<std::int64_t>{0, 1, 2, 3, 4}) {
    return false;
  }
  return wait_for_condition([&]() { return pool.idle_count() == 2; }, 1s) &&
         pool.pending_count() == 0;
}

auto test_pool_bounds_parallelism() -> bool {
  auto fixture = make_pool(2, 4);
  if (!fixture) {
    return false;
  }
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  auto start = std::chrono::steady_clock::now();
  std::vector<remex::Future<void>> futures;
  for (int i = 0; i < 6; ++i) {
    auto submitted = fixture->pool->submit_task("track", [&]() {
      int now = active.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(60ms);
      active.fetch_sub(1);
    });
    futures.push_back(std::move(submitted.second));
  }
  for (const auto &future : futures) {
    if (!future.result(3s)) {
      return false;
    }
  }
  return peak.load() == 2 && elapsed_since(start) >= 170ms;
}

auto test_pool_skips_cancelled_pending() -> bool {
  auto fixture = make_pool(1);
  if (!fixture) {
    return false;
  }
  auto &pool = *fixture->pool;
  std::atomic<bool> skipped_ran{false};
  auto slow = pool.submit_task("slow", []() { return sleep_then(100, 1); });
  auto skipped = pool.submit_task("skipped", [&]() {
    skipped_ran = true;
    return std::int64_t{2};
  });
  auto last = pool.submit_task("last", []() { return std::int64_t{3}; });
  if (!skipped.second.cancel() || pool.pending_count() != 2) {
    return false;
  }

  auto last_value = last.second.result(2s);
  if (!last_value || *last_value != 3) {
    return false;
  }
  auto skipped_value = skipped.second.result();
  return slow.second.result().value_or(0) == 1 && !skipped_value &&
         skipped_value.error().code == ErrorCode::Cancelled &&
         !skipped_ran.load() && pool.pending_count() == 0;
}

auto test_pool_drops_dead_worker() -> bool {
  auto fixture = make_pool(1);
  if (!fixture) {
    return false;
  }
  auto &pool = *fixture->pool;

  std::mutex mutex;
  backend::WorkerHandle captured;
  remex::Promise<std::int64_t> running;
  backend::PoolJob job;
  job.handle = running.state();
  job.start = [&, running](const backend::WorkerHandle &worker) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      captured = worker;
    }
    worker.invoke(backend::detail::make_envelope<std::int64_t>(
        "slow", running, []() { return sleep_then(100, 1); }));
  };
  pool.submit(std::move(job));

  auto pending = pool.submit_task("pending", []() { return std::int64_t{2}; });
  if (!wait_for_condition(
          [&]() { return running.get_future().running(); }, 1s)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex);
    captured.kill();
  }

  auto running_value = running.get_future().result(2s);
  auto pending_value = pending.second.result(2s);
  if (!running_value || *running_value != 1) {
    return false;
  }
  if (pending_value || pending_value.error().code != ErrorCode::WorkerDied) {
    return false;
  }
  if (pool.size() != 0) {
    return false;
  }
  auto late = pool.submit_task("late", []() { return std::int64_t{3}; });
  auto late_value = late.second.result(1s);
  return !late_value && late_value.error().code == ErrorCode::WorkerDied;
}

auto test_pool_state_outlives_pool() -> bool {
  auto fixture = make_pool(1);
  if (!fixture) {
    return false;
  }
  auto first = fixture->pool->submit_task("a", []() { return sleep_then(30, 1); });
  auto second = fixture->pool->submit_task("b", []() { return sleep_then(30, 2); });
  fixture->pool.reset();
  return first.second.result(2s).value_or(0) == 1 &&
         second.second.result(2s).value_or(0) == 2;
}

auto test_pool_concurrent_submitters() -> bool {
  auto fixture = make_pool(3);
  if (!fixture) {
    return false;
  }
  const int threads = stress_enabled() ? 8 : 4;
  const int iterations = stress_enabled() ? 200 : 25;
  std::mutex mutex;
  std::set<backend::TaskIndex> indices;
  auto ok = run_concurrent(threads, iterations, [&](int thread, int iter) {
    auto [index, future] = fixture->pool->submit_task(
        "mul", [thread, iter]() { return std::int64_t{thread} * 1000 + iter; });
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (!indices.insert(index).second) {
        return false;
      }
    }
    auto value = future.result(5s);
    return value && *value == std::int64_t{thread} * 1000 + iter;
  });
  return ok && indices.size() == static_cast<std::size_t>(threads * iterations);
}

} // namespace

auto run_worker_pool_tests(TestStats &stats) -> void {
  run_test("pool_rejects_zero_size", test_pool_rejects_zero_size, stats);
  run_test("pool_assigns_indices_and_queues",
           test_pool_assigns_indices_and_queues, stats);
  run_test("pool_bounds_parallelism", test_pool_bounds_parallelism, stats);
  run_test("pool_skips_cancelled_pending", test_pool_skips_cancelled_pending,
           stats);
  run_test("pool_drops_dead_worker", test_pool_drops_dead_worker, stats);
  run_test("pool_state_outlives_pool", test_pool_state_outlives_pool, stats);
  run_test("pool_concurrent_submitters", test_pool_concurrent_submitters,
           stats);
}
