#pragma once

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "backend/session.hpp"
#include "core/error.hpp"
#include "core/future.hpp"
#include "runtime/executor.hpp"

/// Simple stats holder for the ad-hoc test runner.
struct TestStats {
  int passed = 0;
  int failed = 0;
};

/// Run one test and record the outcome. The backend session is torn down
/// afterwards so every test starts without a cluster.
inline auto run_test(const char *name, const std::function<bool()> &test,
                     TestStats &stats) -> void {
  bool ok = false;
  try {
    ok = test();
  } catch (const std::exception &ex) {
    std::cerr << name << " threw: " << ex.what() << "\n";
  }
  remex::backend::shutdown();
  if (ok) {
    std::cout << "[PASS] " << name << "\n";
    stats.passed += 1;
  } else {
    std::cout << "[FAIL] " << name << "\n";
    stats.failed += 1;
  }
}

/// Wait until predicate returns true or the timeout expires.
inline auto wait_for_condition(const std::function<bool()> &predicate,
                               std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

/// Print an error value and return false, for `if (!x) return fail(...)`.
inline auto fail(const char *what, const remex::ExecError &error) -> bool {
  std::cerr << what << ": " << remex::to_string(error.code) << ": "
            << error.message << "\n";
  return false;
}

/// Sleep for `ms` and return `value`.
inline auto sleep_then(int ms, std::int64_t value) -> std::int64_t {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  return value;
}

inline auto elapsed_since(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

/// Executor config with its own cluster of `num_cpus` slots, torn down on
/// shutdown.
inline auto owned_config(std::optional<int> max_workers, int num_cpus)
    -> remex::ExecutorConfig {
  remex::ExecutorConfig config;
  config.max_workers = max_workers;
  config.shutdown_backend = true;
  config.backend = remex::Json{{"num_cpus", num_cpus}};
  return config;
}

/// Run a synchronized parallel loop and return false on the first failure.
template <typename Fn>
auto run_concurrent(int threads, int iterations, Fn &&fn) -> bool {
  if (threads <= 0 || iterations <= 0) {
    return true;
  }

  std::barrier start_gate(threads);
  std::atomic<bool> abort{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(threads));

  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&, i]() {
      start_gate.arrive_and_wait();
      for (int iter = 0; iter < iterations; ++iter) {
        if (abort.load(std::memory_order_acquire)) {
          break;
        }
        if (!fn(i, iter)) {
          failures.fetch_add(1, std::memory_order_relaxed);
          abort.store(true, std::memory_order_release);
          break;
        }
      }
    });
  }

  for (auto &worker : workers) {
    worker.join();
  }

  return failures.load(std::memory_order_relaxed) == 0;
}

/// Check whether the stress suite is enabled via REMEX_STRESS.
inline auto stress_enabled() -> bool {
  const char *flag = std::getenv("REMEX_STRESS");
  return flag && *flag != '\0' && std::string(flag) != "0";
}

auto run_future_tests(TestStats &stats) -> void;
auto run_backend_tests(TestStats &stats) -> void;
auto run_worker_pool_tests(TestStats &stats) -> void;
auto run_executor_tests(TestStats &stats) -> void;
