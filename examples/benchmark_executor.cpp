#include <algorithm>
#include <atomic>
#include <barrier>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "backend/session.hpp"
#include "runtime/executor.hpp"

namespace remex::bench {

/// Benchmark configuration parsed from CLI arguments.
struct BenchmarkConfig {
  int runs = 2000;
  int warmup = 200;
  int concurrency = 1;
  int num_cpus = 0;
  int workers = 4;
  int map_size = 256;
  int map_rounds = 20;
  int64_t seed = 7;
  bool verify = false;
  std::string mode = "both";
};

/// Basic stats computed from a vector of durations.
struct BenchStats {
  int64_t min_ns = 0;
  int64_t max_ns = 0;
  double mean_ns = 0.0;
  int64_t p50_ns = 0;
  int64_t p95_ns = 0;
  int64_t p99_ns = 0;
  double throughput = 0.0;
  std::chrono::nanoseconds wall{};
};

auto invalid(std::string message) -> tl::unexpected<ExecError> {
  return tl::unexpected(make_error(ErrorCode::InvalidArgument, std::move(message)));
}

/// Parse an integer from a string_view, returning false on failure.
inline auto parse_int(std::string_view value, int &out) -> bool {
  int parsed = 0;
  auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
    return false;
  }
  out = parsed;
  return true;
}

/// Parse a 64-bit integer from a string_view, returning false on failure.
inline auto parse_int64(std::string_view value, int64_t &out) -> bool {
  int64_t parsed = 0;
  auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
    return false;
  }
  out = parsed;
  return true;
}

/// Print CLI usage information.
auto print_usage(std::string_view exe) -> void {
  std::cout << std::format(
      "Usage: {} [options]\n"
      "Options:\n"
      "  --mode=elastic|pool|both   Executor flavour (default: both)\n"
      "  --runs=N                   Timed submit round trips (default: 2000)\n"
      "  --warmup=N                 Warmup round trips (default: 200)\n"
      "  --concurrency=N            Parallel submitting threads (default: 1)\n"
      "  --num-cpus=N               Cluster CPU slots (default: 0 -> hw)\n"
      "  --workers=N                Pool size for pool mode (default: 4)\n"
      "  --map-size=N               Elements per map call (default: 256)\n"
      "  --map-rounds=N             Timed map calls (default: 20)\n"
      "  --seed=N                   First input value (default: 7)\n"
      "  --verify=0|1               Validate every result (default: 0)\n"
      "  --help                     Show help\n",
      exe);
}

/// Parse CLI arguments into a BenchmarkConfig.
auto parse_args(int argc, char **argv) -> Expected<BenchmarkConfig> {
  BenchmarkConfig config;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg == "--help" || arg == "-h") {
      return invalid("help");
    }
    if (!arg.starts_with("--")) {
      return invalid("invalid argument");
    }
    auto eq = arg.find('=');
    std::string_view key = arg.substr(2, eq == std::string_view::npos ? arg.size() - 2 : eq - 2);
    std::string_view value;
    if (eq == std::string_view::npos) {
      if (i + 1 >= argc) {
        return invalid("missing value");
      }
      value = std::string_view(argv[++i]);
    } else {
      value = arg.substr(eq + 1);
    }

    if (key == "mode") {
      config.mode = std::string(value);
    } else if (key == "runs") {
      if (!parse_int(value, config.runs)) {
        return invalid("invalid runs");
      }
    } else if (key == "warmup") {
      if (!parse_int(value, config.warmup)) {
        return invalid("invalid warmup");
      }
    } else if (key == "concurrency") {
      if (!parse_int(value, config.concurrency)) {
        return invalid("invalid concurrency");
      }
    } else if (key == "num-cpus") {
      if (!parse_int(value, config.num_cpus)) {
        return invalid("invalid num-cpus");
      }
    } else if (key == "workers") {
      if (!parse_int(value, config.workers)) {
        return invalid("invalid workers");
      }
    } else if (key == "map-size") {
      if (!parse_int(value, config.map_size)) {
        return invalid("invalid map size");
      }
    } else if (key == "map-rounds") {
      if (!parse_int(value, config.map_rounds)) {
        return invalid("invalid map rounds");
      }
    } else if (key == "seed") {
      if (!parse_int64(value, config.seed)) {
        return invalid("invalid seed");
      }
    } else if (key == "verify") {
      int flag = 0;
      if (!parse_int(value, flag)) {
        return invalid("invalid verify");
      }
      config.verify = (flag != 0);
    } else {
      return invalid("unknown flag");
    }
  }

  if (config.runs <= 0 || config.warmup < 0) {
    return invalid("runs/warmup must be positive");
  }
  if (config.concurrency <= 0) {
    return invalid("concurrency must be positive");
  }
  if (config.num_cpus < 0 || config.workers <= 0) {
    return invalid("num-cpus/workers out of range");
  }
  if (config.map_size <= 0 || config.map_rounds <= 0) {
    return invalid("map size/rounds must be positive");
  }
  if (config.mode != "elastic" && config.mode != "pool" && config.mode != "both") {
    return invalid("unknown mode");
  }

  return config;
}

/// Cheap task body so the measurement is dominated by dispatch overhead.
auto mix(int64_t value) -> int64_t {
  uint64_t x = static_cast<uint64_t>(value);
  x ^= x >> 33;
  x *= 0xff51afd7ed558ccdULL;
  x ^= x >> 33;
  return static_cast<int64_t>(x);
}

/// Compute percentile statistics from a duration vector.
auto compute_stats(std::vector<int64_t> samples,
                   std::chrono::nanoseconds wall, std::size_t items) -> BenchStats {
  BenchStats stats;
  if (samples.empty()) {
    return stats;
  }
  std::sort(samples.begin(), samples.end());
  stats.min_ns = samples.front();
  stats.max_ns = samples.back();
  stats.mean_ns = static_cast<double>(
      std::accumulate(samples.begin(), samples.end(), int64_t{0})) /
      static_cast<double>(samples.size());
  auto idx = [&](double p) -> std::size_t {
    auto pos = static_cast<std::size_t>(p * static_cast<double>(samples.size() - 1));
    return std::min(pos, samples.size() - 1);
  };
  stats.p50_ns = samples[idx(0.50)];
  stats.p95_ns = samples[idx(0.95)];
  stats.p99_ns = samples[idx(0.99)];
  stats.wall = wall;
  if (wall.count() > 0) {
    stats.throughput = static_cast<double>(items) /
                       (static_cast<double>(wall.count()) / 1e9);
  }
  return stats;
}

/// One submit + result round trip.
auto round_trip(Executor &executor, const BenchmarkConfig &config, int64_t input)
    -> Expected<void> {
  auto future = executor.submit(mix, input);
  if (!future) {
    return tl::unexpected(future.error());
  }
  auto value = future->result();
  if (!value) {
    return tl::unexpected(value.error());
  }
  if (config.verify && *value != mix(input)) {
    return tl::unexpected(make_error(ErrorCode::TaskFailure, "unexpected result"));
  }
  return {};
}

/// Measure submit round-trip latency, optionally from several threads.
auto run_submit_benchmark(Executor &executor, const BenchmarkConfig &config)
    -> Expected<BenchStats> {
  const int total_runs = config.runs;
  const int warmup_runs = config.warmup;
  const int concurrency = config.concurrency;

  const int base_runs = total_runs / concurrency;
  const int extra_runs = total_runs % concurrency;
  std::vector<std::vector<int64_t>> thread_samples(concurrency);
  std::vector<std::thread> threads;
  threads.reserve(static_cast<std::size_t>(concurrency));
  std::barrier start_gate(concurrency + 1);
  std::barrier finish_gate(concurrency + 1);
  std::mutex error_mutex;
  std::optional<ExecError> error;
  std::atomic<bool> abort{false};

  auto record_error = [&](ExecError failure) {
    std::lock_guard<std::mutex> lock(error_mutex);
    if (!error) {
      error = std::move(failure);
    }
    abort.store(true, std::memory_order_release);
  };

  for (int t = 0; t < concurrency; ++t) {
    thread_samples[t].reserve(static_cast<std::size_t>(base_runs + (t < extra_runs ? 1 : 0)));
    threads.emplace_back([&, t]() {
      const int runs_for_thread = base_runs + (t < extra_runs ? 1 : 0);
      for (int i = 0; i < warmup_runs; ++i) {
        if (abort.load(std::memory_order_acquire)) {
          break;
        }
        auto result = round_trip(executor, config, config.seed + i + t * 13);
        if (!result) {
          record_error(result.error());
          break;
        }
      }
      start_gate.arrive_and_wait();
      if (abort.load(std::memory_order_acquire)) {
        finish_gate.arrive_and_wait();
        return;
      }
      for (int i = 0; i < runs_for_thread; ++i) {
        if (abort.load(std::memory_order_acquire)) {
          break;
        }
        auto start = std::chrono::steady_clock::now();
        auto result = round_trip(executor, config, config.seed + i + t * 13);
        auto end = std::chrono::steady_clock::now();
        if (!result) {
          record_error(result.error());
          break;
        }
        thread_samples[t].push_back(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
      }
      finish_gate.arrive_and_wait();
    });
  }

  start_gate.arrive_and_wait();
  auto wall_start = std::chrono::steady_clock::now();
  finish_gate.arrive_and_wait();
  auto wall_end = std::chrono::steady_clock::now();
  for (auto &thread : threads) {
    thread.join();
  }

  if (error) {
    return tl::unexpected(*error);
  }

  std::vector<int64_t> merged;
  for (auto &bucket : thread_samples) {
    merged.insert(merged.end(), bucket.begin(), bucket.end());
  }
  const auto items = merged.size();
  return compute_stats(std::move(merged),
                       std::chrono::duration_cast<std::chrono::nanoseconds>(wall_end - wall_start),
                       items);
}

/// Measure whole map() calls; throughput counts mapped elements.
auto run_map_benchmark(Executor &executor, const BenchmarkConfig &config)
    -> Expected<BenchStats> {
  std::vector<int64_t> inputs(static_cast<std::size_t>(config.map_size));
  std::iota(inputs.begin(), inputs.end(), config.seed);

  std::vector<int64_t> samples;
  samples.reserve(static_cast<std::size_t>(config.map_rounds));
  auto wall_start = std::chrono::steady_clock::now();
  for (int round = 0; round < config.map_rounds; ++round) {
    auto start = std::chrono::steady_clock::now();
    auto results = executor.map(mix, inputs);
    if (!results) {
      return tl::unexpected(results.error());
    }
    auto values = results->collect();
    auto end = std::chrono::steady_clock::now();
    if (!values) {
      return tl::unexpected(values.error());
    }
    if (config.verify && values->size() != inputs.size()) {
      return tl::unexpected(make_error(ErrorCode::TaskFailure, "map lost elements"));
    }
    samples.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
  }
  auto wall_end = std::chrono::steady_clock::now();
  return compute_stats(std::move(samples),
                       std::chrono::duration_cast<std::chrono::nanoseconds>(wall_end - wall_start),
                       static_cast<std::size_t>(config.map_size) *
                           static_cast<std::size_t>(config.map_rounds));
}

/// Print benchmark stats.
auto print_stats(std::string_view label, std::string_view unit, const BenchStats &stats) -> void {
  std::cout << std::format(
      "{}\n  min:  {} ns\n  p50:  {} ns\n  p95:  {} ns\n  p99:  {} ns\n  max:  {} ns\n  mean: {:.2f} ns\n  wall: {} ms\n  throughput: {:.2f} {}/s\n",
      label,
      stats.min_ns,
      stats.p50_ns,
      stats.p95_ns,
      stats.p99_ns,
      stats.max_ns,
      stats.mean_ns,
      std::chrono::duration_cast<std::chrono::milliseconds>(stats.wall).count(),
      stats.throughput,
      unit);
}

/// Benchmark one executor flavour against a shared backend session.
auto run_mode(std::string_view label, std::optional<int> max_workers,
              const BenchmarkConfig &config) -> bool {
  ExecutorConfig exec_config;
  exec_config.max_workers = max_workers;
  exec_config.backend = Json{{"num_cpus", config.num_cpus}};
  auto executor = Executor::create(std::move(exec_config));
  if (!executor) {
    std::cerr << std::format("{} create error: {}\n", label, executor.error().message);
    return false;
  }

  auto submit_stats = run_submit_benchmark(**executor, config);
  if (!submit_stats) {
    std::cerr << std::format("{} submit error: {}\n", label, submit_stats.error().message);
    return false;
  }
  print_stats(std::format("{} submit round trip", label), "tasks", *submit_stats);

  auto map_stats = run_map_benchmark(**executor, config);
  if (!map_stats) {
    std::cerr << std::format("{} map error: {}\n", label, map_stats.error().message);
    return false;
  }
  print_stats(std::format("{} map x{}", label, config.map_size), "elements", *map_stats);
  return true;
}

}  // namespace remex::bench

int main(int argc, char **argv) {
  using remex::bench::BenchmarkConfig;
  auto config_result = remex::bench::parse_args(argc, argv);
  if (!config_result) {
    if (config_result.error().message == "help") {
      remex::bench::print_usage(argv[0]);
      return 0;
    }
    std::cerr << "Argument error: " << config_result.error().message << "\n";
    remex::bench::print_usage(argv[0]);
    return 1;
  }
  BenchmarkConfig config = std::move(*config_result);

  int status = 0;
  if (config.mode == "elastic" || config.mode == "both") {
    if (!remex::bench::run_mode("Elastic executor", std::nullopt, config)) {
      status = 1;
    }
  }
  if (status == 0 && (config.mode == "pool" || config.mode == "both")) {
    if (!remex::bench::run_mode(std::format("Pool executor ({} workers)", config.workers),
                                config.workers, config)) {
      status = 1;
    }
  }

  remex::backend::shutdown();
  return status;
}
