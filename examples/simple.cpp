#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <gflags/gflags.h>

#include "runtime/executor.hpp"

namespace {

auto slow_square(std::int64_t value) -> std::int64_t {
  std::this_thread::sleep_for(std::chrono::milliseconds(20 * (value % 4)));
  return value * value;
}

auto describe(std::string_view label, const remex::ExecError &error) -> int {
  std::cerr << std::format("{}: {} ({})\n", label, error.message,
                           remex::to_string(error.code));
  return 1;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  remex::ExecutorConfig config;
  config.max_workers = 3;
  config.shutdown_backend = true;
  config.backend = remex::Json{{"num_cpus", 2}, {"namespace", "simple"}};

  auto executor = remex::Executor::create(std::move(config));
  if (!executor) {
    return describe("Create error", executor.error());
  }
  std::cout << std::format("backend: {}\n",
                           (*executor)->context()->address_info().dump());

  auto future = (*executor)->submit(slow_square, 12);
  if (!future) {
    return describe("Submit error", future.error());
  }
  auto value = future->result(std::chrono::seconds(5));
  if (!value) {
    return describe("Task error", value.error());
  }
  std::cout << std::format("submit: 12^2 = {}\n", *value);

  std::vector<std::int64_t> inputs{1, 2, 3, 4, 5, 6, 7, 8};
  remex::MapOptions options;
  options.timeout = std::chrono::seconds(10);
  auto results = (*executor)->map(options, slow_square, inputs);
  if (!results) {
    return describe("Map error", results.error());
  }
  std::cout << "map (completion order):";
  for (const auto &item : *results) {
    if (!item) {
      std::cout << "\n";
      return describe("Map element error", item.error());
    }
    std::cout << " " << *item;
  }
  std::cout << "\n";

  (*executor)->shutdown(remex::ShutdownOptions{.wait = true, .cancel_futures = true});
  auto rejected = (*executor)->submit(slow_square, 1);
  if (!rejected) {
    std::cout << std::format("after shutdown: {}\n", rejected.error().message);
  }
  return 0;
}
