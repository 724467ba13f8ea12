#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "test_support.hpp"

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  remex::log::init();

  TestStats stats;
  run_future_tests(stats);
  run_backend_tests(stats);
  run_worker_pool_tests(stats);
  run_executor_tests(stats);

  remex::log::shutdown();
  std::cout << "Passed: " << stats.passed << ", Failed: " << stats.failed << "\n";
  return stats.failed == 0 ? 0 : 1;
}
