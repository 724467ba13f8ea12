// Leaves the backend session running when main returns: a non-destructive
// executor never tears it down, so the process-exit teardown has to.

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <gflags/gflags.h>

#include "backend/session.hpp"
#include "common/logging/log.hpp"
#include "runtime/executor.hpp"

namespace {

// Registered before the session exists, so it runs after the session's own
// exit hook.
auto check_session_closed() -> void {
  if (remex::backend::is_initialized()) {
    std::cerr << "[FAIL] backend session still open at exit\n";
    std::_Exit(1);
  }
  std::cout << "[PASS] backend session closed at exit\n";
}

auto add(std::int64_t a, std::int64_t b) -> std::int64_t { return a + b; }

auto slow_identity(std::int64_t value) -> std::int64_t {
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  return value;
}

} // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  remex::log::init();
  if (std::atexit(check_session_closed) != 0) {
    std::cerr << "[FAIL] could not register exit check\n";
    return 1;
  }

  auto executor = remex::Executor::create();
  if (!executor) {
    std::cerr << "[FAIL] create: " << executor.error().message << "\n";
    return 1;
  }
  auto sum = (*executor)->submit(add, 1, 2);
  if (!sum || sum->result(std::chrono::seconds(5)).value_or(0) != 3) {
    std::cerr << "[FAIL] submit did not produce 3\n";
    return 1;
  }

  // Still running when main returns.
  auto in_flight = (*executor)->submit(slow_identity, 7);
  if (!in_flight) {
    std::cerr << "[FAIL] submit: " << in_flight.error().message << "\n";
    return 1;
  }
  std::cout << "[PASS] non-destructive executor left the session open\n";
  return remex::backend::is_initialized() ? 0 : 1;
}
