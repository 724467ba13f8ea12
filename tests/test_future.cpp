#include <stdexcept>
#include <thread>

#include "core/completion_queue.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

struct CustomFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

auto test_promise_resolves_value() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  if (future.done() || future.status() != remex::FutureStatus::Pending) {
    return false;
  }
  std::thread producer([promise]() {
    std::this_thread::sleep_for(20ms);
    promise.set_running_or_notify_cancel();
    promise.set_value(42);
  });
  auto value = future.result();
  producer.join();
  if (!value) {
    return fail("result", value.error());
  }
  return *value == 42 && future.done() &&
         future.status() == remex::FutureStatus::Finished &&
         !future.exception().has_value();
}

auto test_void_future() -> bool {
  remex::Promise<void> promise;
  auto future = promise.get_future();
  promise.set_running_or_notify_cancel();
  if (!promise.set_value()) {
    return false;
  }
  if (promise.set_value()) {
    std::cerr << "second set_value should be rejected\n";
    return false;
  }
  return future.result().has_value();
}

auto test_cancel_pending() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  if (!future.cancel() || !future.cancel()) {
    return false;
  }
  if (promise.set_running_or_notify_cancel() || promise.set_value(1)) {
    std::cerr << "cancelled state accepted a transition\n";
    return false;
  }
  auto value = future.result();
  return !value && value.error().code == remex::ErrorCode::Cancelled &&
         future.cancelled() && future.done();
}

auto test_cancel_running_is_refused() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  if (!promise.set_running_or_notify_cancel() || !future.running()) {
    return false;
  }
  if (future.cancel()) {
    return false;
  }
  promise.set_value(7);
  auto value = future.result();
  return value && *value == 7 && !future.cancel();
}

auto test_result_timeout() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  auto start = std::chrono::steady_clock::now();
  auto value = future.result(30ms);
  if (value || value.error().code != remex::ErrorCode::Timeout) {
    return false;
  }
  if (elapsed_since(start) < 25ms) {
    return false;
  }
  return !future.wait(1ms) && !future.done();
}

auto test_error_keeps_cause() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  try {
    throw CustomFailure("boom");
  } catch (const std::exception &ex) {
    promise.set_error(remex::ExecError{remex::ErrorCode::TaskFailure,
                                       ex.what(), std::current_exception()});
  }
  auto error = future.exception();
  if (!error || error->code != remex::ErrorCode::TaskFailure ||
      error->message != "boom") {
    return false;
  }
  try {
    remex::rethrow(*error);
  } catch (const CustomFailure &ex) {
    return std::string(ex.what()) == "boom";
  } catch (...) {
    return false;
  }
  return false;
}

auto test_rethrow_without_cause() -> bool {
  try {
    remex::rethrow(
        remex::make_error(remex::ErrorCode::WorkerDied, "worker 3 died"));
  } catch (const std::runtime_error &ex) {
    return std::string(ex.what()) == "worker_died: worker 3 died";
  }
  return false;
}

auto test_done_callbacks() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  std::vector<int> order;
  future.add_done_callback([&](const remex::Future<int> &) {
    order.push_back(1);
  });
  future.add_done_callback(
      [](const remex::Future<int> &) { throw std::runtime_error("ignored"); });
  future.add_done_callback([&](const remex::Future<int> &done) {
    auto value = done.result();
    order.push_back(value ? *value : -1);
  });
  if (!order.empty()) {
    return false;
  }
  promise.set_value(5);
  future.add_done_callback([&](const remex::Future<int> &) {
    order.push_back(9);
  });
  return order == std::vector<int>{1, 5, 9};
}

auto test_done_callbacks_survive_non_exception_throw() -> bool {
  remex::Promise<int> promise;
  auto future = promise.get_future();
  std::vector<int> order;
  future.add_done_callback([](const remex::Future<int> &) { throw 42; });
  future.add_done_callback([&](const remex::Future<int> &) {
    order.push_back(1);
  });
  promise.set_value(3);
  return order == std::vector<int>{1} && future.result().value_or(0) == 3;
}

auto test_completion_queue_order() -> bool {
  std::vector<remex::Promise<int>> promises(3);
  remex::CompletionQueue<int> queue;
  for (auto &promise : promises) {
    queue.push(promise.get_future());
  }
  if (!queue.has_next() || queue.outstanding() != 3) {
    return false;
  }

  std::thread producer([&promises]() {
    for (int index : {2, 0, 1}) {
      std::this_thread::sleep_for(10ms);
      promises[static_cast<std::size_t>(index)].set_value(index * 10);
    }
  });

  std::vector<int> seen;
  while (queue.has_next()) {
    auto next = queue.next(std::nullopt);
    if (!next) {
      producer.join();
      return fail("queue next", next.error());
    }
    auto value = next->result();
    seen.push_back(value ? *value : -1);
  }
  producer.join();
  if (seen != std::vector<int>{20, 0, 10}) {
    return false;
  }
  auto empty = queue.next(std::nullopt);
  return !empty && empty.error().code == remex::ErrorCode::IllegalState;
}

auto test_completion_queue_deadline() -> bool {
  remex::Promise<int> slow;
  remex::CompletionQueue<int> queue;
  queue.push(slow.get_future());
  auto next = queue.next(remex::deadline_after(20ms));
  if (next || next.error().code != remex::ErrorCode::Timeout) {
    return false;
  }
  slow.set_value(1);
  next = queue.next(remex::deadline_after(1s));
  return next && next->result().value_or(0) == 1 && !queue.has_next();
}

auto test_cancelled_future_enters_queue() -> bool {
  remex::Promise<int> promise;
  remex::CompletionQueue<int> queue;
  queue.push(promise.get_future());
  promise.get_future().cancel();
  auto next = queue.next(remex::deadline_after(100ms));
  return next && next->cancelled();
}

} // namespace

auto run_future_tests(TestStats &stats) -> void {
  run_test("promise_resolves_value", test_promise_resolves_value, stats);
  run_test("void_future", test_void_future, stats);
  run_test("cancel_pending", test_cancel_pending, stats);
  run_test("cancel_running_is_refused", test_cancel_running_is_refused, stats);
  run_test("result_timeout", test_result_timeout, stats);
  run_test("error_keeps_cause", test_error_keeps_cause, stats);
  run_test("rethrow_without_cause", test_rethrow_without_cause, stats);
  run_test("done_callbacks", test_done_callbacks, stats);
  run_test("done_callbacks_survive_non_exception_throw",
           test_done_callbacks_survive_non_exception_throw, stats);
  run_test("completion_queue_order", test_completion_queue_order, stats);
  run_test("completion_queue_deadline", test_completion_queue_deadline, stats);
  run_test("cancelled_future_enters_queue", test_cancelled_future_enters_queue,
           stats);
}
