#pragma once

#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <cxxabi.h>

#include "core/error.hpp"
#include "core/future.hpp"

namespace remex::backend {

/// A unit of work as the backend sees it.
///
/// `run` executes the work and resolves its handle; `abort` resolves the
/// handle with a backend error without running anything. Exactly one of the
/// two is called.
struct TaskEnvelope {
  std::string name;
  std::function<void()> run;
  std::function<void(ExecError)> abort;
};

namespace detail {

/// Run `fn` and store its outcome. Skips the call if the handle was cancelled.
template <typename R, typename Fn>
auto fulfill(const Promise<R> &promise, Fn &fn) -> void {
  if (!promise.set_running_or_notify_cancel()) {
    return;
  }
  try {
    if constexpr (std::is_void_v<R>) {
      fn();
      promise.set_value();
    } else {
      promise.set_value(fn());
    }
  } catch (const std::exception &ex) {
    promise.set_error(
        ExecError{ErrorCode::TaskFailure, ex.what(), std::current_exception()});
  } catch (...) {
    promise.set_error(ExecError{ErrorCode::TaskFailure, "unknown exception",
                                std::current_exception()});
  }
}

/// Demangled type name of a callable, used to label remote tasks.
template <typename Fn> auto callable_name() -> std::string {
  const char *mangled = typeid(Fn).name();
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status != 0 || !demangled) {
    return mangled;
  }
  return demangled.get();
}

/// Wrap `fn` into an envelope that resolves `promise`.
template <typename R, typename Fn>
auto make_envelope(std::string name, Promise<R> promise, Fn fn)
    -> TaskEnvelope {
  TaskEnvelope envelope;
  envelope.name = std::move(name);
  envelope.run = [promise, fn = std::move(fn)]() mutable {
    fulfill(promise, fn);
  };
  envelope.abort = [promise](ExecError error) {
    promise.set_error(std::move(error));
  };
  return envelope;
}

} // namespace detail
} // namespace remex::backend
