#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace remex {

enum class ErrorCode {
  InvalidArgument,
  IllegalState,
  Timeout,
  Cancelled,
  TaskFailure,
  WorkerDied,
  BackendUnavailable,
};

struct ExecError {
  ErrorCode code = ErrorCode::TaskFailure;
  std::string message;
  /// Exception raised by the task body (set for TaskFailure).
  std::exception_ptr cause;
};

template <typename T>
using Expected = tl::expected<T, ExecError>;

inline auto make_error(ErrorCode code, std::string message) -> ExecError {
  return ExecError{code, std::move(message), nullptr};
}

auto to_string(ErrorCode code) -> std::string_view;

/// Rethrow the task's own exception, or a std::runtime_error carrying the
/// message when the error did not come from a task body.
[[noreturn]] auto rethrow(const ExecError &error) -> void;

} // namespace remex
