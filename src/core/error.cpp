#include "core/error.hpp"

#include <format>
#include <stdexcept>

namespace remex {

auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::IllegalState:
    return "illegal_state";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::TaskFailure:
    return "task_failure";
  case ErrorCode::WorkerDied:
    return "worker_died";
  case ErrorCode::BackendUnavailable:
    return "backend_unavailable";
  }
  return "unknown";
}

auto rethrow(const ExecError &error) -> void {
  if (error.cause) {
    std::rethrow_exception(error.cause);
  }
  throw std::runtime_error(
      std::format("{}: {}", to_string(error.code), error.message));
}

} // namespace remex
