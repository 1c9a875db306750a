#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace lockstep {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  AlreadyExists,
  Cancelled,
  // task graph
  CycleDetected,
  UnresolvedDependency,
  // advisory locks
  LockFailed,
  LockTimeout,
  LockConflict,
  // executor and orchestration
  QueueTimeout,
  TaskFailed,
  TaskTimeout,
  ValidationFailed,
  ShuttingDown,
};

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "lockstep";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
    case Error::Success:
      return "success";
    case Error::FileNotFound:
      return "file not found";
    case Error::ParseError:
      return "parse error";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::AlreadyExists:
      return "already exists";
    case Error::Cancelled:
      return "cancelled";
    case Error::CycleDetected:
      return "circular dependency detected in task graph";
    case Error::UnresolvedDependency:
      return "task depends on an unknown task";
    case Error::LockFailed:
      return "advisory lock operation failed";
    case Error::LockTimeout:
      return "timed out waiting for advisory lock";
    case Error::LockConflict:
      return "advisory lock held by another session";
    case Error::QueueTimeout:
      return "timed out waiting in resource queue";
    case Error::TaskFailed:
      return "task failed";
    case Error::TaskTimeout:
      return "task timed out";
    case Error::ValidationFailed:
      return "validation failed";
    case Error::ShuttingDown:
      return "shutting down";
    }
    return "unrecognized lockstep error";
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace lockstep

template <> struct std::is_error_code_enum<lockstep::Error> : std::true_type {};
