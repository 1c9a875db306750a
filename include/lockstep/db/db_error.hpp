#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace lockstep::db {

// Database failures, mapped from SQLSTATE where the server reports one.
enum class DbErrc : std::uint8_t {
  Success = 0,
  ConnectionFailed,
  QueryFailed,
  DeadlockDetected,     // 40P01
  LockNotAvailable,     // 55P03
  QueryCanceled,        // 57014
  SerializationFailure, // 40001
  UniqueViolation,      // 23505
  UndefinedTable,       // 42P01
  SyntaxError,          // 42601
  PoolExhausted,
  PoolClosed,
};

class DbCategory : public std::error_category {
  static constexpr std::array<std::string_view, 12> messages = {
      "success",
      "database connection failed",
      "query failed",
      "deadlock detected",
      "lock not available",
      "query canceled",
      "serialization failure",
      "unique violation",
      "undefined table",
      "syntax error",
      "connection pool exhausted",
      "connection pool closed",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "lockstep.db";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= messages.size()) {
      return "unrecognized database error";
    }
    return std::string{messages.at(idx)};
  }

  [[nodiscard]] auto
  default_error_condition(int ev) const noexcept -> std::error_condition override {
    switch (static_cast<DbErrc>(ev)) {
    case DbErrc::QueryCanceled:
      return std::errc::operation_canceled;
    case DbErrc::DeadlockDetected:
      return std::errc::resource_deadlock_would_occur;
    case DbErrc::LockNotAvailable:
      return std::errc::resource_unavailable_try_again;
    case DbErrc::ConnectionFailed:
      return std::errc::connection_refused;
    default:
      return {ev, *this};
    }
  }
};

inline auto db_category() -> const DbCategory & {
  static const DbCategory instance;
  return instance;
}

inline auto make_error_code(DbErrc e) -> std::error_code {
  return {std::to_underlying(e), db_category()};
}

[[nodiscard]] constexpr auto from_sqlstate(std::string_view state) noexcept
    -> DbErrc {
  if (state == "40P01") {
    return DbErrc::DeadlockDetected;
  }
  if (state == "55P03") {
    return DbErrc::LockNotAvailable;
  }
  if (state == "57014") {
    return DbErrc::QueryCanceled;
  }
  if (state == "40001") {
    return DbErrc::SerializationFailure;
  }
  if (state == "23505") {
    return DbErrc::UniqueViolation;
  }
  if (state == "42P01") {
    return DbErrc::UndefinedTable;
  }
  if (state == "42601") {
    return DbErrc::SyntaxError;
  }
  // Class 08: connection exception.
  if (state.starts_with("08")) {
    return DbErrc::ConnectionFailed;
  }
  return DbErrc::QueryFailed;
}

[[nodiscard]] inline auto is_deadlock(const std::error_code &ec) -> bool {
  return ec == make_error_code(DbErrc::DeadlockDetected);
}

[[nodiscard]] inline auto is_lock_timeout(const std::error_code &ec) -> bool {
  return ec == make_error_code(DbErrc::LockNotAvailable) ||
         ec == make_error_code(DbErrc::QueryCanceled);
}

} // namespace lockstep::db

template <>
struct std::is_error_code_enum<lockstep::db::DbErrc> : std::true_type {};
