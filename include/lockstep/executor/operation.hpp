#pragma once

#include "lockstep/db/types.hpp"
#include "lockstep/util/id.hpp"

#include <format>
#include <string>
#include <system_error>
#include <vector>

namespace lockstep {

// A single statement submitted to the executor.
struct Operation {
  OperationId id;
  std::string sql;
  std::vector<db::Param> params;
  bool transaction{false}; // wrap in BEGIN/COMMIT, ROLLBACK on failure
};

struct ExecutionContext {
  TaskId task_id;      // owning task, empty for direct calls
  int retry_count{0};  // deadlock retries already spent
};

// Terminal executor failure. `code` is the underlying cause (a db::DbErrc
// from the server, or a lockstep::Error such as QueueTimeout).
struct OperationError {
  std::error_code code;
  OperationId operation_id;
  std::string sql;
  int attempts{1};

  [[nodiscard]] auto message() const -> std::string {
    return std::format("operation {} failed after {} attempt(s): {}",
                       operation_id, attempts, code.message());
  }
};

} // namespace lockstep
