#pragma once

#include "lockstep/config/system_config.hpp"
#include "lockstep/core/coroutine.hpp"
#include "lockstep/core/error.hpp"
#include "lockstep/executor/lock_aware_executor.hpp"
#include "lockstep/graph/task.hpp"
#include "lockstep/graph/task_graph.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <flat_map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lockstep {

struct SqlOutcome {
  db::QueryResult result;
};

struct MigrationOutcome {
  std::size_t operations{0};
  std::vector<db::QueryResult> results;
};

struct GenerationOutcome {
  std::string generator;
  int files_generated{0};
  std::string timestamp;
};

struct ValidationOutcome {
  bool valid{true};
  std::size_t checked{0}; // tables or statements inspected
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::size_t high_risk_operations{0};
};

using TaskOutput = std::variant<SqlOutcome, MigrationOutcome,
                                GenerationOutcome, ValidationOutcome>;

struct TaskFailure {
  std::error_code code;
  std::string message;
};

using TaskAttempt = std::expected<TaskOutput, TaskFailure>;

struct TaskOutcome {
  bool success{false};
  int attempts{0};
  std::chrono::milliseconds duration{0};
  std::optional<TaskOutput> output;
  std::error_code error;
  std::string message;
};

struct RunSummary {
  bool success{false};
  std::chrono::milliseconds duration{0};
  std::size_t completed_tasks{0};
  std::size_t failed_tasks{0};
  std::flat_map<TaskId, TaskOutcome> results;
  std::error_code error;
  std::string message;
};

struct TaskRecord {
  TaskId task_id;
  TaskKind kind{TaskKind::Sql};
  bool success{false};
  int retry_count{0};
  std::chrono::milliseconds duration{0};
  std::error_code error;
  std::chrono::steady_clock::time_point finished_at;
};

struct OrchestratorStats {
  std::size_t running_tasks{0};
  std::size_t completed_tasks{0};
  std::size_t failed_tasks{0};
  std::size_t recent_tasks{0};
  double success_rate{1.0};
  std::chrono::milliseconds average_task_duration{0};
  ExecutorStats executor;
};

// Drives a TaskGraph to completion through a LockAwareExecutor. Ready tasks
// start in priority order up to max_concurrent_tasks; a task that needs
// exclusive access, or cannot run concurrently, runs alone, and tasks sharing
// a declared resource never overlap. Each attempt races task.timeout; a
// timed-out statement is not cancelled and keeps running server-side.
// Failed attempts are retried with exponential backoff until max_retries is
// spent, after which the task's dependents can never start.
class Orchestrator {
public:
  explicit Orchestrator(LockAwareExecutor &executor,
                        OrchestratorConfig config = {});

  Orchestrator(const Orchestrator &) = delete;
  auto operator=(const Orchestrator &) -> Orchestrator & = delete;

  // `graph` must stay alive until the returned task completes.
  [[nodiscard]] auto execute_task_graph(const TaskGraph &graph)
      -> lockstep::task<RunSummary>;

  // Runs one task's payload once, without timeout or retries.
  [[nodiscard]] auto perform(const Task &task) -> lockstep::task<TaskAttempt>;

  // Stops starting tasks, waits for in-flight attempts up to the grace
  // period, then drops the bookkeeping.
  auto shutdown() -> lockstep::task<void>;

  [[nodiscard]] auto retry_delay(int retry_count) const
      -> std::chrono::milliseconds;
  [[nodiscard]] auto stats() const -> OrchestratorStats;
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return in_flight_;
  }
  [[nodiscard]] auto shutting_down() const noexcept -> bool {
    return shutting_down_;
  }
  [[nodiscard]] auto history() const noexcept
      -> const std::deque<TaskRecord> & {
    return history_;
  }

private:
  using Completion = boost::asio::experimental::channel<void(
      boost::system::error_code, TaskId, TaskOutcome)>;
  using AttemptChannel = boost::asio::experimental::channel<void(
      boost::system::error_code, TaskAttempt)>;

  struct AttemptState {
    explicit AttemptState(boost::asio::any_io_executor ex) : done(ex, 1) {}
    AttemptChannel done;
  };

  [[nodiscard]] auto run_task(Task task, Completion &done)
      -> lockstep::task<void>;
  [[nodiscard]] auto attempt_once(const Task &task)
      -> lockstep::task<TaskAttempt>;
  [[nodiscard]] auto perform_and_report(Task task,
                                        std::shared_ptr<AttemptState> state)
      -> lockstep::task<void>;

  [[nodiscard]] auto run_sql(const Task &task, const SqlPayload &payload)
      -> lockstep::task<TaskAttempt>;
  [[nodiscard]] auto run_migration(const Task &task,
                                   const MigrationPayload &payload)
      -> lockstep::task<TaskAttempt>;

  auto record(const Task &task, bool success, std::error_code error,
              std::chrono::steady_clock::time_point started) -> void;

  LockAwareExecutor &executor_;
  OrchestratorConfig config_;
  std::deque<TaskRecord> history_;
  std::size_t running_{0};
  std::size_t completed_{0};
  std::size_t failed_{0};
  std::size_t in_flight_{0};
  bool shutting_down_{false};
};

// Checks that are pure functions of the payload.
[[nodiscard]] auto generate(const GenerationPayload &payload)
    -> GenerationOutcome;
[[nodiscard]] auto validate(const ValidationPayload &payload)
    -> ValidationOutcome;

} // namespace lockstep
