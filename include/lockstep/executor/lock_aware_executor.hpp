#pragma once

#include "lockstep/config/system_config.hpp"
#include "lockstep/core/coroutine.hpp"
#include "lockstep/core/error.hpp"
#include "lockstep/db/connection.hpp"
#include "lockstep/executor/operation.hpp"
#include "lockstep/sql/lock_analysis.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lockstep {

using ExecutionResult = std::expected<db::QueryResult, OperationError>;

struct ExecutorStats {
  std::size_t active_locks{0}; // resource keys with running operations
  std::size_t active_operations{0};
  std::size_t queued_operations{0};
  std::size_t recent_operations{0}; // attempts finished in the last minute
  double success_rate{1.0};
  std::chrono::milliseconds average_duration{0};
};

// One finished attempt.
struct AttemptRecord {
  OperationId operation_id;
  std::string resource_key;
  LockLevel level{LockLevel::AccessShare};
  bool success{false};
  std::error_code error;
  std::chrono::milliseconds duration{0};
  std::chrono::steady_clock::time_point finished_at;
};

// Runs statements on pooled connections while keeping conflicting table locks
// apart. Every statement is classified and keyed by the tables it touches;
// a statement whose lock level conflicts with one already running on the same
// key waits in that key's FIFO queue until it can be admitted. Admission also
// honours a global concurrency ceiling and pool backpressure.
//
// All bookkeeping lives on the io_context that drives execute(); it is not
// thread-safe. The pool must outlive the executor.
class LockAwareExecutor {
public:
  explicit LockAwareExecutor(db::ConnectionPool &pool,
                             ExecutorConfig config = {});

  LockAwareExecutor(const LockAwareExecutor &) = delete;
  auto operator=(const LockAwareExecutor &) -> LockAwareExecutor & = delete;

  // Runs `op`, queueing first if needed. Deadlocks are retried after an
  // exponential backoff; any other failure, an exhausted retry budget, or
  // a queue wait longer than the lock timeout is returned as OperationError.
  [[nodiscard]] auto execute(Operation op, ExecutionContext ctx = {})
      -> task<ExecutionResult>;

  // True when an operation with `analysis` on `key` cannot start right now.
  [[nodiscard]] auto has_conflicts(const LockAnalysis &analysis,
                                   std::string_view key) const -> bool;

  // Delay before deadlock retry number `retry_count` (0-based).
  [[nodiscard]] auto backoff_delay(int retry_count) const
      -> std::chrono::milliseconds;

  [[nodiscard]] auto stats() const -> ExecutorStats;
  [[nodiscard]] auto active_count(std::string_view key) const -> std::size_t;
  [[nodiscard]] auto queued_count(std::string_view key) const -> std::size_t;
  [[nodiscard]] auto history() const noexcept
      -> const std::deque<AttemptRecord> & {
    return history_;
  }
  [[nodiscard]] auto config() const noexcept -> const ExecutorConfig & {
    return config_;
  }

private:
  using Signal = boost::asio::experimental::channel<void(
      boost::system::error_code)>;

  struct ActiveRecord {
    std::uint64_t seq{0};
    LockAnalysis analysis;
    std::chrono::steady_clock::time_point started;
  };

  struct QueueEntry {
    QueueEntry(boost::asio::any_io_executor ex, LockAnalysis a)
        : signal(ex, 1), analysis(a),
          queued_at(std::chrono::steady_clock::now()) {}

    Signal signal;
    LockAnalysis analysis;
    std::chrono::steady_clock::time_point queued_at;
    std::uint64_t slot{0};
    bool admitted{false};
    bool abandoned{false};
  };

  // Holds an admitted slot; releasing it re-runs admission.
  class Reservation {
  public:
    Reservation(LockAwareExecutor &owner, std::string key, std::uint64_t seq)
        : owner_(&owner), key_(std::move(key)), seq_(seq) {}
    ~Reservation() { owner_->finish(key_, seq_); }

    Reservation(const Reservation &) = delete;
    auto operator=(const Reservation &) -> Reservation & = delete;

  private:
    LockAwareExecutor *owner_;
    std::string key_;
    std::uint64_t seq_;
  };

  [[nodiscard]] auto admit(const LockAnalysis &analysis,
                           const std::string &key) -> task<Result<std::uint64_t>>;
  [[nodiscard]] auto run_once(const Operation &op, const LockAnalysis &analysis,
                              const std::string &key)
      -> task<Result<db::QueryResult>>;
  [[nodiscard]] auto run_statement(db::Connection &conn, const Operation &op)
      -> task<Result<db::QueryResult>>;

  auto reserve(const LockAnalysis &analysis, const std::string &key)
      -> std::uint64_t;
  auto finish(const std::string &key, std::uint64_t seq) -> void;
  auto drain(const std::string &key) -> void;
  auto drain_all() -> void;
  auto record(const Operation &op, const std::string &key,
              const LockAnalysis &analysis, std::error_code error,
              std::chrono::steady_clock::time_point started) -> void;

  db::ConnectionPool &pool_;
  ExecutorConfig config_;
  ankerl::unordered_dense::map<std::string, std::vector<ActiveRecord>> active_;
  ankerl::unordered_dense::map<std::string,
                               std::deque<std::shared_ptr<QueueEntry>>>
      queues_;
  std::deque<AttemptRecord> history_;
  std::size_t active_total_{0};
  std::uint64_t next_seq_{1};
  std::uint64_t next_generated_id_{1};
};

} // namespace lockstep
