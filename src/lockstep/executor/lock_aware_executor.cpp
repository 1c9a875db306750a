#include "lockstep/executor/lock_aware_executor.hpp"

#include "lockstep/db/db_error.hpp"
#include "lockstep/util/log.hpp"
#include "lockstep/util/time.hpp"

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace lockstep {

namespace {

constexpr std::chrono::seconds kRecentWindow{60};

} // namespace

LockAwareExecutor::LockAwareExecutor(db::ConnectionPool &pool,
                                     ExecutorConfig config)
    : pool_(pool), config_(std::move(config)) {}

auto LockAwareExecutor::backoff_delay(int retry_count) const
    -> std::chrono::milliseconds {
  return config_.deadlock_backoff *
         (std::int64_t{1} << std::clamp(retry_count, 0, 30));
}

auto LockAwareExecutor::has_conflicts(const LockAnalysis &analysis,
                                      std::string_view key) const -> bool {
  if (auto it = active_.find(std::string{key});
      it != active_.end() && !it->second.empty()) {
    if (analysis.level == LockLevel::AccessExclusive) {
      return true;
    }
    for (const auto &running : it->second) {
      if (locks_conflict(running.analysis.level, analysis.level)) {
        return true;
      }
      if (analysis.type == StatementType::ConcurrentIndex &&
          running.analysis.type == StatementType::ConcurrentIndex) {
        return true;
      }
    }
  }

  // Backpressure only defers work while something of ours is running and
  // will free a connection; otherwise the pool's own wait applies.
  if (active_total_ > 0 &&
      pool_.stats().utilization() > config_.backpressure_threshold) {
    return true;
  }
  return active_total_ >= static_cast<std::size_t>(config_.max_concurrency);
}

auto LockAwareExecutor::execute(Operation op, ExecutionContext ctx)
    -> task<ExecutionResult> {
  if (op.id.empty()) {
    op.id = OperationId{std::format("op-{}", next_generated_id_++)};
  }
  const auto analysis = analyze_lock_level(op.sql);
  const auto key = resource_key(op.sql);

  for (;;) {
    const auto started = std::chrono::steady_clock::now();
    auto result = co_await run_once(op, analysis, key);
    record(op, key, analysis, result ? std::error_code{} : result.error(),
           started);
    if (result) {
      co_return std::move(*result);
    }

    const auto ec = result.error();
    if (db::is_deadlock(ec) && ctx.retry_count < config_.deadlock_retries) {
      const auto delay = backoff_delay(ctx.retry_count);
      log::warn("Deadlock on operation {} [{}], retry {}/{} in {}ms", op.id,
                key, ctx.retry_count + 1, config_.deadlock_retries,
                delay.count());
      if (auto slept = co_await async_sleep(delay); !slept) {
        co_return std::unexpected{OperationError{
            slept.error(), op.id, op.sql, ctx.retry_count + 1}};
      }
      ++ctx.retry_count;
      continue;
    }

    log::error("Operation {} [{}] failed after {} attempt(s): {}", op.id, key,
               ctx.retry_count + 1, ec.message());
    co_return std::unexpected{
        OperationError{ec, op.id, op.sql, ctx.retry_count + 1}};
  }
}

auto LockAwareExecutor::run_once(const Operation &op,
                                 const LockAnalysis &analysis,
                                 const std::string &key)
    -> task<Result<db::QueryResult>> {
  auto slot = co_await admit(analysis, key);
  if (!slot) {
    co_return fail(slot.error());
  }
  // Destroyed in reverse order: the connection goes back to the pool before
  // the reservation is dropped and the queue drained.
  Reservation reservation{*this, key, *slot};

  auto conn = co_await pool_.acquire();
  if (!conn) {
    co_return fail(conn.error());
  }
  db::ConnectionLease lease{pool_, std::move(*conn)};

  if (auto set = co_await lease->query(std::format(
          "SET lock_timeout = '{}ms'", config_.lock_timeout.count()));
      !set) {
    co_return fail(set.error());
  }
  co_return co_await run_statement(*lease, op);
}

auto LockAwareExecutor::run_statement(db::Connection &conn, const Operation &op)
    -> task<Result<db::QueryResult>> {
  if (!op.transaction) {
    co_return co_await conn.query(op.sql, op.params);
  }

  if (auto begin = co_await conn.query("BEGIN"); !begin) {
    co_return fail(begin.error());
  }
  auto result = co_await conn.query(op.sql, op.params);
  if (!result) {
    if (auto rb = co_await conn.query("ROLLBACK"); !rb) {
      log::error("ROLLBACK failed for operation {}: {}", op.id,
                 rb.error().message());
    }
    co_return result;
  }
  if (auto commit = co_await conn.query("COMMIT"); !commit) {
    co_return fail(commit.error());
  }
  co_return result;
}

auto LockAwareExecutor::admit(const LockAnalysis &analysis,
                              const std::string &key)
    -> task<Result<std::uint64_t>> {
  using namespace awaitable_ops;

  // Arrivals never overtake operations already waiting on the same key.
  const auto waiting = queues_.find(key);
  if ((waiting == queues_.end() || waiting->second.empty()) &&
      !has_conflicts(analysis, key)) {
    co_return reserve(analysis, key);
  }

  auto ex = co_await boost::asio::this_coro::executor;
  auto entry = std::make_shared<QueueEntry>(ex, analysis);
  queues_[key].push_back(entry);
  log::debug("Queued {} operation on [{}] ({} waiting)",
             to_string_view(analysis.level), key, queues_[key].size());

  boost::asio::steady_timer timer{ex};
  timer.expires_after(config_.lock_timeout);
  [[maybe_unused]] auto outcome = co_await (
      entry->signal.async_receive(use_nothrow) || timer.async_wait(use_nothrow));

  // Admission may land in the same tick as the timeout; the slot is already
  // reserved, so take it.
  if (entry->admitted) {
    log::debug("Admitted {} operation on [{}] after {}ms",
               to_string_view(analysis.level), key,
               util::elapsed_ms(entry->queued_at));
    co_return entry->slot;
  }

  entry->abandoned = true;
  if (auto it = queues_.find(key); it != queues_.end()) {
    std::erase(it->second, entry);
  }
  // The abandoned entry may have been holding back the ones behind it.
  drain(key);
  log::warn("Operation on [{}] timed out after {}ms in queue", key,
            config_.lock_timeout.count());
  co_return fail(Error::QueueTimeout);
}

auto LockAwareExecutor::reserve(const LockAnalysis &analysis,
                                const std::string &key) -> std::uint64_t {
  const auto seq = next_seq_++;
  active_[key].push_back({seq, analysis, std::chrono::steady_clock::now()});
  ++active_total_;
  return seq;
}

auto LockAwareExecutor::finish(const std::string &key, std::uint64_t seq)
    -> void {
  if (auto it = active_.find(key); it != active_.end()) {
    auto removed = std::erase_if(
        it->second, [seq](const ActiveRecord &r) { return r.seq == seq; });
    active_total_ -= removed;
    if (it->second.empty()) {
      active_.erase(it);
    }
  }
  drain(key);
  drain_all();
}

auto LockAwareExecutor::drain(const std::string &key) -> void {
  auto it = queues_.find(key);
  if (it == queues_.end()) {
    return;
  }
  auto &queue = it->second;
  while (!queue.empty()) {
    auto &front = queue.front();
    if (front->abandoned) {
      queue.pop_front();
      continue;
    }
    if (has_conflicts(front->analysis, key)) {
      break;
    }
    front->slot = reserve(front->analysis, key);
    front->admitted = true;
    (void)front->signal.try_send(boost::system::error_code{});
    queue.pop_front();
  }
  if (queue.empty()) {
    queues_.erase(it);
  }
}

// Capacity freed on one key can admit work blocked only by the global
// ceiling or backpressure on another.
auto LockAwareExecutor::drain_all() -> void {
  std::vector<std::string> keys;
  keys.reserve(queues_.size());
  for (const auto &[key, queue] : queues_) {
    keys.push_back(key);
  }
  for (const auto &key : keys) {
    drain(key);
  }
}

auto LockAwareExecutor::record(const Operation &op, const std::string &key,
                               const LockAnalysis &analysis,
                               std::error_code error,
                               std::chrono::steady_clock::time_point started)
    -> void {
  const auto now = std::chrono::steady_clock::now();
  history_.push_back(
      {op.id, key, analysis.level, !error, error,
       std::chrono::duration_cast<std::chrono::milliseconds>(now - started),
       now});
  while (history_.size() > config_.history_size) {
    history_.pop_front();
  }
}

auto LockAwareExecutor::stats() const -> ExecutorStats {
  ExecutorStats out;
  out.active_locks = active_.size();
  out.active_operations = active_total_;
  for (const auto &[key, queue] : queues_) {
    out.queued_operations += static_cast<std::size_t>(std::ranges::count_if(
        queue, [](const auto &e) { return !e->abandoned; }));
  }

  const auto cutoff = std::chrono::steady_clock::now() - kRecentWindow;
  std::size_t succeeded = 0;
  std::chrono::milliseconds total{0};
  for (const auto &rec : history_) {
    if (rec.finished_at < cutoff) {
      continue;
    }
    ++out.recent_operations;
    succeeded += rec.success ? 1 : 0;
    total += rec.duration;
  }
  if (out.recent_operations > 0) {
    out.success_rate = static_cast<double>(succeeded) /
                       static_cast<double>(out.recent_operations);
    out.average_duration =
        total / static_cast<std::int64_t>(out.recent_operations);
  }
  return out;
}

auto LockAwareExecutor::active_count(std::string_view key) const
    -> std::size_t {
  auto it = active_.find(std::string{key});
  return it == active_.end() ? 0 : it->second.size();
}

auto LockAwareExecutor::queued_count(std::string_view key) const
    -> std::size_t {
  auto it = queues_.find(std::string{key});
  return it == queues_.end() ? 0 : it->second.size();
}

} // namespace lockstep
