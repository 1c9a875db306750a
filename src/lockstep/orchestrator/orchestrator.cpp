#include "lockstep/orchestrator/orchestrator.hpp"

#include "lockstep/sql/lock_analysis.hpp"
#include "lockstep/util/log.hpp"
#include "lockstep/util/time.hpp"

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <set>
#include <utility>

namespace lockstep {

namespace {

constexpr std::chrono::seconds kRecentWindow{60};

auto runs_alone(const Task &task) -> bool {
  return task.requires_exclusive_access || !task.can_run_concurrently;
}

auto shares_resource(const std::set<std::string> &a,
                     const std::set<std::string> &b) -> bool {
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia == *ib) {
      return true;
    }
    if (*ia < *ib) {
      ++ia;
    } else {
      ++ib;
    }
  }
  return false;
}

auto is_blank(std::string_view s) -> bool {
  return std::ranges::all_of(
      s, [](unsigned char c) { return std::isspace(c) != 0; });
}

auto join_ids(const std::vector<TaskId> &ids) -> std::string {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ", ";
    }
    out += id.str();
  }
  return out;
}

auto describe_cycles(const std::vector<std::vector<TaskId>> &cycles)
    -> std::string {
  std::string out;
  for (const auto &cycle : cycles) {
    if (!out.empty()) {
      out += ", ";
    }
    for (std::size_t i = 0; i < cycle.size(); ++i) {
      out += i == 0 ? "" : " -> ";
      out += cycle[i].str();
    }
  }
  return out;
}

} // namespace

auto generate(const GenerationPayload &payload) -> GenerationOutcome {
  return {payload.generator, payload.expected_files,
          util::format_timestamp()};
}

auto validate(const ValidationPayload &payload) -> ValidationOutcome {
  ValidationOutcome out;
  switch (payload.kind) {
  case ValidationKind::Schema: {
    out.checked = payload.tables.size();
    if (payload.tables.empty()) {
      out.errors.emplace_back("schema declares no tables");
    }
    std::set<std::string> seen;
    for (const auto &[i, table] : std::views::enumerate(payload.tables)) {
      if (is_blank(table)) {
        out.errors.push_back(std::format("table {} has an empty name", i + 1));
      } else if (!seen.insert(table).second) {
        out.errors.push_back(std::format("table {} is declared twice", table));
      }
    }
    break;
  }
  case ValidationKind::Migration: {
    out.checked = payload.statements.size();
    for (const auto &[i, statement] :
         std::views::enumerate(payload.statements)) {
      if (is_blank(statement)) {
        out.errors.push_back(std::format("statement {} is empty", i + 1));
        continue;
      }
      const auto analysis = analyze_lock_level(statement);
      if (analysis.level == LockLevel::AccessExclusive) {
        ++out.high_risk_operations;
        out.warnings.push_back(
            std::format("statement {} takes ACCESS EXCLUSIVE on [{}]", i + 1,
                        resource_key(statement)));
      } else if (analysis.type == StatementType::Unknown) {
        out.warnings.push_back(std::format(
            "statement {} not recognized, assuming EXCLUSIVE", i + 1));
      }
    }
    break;
  }
  }
  out.valid = out.errors.empty();
  return out;
}

Orchestrator::Orchestrator(LockAwareExecutor &executor,
                           OrchestratorConfig config)
    : executor_(executor), config_(std::move(config)) {}

auto Orchestrator::retry_delay(int retry_count) const
    -> std::chrono::milliseconds {
  return config_.retry_backoff *
         (std::int64_t{1} << std::clamp(retry_count, 0, 30));
}

auto Orchestrator::execute_task_graph(const TaskGraph &graph)
    -> lockstep::task<RunSummary> {
  const auto started = std::chrono::steady_clock::now();
  RunSummary summary;
  auto finish = [&](std::error_code ec, std::string message) {
    summary.success = !ec;
    summary.error = ec;
    summary.message = std::move(message);
    summary.completed_tasks = completed_;
    summary.failed_tasks = failed_;
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (ec) {
      log::error("Run failed after {}ms: {}", summary.duration.count(),
                 summary.message);
    } else {
      log::info("Run completed {} task(s) in {}ms", summary.completed_tasks,
                summary.duration.count());
    }
    return std::move(summary);
  };

  running_ = completed_ = failed_ = 0;
  if (shutting_down_) {
    co_return finish(make_error_code(Error::ShuttingDown),
                     "orchestrator is shutting down");
  }

  // Graphs that cannot be fully ordered never start.
  if (auto cycles = graph.detect_cycles(); !cycles.empty()) {
    co_return finish(make_error_code(Error::CycleDetected),
                     std::format("circular dependencies detected: {}",
                                 describe_cycles(cycles)));
  }
  if (auto missing = graph.unresolved_dependencies(); !missing.empty()) {
    co_return finish(make_error_code(Error::UnresolvedDependency),
                     std::format("task {} depends on unknown task {}",
                                 missing.front().task,
                                 missing.front().missing));
  }

  auto ex = co_await boost::asio::this_coro::executor;
  Completion done{ex, graph.size() + 1};
  TaskIdSet completed;
  TaskIdSet failed;
  std::vector<const Task *> running;
  const auto limit = static_cast<std::size_t>(
      std::max(config_.max_concurrent_tasks, 1));

  log::info("Executing {} task(s), up to {} at a time", graph.size(), limit);

  while (completed.size() < graph.size()) {
    if (!shutting_down_) {
      for (const Task *candidate : graph.get_ready_tasks(completed)) {
        if (running.size() >= limit) {
          break;
        }
        if (failed.contains(candidate->id) ||
            std::ranges::find(running, candidate) != running.end()) {
          continue;
        }
        const bool blocked =
            (runs_alone(*candidate) && !running.empty()) ||
            std::ranges::any_of(running, [&](const Task *r) {
              return runs_alone(*r) ||
                     shares_resource(r->resources, candidate->resources);
            });
        if (blocked) {
          continue;
        }
        running.push_back(candidate);
        running_ = running.size();
        log::debug("Starting task {} (priority {})", candidate->id,
                   candidate->priority);
        co_spawn(ex, run_task(*candidate, done), detached);
      }
    }

    if (running.empty()) {
      break;
    }

    auto [ec, id, outcome] = co_await done.async_receive(use_nothrow);
    if (ec) {
      co_return finish(ec, "completion channel closed");
    }
    std::erase_if(running, [&](const Task *t) { return t->id == id; });
    running_ = running.size();
    if (outcome.success) {
      completed.insert(id);
      ++completed_;
    } else {
      failed.insert(id);
      ++failed_;
    }
    summary.results.insert_or_assign(std::move(id), std::move(outcome));
  }

  if (completed.size() == graph.size()) {
    co_return finish({}, std::format("completed {} task(s)", completed.size()));
  }

  if (shutting_down_ && failed.empty()) {
    co_return finish(make_error_code(Error::ShuttingDown),
                     "shutdown requested before the graph finished");
  }

  // Nothing is running and nothing can start: the remaining tasks sit behind
  // permanent failures.
  std::vector<TaskId> failed_ids;
  std::vector<TaskId> blocked_ids;
  for (const auto &task : graph.tasks()) {
    if (failed.contains(task.id)) {
      failed_ids.push_back(task.id);
    } else if (!completed.contains(task.id)) {
      blocked_ids.push_back(task.id);
    }
  }
  auto message = std::format("tasks failed: {}", join_ids(failed_ids));
  if (!blocked_ids.empty()) {
    message += std::format("; blocked: {}", join_ids(blocked_ids));
  }
  co_return finish(make_error_code(Error::TaskFailed), std::move(message));
}

auto Orchestrator::run_task(Task task, Completion &done) -> lockstep::task<void> {
  const auto started = std::chrono::steady_clock::now();
  TaskOutcome outcome;

  for (;;) {
    const auto attempt_started = std::chrono::steady_clock::now();
    ++outcome.attempts;
    auto attempt = co_await attempt_once(task);
    record(task, attempt.has_value(),
           attempt ? std::error_code{} : attempt.error().code,
           attempt_started);

    if (attempt) {
      outcome.success = true;
      outcome.output = std::move(*attempt);
      break;
    }

    outcome.error = attempt.error().code;
    outcome.message = std::move(attempt.error().message);
    if (task.retry_count >= task.max_retries || shutting_down_) {
      log::error("Task {} failed permanently after {} attempt(s): {}", task.id,
                 outcome.attempts, outcome.message);
      break;
    }

    const auto delay = retry_delay(task.retry_count);
    log::warn("Task {} failed ({}), retry {}/{} in {}ms", task.id,
              outcome.message, task.retry_count + 1, task.max_retries,
              delay.count());
    if (auto slept = co_await async_sleep(delay); !slept) {
      outcome.error = slept.error();
      outcome.message = slept.error().message();
      break;
    }
    // Retries run on an extended copy; the graph's task is never touched.
    auto next = task.extend().retry_count(task.retry_count + 1).build();
    if (!next) {
      outcome.error = next.error();
      outcome.message = next.error().message();
      break;
    }
    task = std::move(*next);
  }

  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  auto [ec] = co_await done.async_send(boost::system::error_code{}, task.id,
                                       std::move(outcome), use_nothrow);
  if (ec) {
    log::error("Dropped completion of task {}: {}", task.id, ec.message());
  }
}

auto Orchestrator::attempt_once(const Task &task)
    -> lockstep::task<TaskAttempt> {
  using namespace awaitable_ops;

  auto ex = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<AttemptState>(ex);
  ++in_flight_;
  co_spawn(ex, perform_and_report(task, state), detached);

  boost::asio::steady_timer timer{ex};
  timer.expires_after(task.timeout);
  auto winner = co_await (state->done.async_receive(use_nothrow) ||
                          timer.async_wait(use_nothrow));

  if (winner.index() == 0) {
    auto [ec, attempt] = std::get<0>(std::move(winner));
    if (ec) {
      co_return std::unexpected{TaskFailure{ec, ec.message()}};
    }
    co_return std::move(attempt);
  }
  log::warn("Task {} timed out after {}ms", task.id, task.timeout.count());
  co_return std::unexpected{TaskFailure{
      make_error_code(Error::TaskTimeout),
      std::format("task {} timed out after {}ms", task.id,
                  task.timeout.count())}};
}

auto Orchestrator::perform_and_report(Task task,
                                      std::shared_ptr<AttemptState> state)
    -> lockstep::task<void> {
  auto attempt = co_await perform(task);
  --in_flight_;
  // After a timeout nobody is listening; the buffered value is discarded.
  (void)state->done.try_send(boost::system::error_code{}, std::move(attempt));
}

auto Orchestrator::perform(const Task &task) -> lockstep::task<TaskAttempt> {
  switch (task.kind()) {
  case TaskKind::Sql:
    co_return co_await run_sql(task, std::get<SqlPayload>(task.payload));
  case TaskKind::Migration:
    co_return co_await run_migration(task,
                                     std::get<MigrationPayload>(task.payload));
  case TaskKind::Generation:
    co_return generate(std::get<GenerationPayload>(task.payload));
  case TaskKind::Validation: {
    auto outcome = validate(std::get<ValidationPayload>(task.payload));
    if (!outcome.valid) {
      std::string message;
      for (const auto &e : outcome.errors) {
        message += message.empty() ? e : "; " + e;
      }
      co_return std::unexpected{
          TaskFailure{make_error_code(Error::ValidationFailed), message}};
    }
    co_return std::move(outcome);
  }
  }
  co_return std::unexpected{
      TaskFailure{make_error_code(Error::InvalidArgument), "unknown task kind"}};
}

auto Orchestrator::run_sql(const Task &task, const SqlPayload &payload)
    -> lockstep::task<TaskAttempt> {
  Operation op{OperationId{task.id.str()}, payload.sql, payload.params,
               payload.transaction};
  auto result = co_await executor_.execute(std::move(op),
                                           ExecutionContext{task.id, 0});
  if (!result) {
    co_return std::unexpected{
        TaskFailure{result.error().code, result.error().message()}};
  }
  co_return SqlOutcome{std::move(*result)};
}

auto Orchestrator::run_migration(const Task &task,
                                 const MigrationPayload &payload)
    -> lockstep::task<TaskAttempt> {
  MigrationOutcome outcome;
  for (const auto &[i, source] : std::views::enumerate(payload.operations)) {
    auto op = source;
    if (op.id.empty()) {
      op.id = OperationId{std::format("{}.{}", task.id, i + 1)};
    }
    auto result = co_await executor_.execute(std::move(op),
                                             ExecutionContext{task.id, 0});
    if (!result) {
      co_return std::unexpected{TaskFailure{
          result.error().code,
          std::format("{} of {}: {}", i + 1, payload.operations.size(),
                      result.error().message())}};
    }
    outcome.results.push_back(std::move(*result));
    ++outcome.operations;
  }
  co_return std::move(outcome);
}

auto Orchestrator::shutdown() -> lockstep::task<void> {
  shutting_down_ = true;
  const auto started = std::chrono::steady_clock::now();
  log::info("Shutting down, {} attempt(s) in flight", in_flight_);

  while (in_flight_ > 0 &&
         std::chrono::steady_clock::now() - started < config_.shutdown_grace) {
    if (auto slept = co_await async_sleep(config_.shutdown_poll); !slept) {
      break;
    }
  }
  if (in_flight_ > 0) {
    log::warn("Abandoning {} in-flight attempt(s) after {}ms", in_flight_,
              util::elapsed_ms(started));
  }
  running_ = 0;
}

auto Orchestrator::record(const Task &task, bool success,
                          std::error_code error,
                          std::chrono::steady_clock::time_point started)
    -> void {
  const auto now = std::chrono::steady_clock::now();
  history_.push_back(
      {task.id, task.kind(), success, task.retry_count,
       std::chrono::duration_cast<std::chrono::milliseconds>(now - started),
       error, now});
  while (history_.size() > config_.history_size) {
    history_.pop_front();
  }
}

auto Orchestrator::stats() const -> OrchestratorStats {
  OrchestratorStats out;
  out.running_tasks = running_;
  out.completed_tasks = completed_;
  out.failed_tasks = failed_;
  out.executor = executor_.stats();

  const auto cutoff = std::chrono::steady_clock::now() - kRecentWindow;
  std::size_t succeeded = 0;
  std::chrono::milliseconds total{0};
  for (const auto &rec : history_) {
    if (rec.finished_at < cutoff) {
      continue;
    }
    ++out.recent_tasks;
    succeeded += rec.success ? 1 : 0;
    total += rec.duration;
  }
  if (out.recent_tasks > 0) {
    out.success_rate = static_cast<double>(succeeded) /
                       static_cast<double>(out.recent_tasks);
    out.average_task_duration =
        total / static_cast<std::int64_t>(out.recent_tasks);
  }
  return out;
}

} // namespace lockstep
