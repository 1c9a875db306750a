#include "lockstep/orchestrator/orchestrator.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <vector>

using namespace lockstep;
using namespace std::chrono_literals;

namespace {

auto sql_task(std::string id, std::string sql) -> Task::Builder {
  return Task::builder().id(std::move(id)).sql(std::move(sql));
}

auto statements(const test::FakeConnection &conn) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &call : conn.calls()) {
    if (!test::is_housekeeping(call.sql)) {
      out.push_back(call.sql);
    }
  }
  return out;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  auto setup(std::chrono::milliseconds latency = 0ms,
             OrchestratorConfig cfg = fast_config()) -> Orchestrator & {
    conn_ = std::make_shared<test::FakeConnection>(
        test::FakeConnection::Handler{}, latency);
    pool_ = std::make_unique<test::FakePool>(conn_, 10);
    ExecutorConfig exec_cfg;
    exec_cfg.lock_timeout = 2000ms;
    exec_cfg.deadlock_backoff = 5ms;
    executor_ = std::make_unique<LockAwareExecutor>(*pool_, exec_cfg);
    orchestrator_ = std::make_unique<Orchestrator>(*executor_, cfg);
    return *orchestrator_;
  }

  static auto fast_config() -> OrchestratorConfig {
    OrchestratorConfig cfg;
    cfg.retry_backoff = 5ms;
    cfg.shutdown_grace = 2s;
    cfg.shutdown_poll = 5ms;
    return cfg;
  }

  std::shared_ptr<test::FakeConnection> conn_;
  std::unique_ptr<test::FakePool> pool_;
  std::unique_ptr<LockAwareExecutor> executor_;
  std::unique_ptr<Orchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, RunsDependenciesBeforeDependents) {
  auto &orch = setup();
  TaskGraph graph;
  graph.add_task(sql_task("deploy", "SELECT 'deploy'")
                     .depends_on("lint")
                     .depends_on("test")
                     .build()
                     .value());
  graph.add_task(
      sql_task("lint", "SELECT 'lint'").depends_on("prepare").build().value());
  graph.add_task(
      sql_task("test", "SELECT 'test'").depends_on("prepare").build().value());
  graph.add_task(sql_task("prepare", "SELECT 'prepare'").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success) << summary.message;
  EXPECT_EQ(summary.message, "completed 4 task(s)");
  EXPECT_EQ(summary.completed_tasks, 4U);
  EXPECT_EQ(summary.results.size(), 4U);

  auto order = statements(*conn_);
  ASSERT_EQ(order.size(), 4U);
  EXPECT_EQ(order.front(), "SELECT 'prepare'");
  EXPECT_EQ(order.back(), "SELECT 'deploy'");
}

TEST_F(OrchestratorTest, HigherPriorityStartsFirst) {
  auto cfg = fast_config();
  cfg.max_concurrent_tasks = 1;
  auto &orch = setup(0ms, cfg);
  TaskGraph graph;
  graph.add_task(sql_task("low", "SELECT 'low'").priority(1).build().value());
  graph.add_task(sql_task("high", "SELECT 'high'").priority(9).build().value());
  graph.add_task(sql_task("mid", "SELECT 'mid'").priority(5).build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);
  EXPECT_EQ(statements(*conn_),
            (std::vector<std::string>{"SELECT 'high'", "SELECT 'mid'",
                                      "SELECT 'low'"}));
}

TEST_F(OrchestratorTest, CyclicGraphNeverStarts) {
  auto &orch = setup();
  TaskGraph graph;
  graph.add_task(sql_task("a", "SELECT 1").depends_on("c").build().value());
  graph.add_task(sql_task("b", "SELECT 2").depends_on("a").build().value());
  graph.add_task(sql_task("c", "SELECT 3").depends_on("b").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_FALSE(summary.success);
  EXPECT_EQ(summary.error, make_error_code(Error::CycleDetected));
  EXPECT_TRUE(summary.message.starts_with("circular dependencies detected: "))
      << summary.message;
  EXPECT_TRUE(conn_->calls().empty());
}

TEST_F(OrchestratorTest, UnknownDependencyNeverStarts) {
  auto &orch = setup();
  TaskGraph graph;
  graph.add_task(sql_task("a", "SELECT 1").build().value());
  graph.add_task(sql_task("b", "SELECT 2").depends_on("ghost").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_EQ(summary.error, make_error_code(Error::UnresolvedDependency));
  EXPECT_EQ(summary.message, "task b depends on unknown task ghost");
  EXPECT_TRUE(conn_->calls().empty());
}

TEST_F(OrchestratorTest, EmptyGraphSucceeds) {
  auto &orch = setup();
  TaskGraph graph;
  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_TRUE(summary.success);
  EXPECT_EQ(summary.message, "completed 0 task(s)");
}

TEST_F(OrchestratorTest, IndependentTasksOverlap) {
  auto &orch = setup(50ms);
  TaskGraph graph;
  graph.add_task(sql_task("a", "SELECT * FROM t1").build().value());
  graph.add_task(sql_task("b", "SELECT * FROM t2").build().value());
  graph.add_task(sql_task("c", "SELECT * FROM t3").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);
  EXPECT_EQ(conn_->max_running(), 3U);
}

TEST_F(OrchestratorTest, ConcurrencyLimitIsHonoured) {
  auto cfg = fast_config();
  cfg.max_concurrent_tasks = 2;
  auto &orch = setup(30ms, cfg);
  TaskGraph graph;
  for (int i = 0; i < 5; ++i) {
    graph.add_task(sql_task(std::format("t{}", i),
                            std::format("SELECT * FROM t{}", i))
                       .build()
                       .value());
  }
  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);
  EXPECT_EQ(conn_->max_running(), 2U);
}

TEST_F(OrchestratorTest, ExclusiveTaskRunsAlone) {
  auto &orch = setup(40ms);
  TaskGraph graph;
  graph.add_task(sql_task("a", "SELECT * FROM t1").build().value());
  graph.add_task(
      sql_task("swap", "SELECT * FROM t2").exclusive().build().value());
  graph.add_task(sql_task("c", "SELECT * FROM t3").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);

  for (const auto &call : conn_->calls()) {
    if (call.sql == "SELECT * FROM t2") {
      EXPECT_TRUE(call.concurrent.empty());
    } else {
      EXPECT_EQ(std::ranges::count(call.concurrent, "SELECT * FROM t2"), 0);
    }
  }
}

TEST_F(OrchestratorTest, NonConcurrentTaskRunsAlone) {
  auto &orch = setup(40ms);
  TaskGraph graph;
  graph.add_task(
      sql_task("solo", "SELECT * FROM t1").concurrent(false).build().value());
  graph.add_task(sql_task("b", "SELECT * FROM t2").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);
  EXPECT_EQ(conn_->max_running(), 1U);
}

TEST_F(OrchestratorTest, TasksSharingAResourceNeverOverlap) {
  auto &orch = setup(40ms);
  TaskGraph graph;
  graph.add_task(
      sql_task("a", "SELECT * FROM t1").resource("reporting").build().value());
  graph.add_task(sql_task("b", "SELECT * FROM t2")
                     .resource("reporting")
                     .resource("cache")
                     .build()
                     .value());
  graph.add_task(
      sql_task("c", "SELECT * FROM t3").resource("other").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success);
  EXPECT_EQ(conn_->max_running(), 2U);
  for (const auto &call : conn_->calls_with("FROM t2")) {
    EXPECT_EQ(std::ranges::count(call.concurrent, "SELECT * FROM t1"), 0);
  }
}

TEST_F(OrchestratorTest, FailedAttemptsAreRetried) {
  auto &orch = setup();
  int failures_left = 2;
  conn_->set_handler([&](std::string_view sql, std::span<const db::Param>)
                         -> Result<db::QueryResult> {
    if (sql.starts_with("INSERT") && failures_left > 0) {
      --failures_left;
      return fail(make_error_code(db::DbErrc::SerializationFailure));
    }
    return db::QueryResult{};
  });
  TaskGraph graph;
  graph.add_task(sql_task("seed", "INSERT INTO flags VALUES (1)")
                     .max_retries(3)
                     .build()
                     .value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success) << summary.message;
  const auto &outcome = summary.results.at(TaskId{"seed"});
  EXPECT_EQ(outcome.attempts, 3);
  ASSERT_EQ(orch.history().size(), 3U);
  EXPECT_EQ(orch.history()[0].retry_count, 0);
  EXPECT_EQ(orch.history()[2].retry_count, 2);
  EXPECT_TRUE(orch.history()[2].success);
}

TEST_F(OrchestratorTest, PermanentFailureBlocksDependents) {
  auto &orch = setup();
  conn_->set_handler([](std::string_view sql, std::span<const db::Param>)
                         -> Result<db::QueryResult> {
    if (sql.find("broken") != std::string_view::npos) {
      return fail(make_error_code(db::DbErrc::UndefinedTable));
    }
    return db::QueryResult{};
  });
  TaskGraph graph;
  graph.add_task(sql_task("load", "SELECT * FROM broken")
                     .max_retries(1)
                     .build()
                     .value());
  graph.add_task(
      sql_task("report", "SELECT 1").depends_on("load").build().value());
  graph.add_task(sql_task("side", "SELECT 2").build().value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_FALSE(summary.success);
  EXPECT_EQ(summary.error, make_error_code(Error::TaskFailed));
  EXPECT_EQ(summary.message, "tasks failed: load; blocked: report");
  EXPECT_EQ(summary.completed_tasks, 1U);
  EXPECT_EQ(summary.failed_tasks, 1U);

  const auto &outcome = summary.results.at(TaskId{"load"});
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 2);
  EXPECT_EQ(outcome.error, make_error_code(db::DbErrc::UndefinedTable));
  EXPECT_FALSE(summary.results.contains(TaskId{"report"}));
  EXPECT_TRUE(conn_->calls_with("SELECT 1").empty());
}

TEST_F(OrchestratorTest, SlowAttemptTimesOut) {
  auto &orch = setup(200ms);
  TaskGraph graph;
  graph.add_task(sql_task("slow", "SELECT pg_sleep(1)")
                     .timeout(30ms)
                     .max_retries(0)
                     .build()
                     .value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_FALSE(summary.success);
  const auto &outcome = summary.results.at(TaskId{"slow"});
  EXPECT_EQ(outcome.error, make_error_code(Error::TaskTimeout));
  EXPECT_EQ(outcome.message, "task slow timed out after 30ms");
  // The statement itself ran to completion after the task gave up.
  EXPECT_EQ(orch.in_flight(), 0U);
  EXPECT_EQ(conn_->calls_with("pg_sleep").size(), 1U);
}

TEST_F(OrchestratorTest, MigrationStopsAtFirstFailure) {
  auto &orch = setup();
  conn_->set_handler([](std::string_view sql, std::span<const db::Param>)
                         -> Result<db::QueryResult> {
    if (sql.find("bad") != std::string_view::npos) {
      return fail(make_error_code(db::DbErrc::SyntaxError));
    }
    return db::QueryResult{};
  });
  MigrationPayload migration{{
      Operation{{}, "ALTER TABLE users ADD COLUMN a int", {}, true},
      Operation{{}, "ALTER TABLE users ADD bad", {}, true},
      Operation{{}, "ALTER TABLE users ADD COLUMN c int", {}, true},
  }};
  auto task =
      Task::builder().id("m1").payload(migration).max_retries(0).build();
  ASSERT_TRUE(task);

  auto attempt = test::run_coro(orch.perform(*task));
  ASSERT_FALSE(attempt.has_value());
  EXPECT_EQ(attempt.error().code, make_error_code(db::DbErrc::SyntaxError));
  EXPECT_TRUE(attempt.error().message.starts_with("2 of 3: "))
      << attempt.error().message;
  EXPECT_TRUE(conn_->calls_with("COLUMN c").empty());
  ASSERT_EQ(executor_->history().size(), 2U);
  EXPECT_EQ(executor_->history()[0].operation_id, OperationId{"m1.1"});
}

TEST_F(OrchestratorTest, MigrationRunsEveryOperationInOrder) {
  auto &orch = setup();
  MigrationPayload migration{{
      Operation{{}, "CREATE TABLE audit (id int)", {}, false},
      Operation{{}, "INSERT INTO audit VALUES (1)", {}, false},
  }};
  auto task = Task::builder().id("m2").payload(migration).build();
  ASSERT_TRUE(task);

  auto attempt = test::run_coro(orch.perform(*task));
  ASSERT_TRUE(attempt.has_value());
  const auto &outcome = std::get<MigrationOutcome>(*attempt);
  EXPECT_EQ(outcome.operations, 2U);
  EXPECT_EQ(statements(*conn_),
            (std::vector<std::string>{"CREATE TABLE audit (id int)",
                                      "INSERT INTO audit VALUES (1)"}));
}

TEST_F(OrchestratorTest, FailingValidationFailsTask) {
  auto &orch = setup();
  auto task = Task::builder()
                  .id("check")
                  .payload(ValidationPayload{ValidationKind::Schema,
                                             {"users", "users"},
                                             {}})
                  .build();
  ASSERT_TRUE(task);
  auto attempt = test::run_coro(orch.perform(*task));
  ASSERT_FALSE(attempt.has_value());
  EXPECT_EQ(attempt.error().code, make_error_code(Error::ValidationFailed));
  EXPECT_EQ(attempt.error().message, "table users is declared twice");
}

TEST_F(OrchestratorTest, GenerationAndValidationNeedNoDatabase) {
  auto &orch = setup();
  TaskGraph graph;
  graph.add_task(Task::builder()
                     .id("gen")
                     .payload(GenerationPayload{"prisma", "schema.prisma", 3})
                     .build()
                     .value());
  graph.add_task(Task::builder()
                     .id("check")
                     .depends_on("gen")
                     .payload(ValidationPayload{ValidationKind::Schema,
                                                {"users", "orders"},
                                                {}})
                     .build()
                     .value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  ASSERT_TRUE(summary.success) << summary.message;
  EXPECT_TRUE(conn_->calls().empty());

  const auto &gen = summary.results.at(TaskId{"gen"});
  ASSERT_TRUE(gen.output);
  const auto &generated = std::get<GenerationOutcome>(*gen.output);
  EXPECT_EQ(generated.generator, "prisma");
  EXPECT_EQ(generated.files_generated, 3);
  EXPECT_FALSE(generated.timestamp.empty());

  const auto &check = summary.results.at(TaskId{"check"});
  ASSERT_TRUE(check.output);
  EXPECT_EQ(std::get<ValidationOutcome>(*check.output).checked, 2U);
}

TEST_F(OrchestratorTest, ShutdownWaitsForInFlightWork) {
  auto &orch = setup(100ms);
  TaskGraph graph;
  graph.add_task(sql_task("first", "SELECT * FROM t1").build().value());
  graph.add_task(
      sql_task("second", "SELECT * FROM t2").depends_on("first").build().value());

  auto scenario = [&]() -> task<RunSummary> {
    using namespace awaitable_ops;
    auto stop = [&]() -> task<void> {
      (void)co_await async_sleep(20ms);
      co_await orch.shutdown();
      EXPECT_EQ(orch.in_flight(), 0U);
    };
    co_return co_await (orch.execute_task_graph(graph) && stop());
  };
  auto summary = test::run_coro(scenario());

  EXPECT_FALSE(summary.success);
  EXPECT_EQ(summary.error, make_error_code(Error::ShuttingDown));
  EXPECT_TRUE(summary.results.at(TaskId{"first"}).success);
  EXPECT_FALSE(summary.results.contains(TaskId{"second"}));
  EXPECT_TRUE(conn_->calls_with("t2").empty());
  EXPECT_TRUE(orch.shutting_down());

  auto again = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_EQ(again.error, make_error_code(Error::ShuttingDown));
}

TEST_F(OrchestratorTest, StatsCoverRecentAttempts) {
  auto &orch = setup();
  EXPECT_DOUBLE_EQ(orch.stats().success_rate, 1.0);
  conn_->set_handler([](std::string_view sql, std::span<const db::Param>)
                         -> Result<db::QueryResult> {
    if (sql.find("missing") != std::string_view::npos) {
      return fail(make_error_code(db::DbErrc::UndefinedTable));
    }
    return db::QueryResult{};
  });
  TaskGraph graph;
  graph.add_task(sql_task("ok", "SELECT * FROM users").build().value());
  graph.add_task(sql_task("bad", "SELECT * FROM missing")
                     .max_retries(0)
                     .build()
                     .value());

  auto summary = test::run_coro(orch.execute_task_graph(graph));
  EXPECT_FALSE(summary.success);

  auto stats = orch.stats();
  EXPECT_EQ(stats.completed_tasks, 1U);
  EXPECT_EQ(stats.failed_tasks, 1U);
  EXPECT_EQ(stats.running_tasks, 0U);
  EXPECT_EQ(stats.recent_tasks, 2U);
  EXPECT_DOUBLE_EQ(stats.success_rate, 0.5);
  EXPECT_EQ(stats.executor.recent_operations, 2U);
}

TEST_F(OrchestratorTest, RetryDelayDoubles) {
  OrchestratorConfig cfg;
  cfg.retry_backoff = 1000ms;
  auto &orch = setup(0ms, cfg);
  EXPECT_EQ(orch.retry_delay(0), 1000ms);
  EXPECT_EQ(orch.retry_delay(1), 2000ms);
  EXPECT_EQ(orch.retry_delay(3), 8000ms);
}

TEST(ValidateTest, SchemaChecks) {
  auto empty = validate({ValidationKind::Schema, {}, {}});
  EXPECT_FALSE(empty.valid);
  EXPECT_EQ(empty.errors,
            (std::vector<std::string>{"schema declares no tables"}));

  auto blank = validate({ValidationKind::Schema, {"users", "  "}, {}});
  EXPECT_FALSE(blank.valid);
  EXPECT_EQ(blank.errors,
            (std::vector<std::string>{"table 2 has an empty name"}));

  auto good = validate({ValidationKind::Schema, {"users", "orders"}, {}});
  EXPECT_TRUE(good.valid);
  EXPECT_EQ(good.checked, 2U);
}

TEST(ValidateTest, MigrationChecks) {
  auto outcome = validate({ValidationKind::Migration,
                           {},
                           {"ALTER TABLE users DROP COLUMN legacy",
                            "CREATE INDEX CONCURRENTLY i ON users (a)",
                            "VACUUM users", ""}});
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.checked, 4U);
  EXPECT_EQ(outcome.high_risk_operations, 1U);
  EXPECT_EQ(outcome.errors,
            (std::vector<std::string>{"statement 4 is empty"}));
  ASSERT_EQ(outcome.warnings.size(), 2U);
  EXPECT_EQ(outcome.warnings[0],
            "statement 1 takes ACCESS EXCLUSIVE on [users]");
  EXPECT_EQ(outcome.warnings[1],
            "statement 3 not recognized, assuming EXCLUSIVE");
}

TEST(GenerateTest, ReportsExpectedFiles) {
  auto outcome = generate({"sqlc", "schema.sql", 2});
  EXPECT_EQ(outcome.generator, "sqlc");
  EXPECT_EQ(outcome.files_generated, 2);
  EXPECT_FALSE(outcome.timestamp.empty());
}
