#include "lockstep/cli/commands.hpp"
#include "lockstep/cli/formatting.hpp"
#include "lockstep/config/config.hpp"
#include "lockstep/config/graph_definition.hpp"
#include "lockstep/db/pg_pool.hpp"
#include "lockstep/executor/lock_aware_executor.hpp"
#include "lockstep/locks/advisory_lock_manager.hpp"
#include "lockstep/orchestrator/orchestrator.hpp"
#include "lockstep/util/json.hpp"
#include "lockstep/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace lockstep::cli {

namespace {

template <typename T>
auto run_async(boost::asio::io_context &io, task<T> op) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(op), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

auto apply_log_config(const LogConfig &cfg) -> bool {
  log::set_level(cfg.level);
  if (!cfg.file.empty() && !log::set_output_file(cfg.file)) {
    std::println(stderr, "Error: cannot open log file {}", cfg.file);
    return false;
  }
  return true;
}

auto print_summary(const RunSummary &summary, bool json) -> void {
  if (json) {
    auto tasks = json_array();
    for (const auto &[id, outcome] : summary.results) {
      JsonValue entry{
          {"task_id", id.str()},
          {"success", outcome.success},
          {"attempts", static_cast<std::int64_t>(outcome.attempts)},
          {"duration_ms", static_cast<std::int64_t>(outcome.duration.count())},
      };
      if (!outcome.success) {
        entry.get_object().emplace("error", outcome.message.empty()
                                                ? outcome.error.message()
                                                : outcome.message);
      }
      tasks.get_array().emplace_back(std::move(entry));
    }
    JsonValue output{
        {"success", summary.success},
        {"duration_ms", static_cast<std::int64_t>(summary.duration.count())},
        {"completed_tasks",
         static_cast<std::int64_t>(summary.completed_tasks)},
        {"failed_tasks", static_cast<std::int64_t>(summary.failed_tasks)},
        {"message", summary.message},
        {"tasks", std::move(tasks)},
    };
    std::println("{}", dump_json(output));
    return;
  }

  for (const auto &[id, outcome] : summary.results) {
    std::println("  {} {:<32} {:>8}  attempts={}", fmt::status_mark(outcome.success),
                 id, fmt::format_duration(outcome.duration), outcome.attempts);
    if (!outcome.success) {
      std::println("      {}", fmt::ansi::red(outcome.message.empty()
                                                  ? outcome.error.message()
                                                  : outcome.message));
    }
  }
  std::println("\n{} {} in {} ({} completed, {} failed)",
               fmt::status_mark(summary.success),
               summary.success ? fmt::ansi::green("Run succeeded")
                               : fmt::ansi::red("Run failed"),
               fmt::format_duration(summary.duration), summary.completed_tasks,
               summary.failed_tasks);
  if (!summary.success && !summary.message.empty()) {
    std::println("  {}", summary.message);
  }
}

// Holds one pooled session for the whole run: the advisory lock that keeps
// concurrent runs of the same graph apart lives and dies with it.
auto run_locked(db::ConnectionPool &pool, const SystemConfig &config,
                const TaskGraph &graph, std::string lock_name)
    -> task<Result<RunSummary>> {
  auto conn = co_await pool.acquire();
  if (!conn) {
    log::error("Cannot acquire a database connection: {}",
               conn.error().message());
    co_return fail(conn.error());
  }
  db::ConnectionLease lease{pool, std::move(*conn)};

  AdvisoryLockManager locks{config.locks};
  auto grant = co_await locks.acquire_exclusive_lock(*lease, lock_name);
  if (!grant) {
    log::error("{}", grant.error().message());
    co_return fail(grant.error().code);
  }
  log::info("Holding run lock {} (key {}) on session {}", lock_name,
            grant->lock_key, grant->session_id);

  LockAwareExecutor executor{pool, config.executor};
  Orchestrator orchestrator{executor, config.orchestrator};
  auto summary = co_await orchestrator.execute_task_graph(graph);

  if (auto released = co_await locks.release_lock(*lease, lock_name);
      !released) {
    log::warn("Failed to release run lock {}: {}", lock_name,
              released.error().message());
  }
  co_return summary;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config = ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  if (!apply_log_config(config->log)) {
    return 1;
  }

  if (!std::filesystem::exists(opts.graph_file)) {
    std::println(stderr, "Error: File does not exist: {}", opts.graph_file);
    return 1;
  }
  std::string diagnostic;
  auto graph = GraphDefinitionLoader::load_from_file(opts.graph_file,
                                                     &diagnostic);
  if (!graph) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? graph.error().message() : diagnostic);
    return 1;
  }

  const auto lock_name = std::format(
      "run:{}", std::filesystem::path{opts.graph_file}.stem().string());

  log::start();
  boost::asio::io_context io;
  db::PgPool pool{config->database};
  auto result =
      run_async(io, run_locked(pool, *config, *graph, lock_name));
  pool.close();
  log::stop();

  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  print_summary(*result, opts.json);
  return result->success ? 0 : 1;
}

} // namespace lockstep::cli
