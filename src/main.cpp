#include "lockstep/cli/commands.hpp"
#include "lockstep/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("LOCKSTEP_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep command output clean; `run` applies the configured level.
  lockstep::log::set_output_stderr();
  lockstep::log::set_level(lockstep::log::Level::Warn);

  CLI::App app{"Lockstep", "Lock-aware schema migration orchestrator"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  lockstep plan migrations/v2.toml\n"
             "  lockstep classify \"ALTER TABLE users ADD COLUMN age int\"\n"
             "  lockstep run -c lockstep.toml migrations/v2.toml\n"
             "\nTip: Set LOCKSTEP_CONFIG=lockstep.toml to skip -c on run.");

  const std::string env_config = default_config();

  lockstep::cli::PlanOptions plan_opts;
  auto *plan = app.add_subcommand(
      "plan", "Validate a task graph and print its execution plan");
  plan->add_option("graph", plan_opts.graph_file, "Task graph TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  plan->add_flag("--json", plan_opts.json, "Output JSON");
  plan->callback(
      [&plan_opts]() { std::exit(lockstep::cli::cmd_plan(plan_opts)); });

  lockstep::cli::ClassifyOptions classify_opts;
  auto *classify = app.add_subcommand(
      "classify", "Show the table lock a SQL statement takes");
  classify->add_option("sql", classify_opts.sql, "SQL statement")->required();
  classify->add_flag("--json", classify_opts.json, "Output JSON");
  classify->callback([&classify_opts]() {
    std::exit(lockstep::cli::cmd_classify(classify_opts));
  });

  lockstep::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Execute a task graph");
  run->footer("\nExamples:\n"
              "  lockstep run -c lockstep.toml migrations/v2.toml\n"
              "  lockstep run -c lockstep.toml migrations/v2.toml --json");
  run_opts.config_file = env_config;
  auto *run_cfg =
      run->add_option("-c,--config", run_opts.config_file, "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    run_cfg->required();
  run->add_option("graph", run_opts.graph_file, "Task graph TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(lockstep::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
