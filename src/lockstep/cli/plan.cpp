#include "lockstep/cli/commands.hpp"
#include "lockstep/cli/formatting.hpp"
#include "lockstep/config/graph_definition.hpp"
#include "lockstep/graph/task_graph.hpp"
#include "lockstep/util/json.hpp"
#include "lockstep/util/log.hpp"

#include <cstdint>
#include <filesystem>
#include <print>
#include <string>
#include <vector>

namespace lockstep::cli {

namespace {

auto join_ids(const std::vector<TaskId> &ids, std::string_view sep)
    -> std::string {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += sep;
    }
    out += id.str();
  }
  return out;
}

auto ids_to_json(const std::vector<TaskId> &ids) -> JsonValue {
  auto arr = json_array();
  for (const auto &id : ids) {
    arr.get_array().emplace_back(id.str());
  }
  return arr;
}

// Cycle slices from detect_cycles() repeat the first task at the end.
auto format_cycle(const std::vector<TaskId> &cycle) -> std::string {
  return join_ids(cycle, " -> ");
}

} // namespace

auto cmd_plan(const PlanOptions &opts) -> int {
  log::set_output_stderr();

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

  const auto unresolved = graph->unresolved_dependencies();
  const auto cycles = graph->cycle_components();
  auto order = graph->get_execution_order();
  auto critical = graph->get_critical_path();
  const bool valid = unresolved.empty() && cycles.empty() && order.has_value();

  if (opts.json) {
    auto missing = json_array();
    for (const auto &u : unresolved) {
      missing.get_array().emplace_back(
          JsonValue{{"task", u.task.str()}, {"missing", u.missing.str()}});
    }
    auto cycle_list = json_array();
    for (const auto &c : cycles) {
      cycle_list.get_array().emplace_back(ids_to_json(c));
    }
    JsonValue output{
        {"file", opts.graph_file},
        {"tasks", static_cast<std::int64_t>(graph->size())},
        {"valid", valid},
        {"unresolved", std::move(missing)},
        {"cycles", std::move(cycle_list)},
    };
    if (order) {
      output.get_object().emplace("execution_order", ids_to_json(*order));
    }
    if (critical) {
      output.get_object().emplace(
          "critical_path",
          JsonValue{
              {"tasks", ids_to_json(critical->path)},
              {"duration_ms",
               static_cast<std::int64_t>(critical->duration.count())},
          });
    }
    std::println("{}", dump_json(output));
    return valid ? 0 : 1;
  }

  std::println("{} {} ({} task(s))", fmt::status_mark(valid),
               fmt::ansi::bold(opts.graph_file), graph->size());

  for (const auto &u : unresolved) {
    std::println("  {} task '{}' depends on unknown task '{}'",
                 fmt::ansi::red("unresolved:"), u.task, u.missing);
  }
  for (const auto &c : graph->detect_cycles()) {
    std::println("  {} {}", fmt::ansi::red("cycle:"), format_cycle(c));
  }

  if (order) {
    std::println("\nExecution order:");
    for (std::size_t i = 0; i < order->size(); ++i) {
      const auto *task = graph->find((*order)[i]);
      std::println("  {:>3}. {} {}", i + 1, (*order)[i],
                   fmt::ansi::dim(task ? to_string_view(task->kind())
                                       : std::string_view{}));
    }
  }

  if (critical) {
    std::println("\nCritical path ({}):",
                 fmt::format_duration(critical->duration));
    std::println("  {}", join_ids(critical->path, " -> "));
  }
  return valid ? 0 : 1;
}

} // namespace lockstep::cli
