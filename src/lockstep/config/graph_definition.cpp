#include "lockstep/config/graph_definition.hpp"
#include "lockstep/config/toml_util.hpp"

#include "lockstep/graph/task.hpp"
#include "lockstep/util/enum.hpp"
#include "lockstep/util/log.hpp"

#include <glaze/toml.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

namespace lockstep {
namespace detail {

struct TaskDependencyToml {
  std::string task;
};

struct OperationToml {
  std::string id;
  std::string sql;
  std::vector<std::string> params;
  bool transaction{false};
};

struct GraphDefaultsToml {
  int max_retries{-1};
  int64_t timeout_ms{0};
  int priority{0};
};

struct GraphTaskToml {
  std::string id;
  std::string name;
  std::string description;
  std::string type{"sql"};

  std::string sql;
  std::vector<std::string> params;
  bool transaction{false};
  std::vector<OperationToml> operations;

  std::string generator;
  std::string schema;
  int expected_files{1};

  std::string validation{"schema"};
  std::vector<std::string> tables;
  std::vector<std::string> statements;

  std::vector<std::variant<std::string, TaskDependencyToml>> dependencies;
  std::vector<std::string> resources;
  std::vector<std::string> tags;
  // Unset falls back to [defaults]; an explicit 0 stays 0.
  std::optional<int> priority;
  int64_t estimated_duration_ms{-1};
  int max_retries{-1};
  int64_t timeout_ms{0};
  bool exclusive{false};
  bool concurrent{true};
};

struct GraphToml {
  std::string name;
  GraphDefaultsToml defaults{};
  std::vector<GraphTaskToml> tasks;
};

} // namespace detail
} // namespace lockstep

namespace glz {
template <> struct meta<lockstep::detail::TaskDependencyToml> {
  using T = lockstep::detail::TaskDependencyToml;
  static constexpr auto value = object("task", &T::task);
};

template <> struct meta<lockstep::detail::OperationToml> {
  using T = lockstep::detail::OperationToml;
  static constexpr auto value =
      object("id", &T::id, "sql", &T::sql, "params", &T::params,
             "transaction", &T::transaction);
};

template <> struct meta<lockstep::detail::GraphDefaultsToml> {
  using T = lockstep::detail::GraphDefaultsToml;
  static constexpr auto value =
      object("max_retries", &T::max_retries, "timeout_ms", &T::timeout_ms,
             "priority", &T::priority);
};

template <> struct meta<lockstep::detail::GraphTaskToml> {
  using T = lockstep::detail::GraphTaskToml;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "description", &T::description, "type",
      &T::type, "sql", &T::sql, "params", &T::params, "transaction",
      &T::transaction, "operations", &T::operations, "generator",
      &T::generator, "schema", &T::schema, "expected_files",
      &T::expected_files, "validation", &T::validation, "tables", &T::tables,
      "statements", &T::statements, "dependencies", &T::dependencies,
      "resources", &T::resources, "tags", &T::tags, "priority", &T::priority,
      "estimated_duration_ms", &T::estimated_duration_ms, "max_retries",
      &T::max_retries, "timeout_ms", &T::timeout_ms, "exclusive",
      &T::exclusive, "concurrent", &T::concurrent);
};

template <> struct meta<lockstep::detail::GraphToml> {
  using T = lockstep::detail::GraphToml;
  static constexpr auto value = object("name", &T::name, "defaults",
                                       &T::defaults, "tasks", &T::tasks);
};
} // namespace glz

namespace lockstep {
namespace {

[[nodiscard]] auto to_params(const std::vector<std::string> &raw)
    -> std::vector<db::Param> {
  std::vector<db::Param> out;
  out.reserve(raw.size());
  for (const auto &p : raw) {
    out.emplace_back(p);
  }
  return out;
}

[[nodiscard]] auto
parse_dependencies(const std::vector<
                   std::variant<std::string, detail::TaskDependencyToml>> &deps)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(deps.size());
  for (const auto &dep : deps) {
    if (const auto *id = std::get_if<std::string>(&dep)) {
      if (!id->empty()) {
        out.push_back(*id);
      }
      continue;
    }
    const auto &d = std::get<detail::TaskDependencyToml>(dep);
    if (!d.task.empty()) {
      out.push_back(d.task);
    }
  }
  return out;
}

[[nodiscard]] auto build_payload(const detail::GraphTaskToml &raw,
                                 TaskKind kind,
                                 std::vector<std::string> &errors)
    -> TaskPayload {
  switch (kind) {
  case TaskKind::Sql:
    if (raw.sql.empty()) {
      errors.push_back(std::format("Task '{}': sql cannot be empty", raw.id));
    }
    return SqlPayload{raw.sql, to_params(raw.params), raw.transaction};
  case TaskKind::Migration: {
    MigrationPayload payload;
    if (raw.operations.empty()) {
      errors.push_back(
          std::format("Task '{}': migration needs at least one operation",
                      raw.id));
    }
    for (const auto &op : raw.operations) {
      if (op.sql.empty()) {
        errors.push_back(std::format(
            "Task '{}': migration operation sql cannot be empty", raw.id));
      }
      payload.operations.push_back(Operation{OperationId{op.id}, op.sql,
                                             to_params(op.params),
                                             op.transaction});
    }
    return payload;
  }
  case TaskKind::Generation:
    return GenerationPayload{raw.generator, raw.schema, raw.expected_files};
  case TaskKind::Validation: {
    auto vkind = util::try_parse_enum<ValidationKind>(raw.validation);
    if (!vkind) {
      errors.push_back(std::format("Task '{}': unknown validation type '{}'",
                                   raw.id, raw.validation));
    }
    return ValidationPayload{vkind.value_or(ValidationKind::Schema),
                             raw.tables, raw.statements};
  }
  }
  return SqlPayload{};
}

[[nodiscard]] auto parse_task(const detail::GraphTaskToml &raw,
                              const detail::GraphDefaultsToml &defaults,
                              std::vector<std::string> &errors)
    -> std::optional<Task> {
  auto kind = util::try_parse_enum<TaskKind>(raw.type);
  if (!kind) {
    errors.push_back(
        std::format("Task '{}': unknown task type '{}'", raw.id, raw.type));
    return std::nullopt;
  }

  auto builder = Task::builder()
                     .id(raw.id)
                     .name(raw.name)
                     .description(raw.description)
                     .priority(raw.priority.value_or(defaults.priority))
                     .exclusive(raw.exclusive)
                     .concurrent(raw.concurrent)
                     .payload(build_payload(raw, *kind, errors));

  for (auto &dep : parse_dependencies(raw.dependencies)) {
    builder.depends_on(std::move(dep));
  }
  for (const auto &r : raw.resources) {
    builder.resource(r);
  }
  for (const auto &t : raw.tags) {
    builder.tag(t);
  }

  const int max_retries =
      raw.max_retries >= 0 ? raw.max_retries : defaults.max_retries;
  if (max_retries >= 0) {
    builder.max_retries(max_retries);
  }
  const auto timeout_ms = raw.timeout_ms > 0 ? raw.timeout_ms
                                             : defaults.timeout_ms;
  if (timeout_ms > 0) {
    builder.timeout(std::chrono::milliseconds{timeout_ms});
  }
  if (raw.estimated_duration_ms >= 0) {
    builder.estimated_duration(
        std::chrono::milliseconds{raw.estimated_duration_ms});
  }

  auto task = std::move(builder).build();
  if (!task) {
    errors.push_back(std::format(
        "Task '{}': invalid definition (self-dependency or bad id?)", raw.id));
    return std::nullopt;
  }
  return std::move(*task);
}

[[nodiscard]] auto parse_graph_from_text(std::string_view text,
                                         std::string *diagnostic)
    -> Result<TaskGraph> {
  auto raw_result = toml_util::parse_toml<detail::GraphToml>(text, "graph definition",
                                                           diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  const auto &raw = *raw_result;

  std::vector<std::string> errors;
  if (raw.tasks.empty()) {
    errors.emplace_back("Graph must have at least one [[tasks]] entry");
  }

  TaskGraph graph;
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < raw.tasks.size(); ++i) {
    const auto &task_raw = raw.tasks[i];
    if (task_raw.id.empty()) {
      errors.push_back(std::format("tasks[{}]: missing required field 'id'", i));
      continue;
    }
    if (!seen.insert(task_raw.id).second) {
      errors.push_back(std::format("Duplicate task ID: '{}'", task_raw.id));
      continue;
    }
    if (auto task = parse_task(task_raw, raw.defaults, errors); task) {
      graph.add_task(std::move(*task));
    }
  }

  if (!errors.empty()) {
    std::string joined;
    for (const auto &e : errors) {
      log::error("Graph definition error: {}", e);
      joined += joined.empty() ? e : "\n" + e;
    }
    if (diagnostic) {
      *diagnostic = std::move(joined);
    }
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(graph));
}

} // namespace

auto GraphDefinitionLoader::load_from_file(std::string_view path,
                                           std::string *diagnostic)
    -> Result<TaskGraph> {
  auto text = toml_util::read_file(path, diagnostic);
  if (!text) {
    return fail(text.error());
  }
  return parse_graph_from_text(*text, diagnostic);
}

auto GraphDefinitionLoader::load_from_string(std::string_view toml_str,
                                             std::string *diagnostic)
    -> Result<TaskGraph> {
  return parse_graph_from_text(toml_str, diagnostic);
}

} // namespace lockstep
