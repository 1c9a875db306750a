#pragma once

#include "lockstep/core/error.hpp"
#include "lockstep/executor/operation.hpp"
#include "lockstep/util/enum.hpp"
#include "lockstep/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <flat_map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace lockstep {

namespace task_defaults {
inline constexpr int kPriority{0};
inline constexpr int kMaxRetries{3};
inline constexpr std::chrono::milliseconds kTimeout{30000};
// Contribution of a task without an estimate to the critical path.
inline constexpr std::chrono::milliseconds kEstimatedDuration{1};
} // namespace task_defaults

using TaskIdSet = ankerl::unordered_dense::set<TaskId>;

enum class TaskKind : std::uint8_t { Sql, Migration, Generation, Validation };
BOOST_DESCRIBE_ENUM(TaskKind, Sql, Migration, Generation, Validation)
LOCKSTEP_DEFINE_ENUM_SERDE(TaskKind, TaskKind::Sql)

enum class ValidationKind : std::uint8_t { Schema, Migration };
BOOST_DESCRIBE_ENUM(ValidationKind, Schema, Migration)
LOCKSTEP_DEFINE_ENUM_SERDE(ValidationKind, ValidationKind::Schema)

struct SqlPayload {
  std::string sql;
  std::vector<db::Param> params;
  bool transaction{false};
};

// Ordered statements, executed one after another.
struct MigrationPayload {
  std::vector<Operation> operations;
};

// Code generation runs outside this process; the task only records what the
// generator is expected to produce.
struct GenerationPayload {
  std::string generator;
  std::string schema;
  int expected_files{1};
};

struct ValidationPayload {
  ValidationKind kind{ValidationKind::Schema};
  std::vector<std::string> tables;     // schema validation
  std::vector<std::string> statements; // migration validation
};

using TaskPayload = std::variant<SqlPayload, MigrationPayload,
                                 GenerationPayload, ValidationPayload>;

struct Task {
  struct Builder;
  static auto builder() -> Builder;

  TaskId id;
  std::string name;
  std::string description;
  std::vector<TaskId> dependencies;
  std::set<std::string> resources;
  int priority{task_defaults::kPriority};
  std::optional<std::chrono::milliseconds> estimated_duration;
  int max_retries{task_defaults::kMaxRetries};
  std::chrono::milliseconds timeout{task_defaults::kTimeout};
  bool requires_exclusive_access{false};
  bool can_run_concurrently{true};
  std::set<std::string> tags;
  std::flat_map<std::string, std::string> metadata;
  TaskPayload payload{SqlPayload{}};
  int retry_count{0};

  [[nodiscard]] auto kind() const noexcept -> TaskKind {
    return static_cast<TaskKind>(payload.index());
  }

  [[nodiscard]] auto depends_on(const TaskId &other) const -> bool {
    return std::ranges::find(dependencies, other) != dependencies.end();
  }

  [[nodiscard]] auto dependencies_satisfied(const TaskIdSet &completed) const
      -> bool {
    return std::ranges::all_of(dependencies, [&](const TaskId &dep) {
      return completed.contains(dep);
    });
  }

  // True when every resource this task needs is in `available`.
  [[nodiscard]] auto
  can_execute_with(const std::set<std::string> &available) const -> bool {
    return std::ranges::includes(available, resources);
  }

  [[nodiscard]] auto duration_estimate() const -> std::chrono::milliseconds {
    return estimated_duration.value_or(task_defaults::kEstimatedDuration);
  }

  // Builder seeded with a copy of this task; the original is unchanged.
  [[nodiscard]] auto extend() const -> Builder;
};

struct Task::Builder {
  Task task_;

  auto id(std::string id_str) -> Builder && {
    task_.id = TaskId{std::move(id_str)};
    return std::move(*this);
  }

  auto name(std::string n) -> Builder && {
    task_.name = std::move(n);
    return std::move(*this);
  }

  auto description(std::string d) -> Builder && {
    task_.description = std::move(d);
    return std::move(*this);
  }

  auto depends_on(std::string dep_id) -> Builder && {
    TaskId dep{std::move(dep_id)};
    if (!task_.depends_on(dep)) {
      task_.dependencies.push_back(std::move(dep));
    }
    return std::move(*this);
  }

  auto resource(std::string r) -> Builder && {
    task_.resources.insert(std::move(r));
    return std::move(*this);
  }

  auto tag(std::string t) -> Builder && {
    task_.tags.insert(std::move(t));
    return std::move(*this);
  }

  auto priority(int p) -> Builder && {
    task_.priority = p;
    return std::move(*this);
  }

  auto estimated_duration(std::chrono::milliseconds d) -> Builder && {
    task_.estimated_duration = d;
    return std::move(*this);
  }

  auto max_retries(int n) -> Builder && {
    task_.max_retries = n;
    return std::move(*this);
  }

  auto timeout(std::chrono::milliseconds t) -> Builder && {
    task_.timeout = t;
    return std::move(*this);
  }

  auto exclusive(bool e = true) -> Builder && {
    task_.requires_exclusive_access = e;
    return std::move(*this);
  }

  auto concurrent(bool c) -> Builder && {
    task_.can_run_concurrently = c;
    return std::move(*this);
  }

  auto metadata(std::string key, std::string value) -> Builder && {
    task_.metadata.insert_or_assign(std::move(key), std::move(value));
    return std::move(*this);
  }

  auto payload(TaskPayload p) -> Builder && {
    task_.payload = std::move(p);
    return std::move(*this);
  }

  auto sql(std::string statement, std::vector<db::Param> params = {},
           bool transaction = false) -> Builder && {
    task_.payload = SqlPayload{std::move(statement), std::move(params),
                               transaction};
    return std::move(*this);
  }

  auto retry_count(int n) -> Builder && {
    task_.retry_count = n;
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<Task> {
    if (task_.id.empty()) {
      if (task_.name.empty()) {
        return fail(Error::InvalidArgument);
      }
      task_.id = TaskId{task_.name};
    }
    if (task_.name.empty()) {
      task_.name = task_.id.str();
    }
    if (!is_valid_id_text(task_.id.value()) || task_.depends_on(task_.id) ||
        task_.max_retries < 0 || task_.retry_count < 0 ||
        task_.timeout.count() <= 0 ||
        (task_.estimated_duration && task_.estimated_duration->count() < 0)) {
      return fail(Error::InvalidArgument);
    }
    return ok(std::move(task_));
  }
};

inline auto Task::builder() -> Builder { return Builder{}; }

inline auto Task::extend() const -> Builder { return Builder{*this}; }

} // namespace lockstep
