#pragma once

#include "lockstep/core/error.hpp"
#include "lockstep/graph/task.hpp"
#include "lockstep/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace lockstep {

struct CriticalPath {
  std::vector<TaskId> path;
  std::chrono::milliseconds duration{0};
  std::vector<Task> tasks;
};

struct UnresolvedDependency {
  TaskId task;
  TaskId missing;
};

// Dependency graph over tasks. Edges point from a task to the tasks it
// depends on; dependents_of() gives the reverse view. Dependencies may name
// tasks that are added later. Iteration follows insertion order so every
// query is deterministic for a fixed sequence of add_task() calls.
class TaskGraph {
public:
  TaskGraph() = default;

  // Inserts `task`, or replaces the task with the same id and rewires its
  // edges.
  auto add_task(Task task) -> void;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }
  [[nodiscard]] auto contains(const TaskId &id) const -> bool;
  [[nodiscard]] auto find(const TaskId &id) const -> const Task *;
  [[nodiscard]] auto tasks() const noexcept -> std::span<const Task> {
    return tasks_;
  }

  [[nodiscard]] auto dependencies_of(const TaskId &id) const
      -> std::span<const TaskId>;
  [[nodiscard]] auto dependents_of(const TaskId &id) const
      -> std::span<const TaskId>;

  // Tasks outside `completed` whose dependencies are all in `completed`,
  // highest priority first; equal priorities keep insertion order. The
  // pointers stay valid until the next add_task().
  [[nodiscard]] auto get_ready_tasks(const TaskIdSet &completed) const
      -> std::vector<const Task *>;

  // Depth-first search recording, for each back edge found, the stack slice
  // from the revisited task through the revisit. Reports at least one cycle
  // when any exists, but overlapping cycles may be folded together.
  [[nodiscard]] auto detect_cycles() const -> std::vector<std::vector<TaskId>>;

  // Every strongly connected component that forms a cycle (more than one
  // task, or a task depending on itself), found with Tarjan's algorithm.
  [[nodiscard]] auto cycle_components() const
      -> std::vector<std::vector<TaskId>>;

  [[nodiscard]] auto unresolved_dependencies() const
      -> std::vector<UnresolvedDependency>;

  // Kahn's algorithm. Fails with UnresolvedDependency or CycleDetected.
  [[nodiscard]] auto get_execution_order() const -> Result<std::vector<TaskId>>;

  // Longest chain by accumulated estimates of the tasks before its last
  // task. Empty when no task depends on another.
  [[nodiscard]] auto get_critical_path() const -> Result<CriticalPath>;

private:
  using Index = std::uint32_t;

  [[nodiscard]] auto index_of(const TaskId &id) const -> std::optional<Index>;
  auto unlink(Index idx) -> void;

  std::vector<Task> tasks_;
  ankerl::unordered_dense::map<TaskId, Index> index_;
  // Reverse edges, keyed by dependency id; the id may not be a task yet.
  ankerl::unordered_dense::map<TaskId, std::vector<TaskId>> dependents_;
};

} // namespace lockstep
