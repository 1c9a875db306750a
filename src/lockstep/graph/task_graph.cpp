#include "lockstep/graph/task_graph.hpp"

#include "lockstep/util/log.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <limits>
#include <ranges>

namespace lockstep {

auto TaskGraph::index_of(const TaskId &id) const -> std::optional<Index> {
  if (auto it = index_.find(id); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto TaskGraph::contains(const TaskId &id) const -> bool {
  return index_.contains(id);
}

auto TaskGraph::find(const TaskId &id) const -> const Task * {
  auto idx = index_of(id);
  return idx ? &tasks_[*idx] : nullptr;
}

auto TaskGraph::dependencies_of(const TaskId &id) const
    -> std::span<const TaskId> {
  auto idx = index_of(id);
  return idx ? std::span<const TaskId>{tasks_[*idx].dependencies}
             : std::span<const TaskId>{};
}

auto TaskGraph::dependents_of(const TaskId &id) const
    -> std::span<const TaskId> {
  if (auto it = dependents_.find(id); it != dependents_.end()) {
    return it->second;
  }
  return {};
}

auto TaskGraph::unlink(Index idx) -> void {
  const auto &task = tasks_[idx];
  for (const auto &dep : task.dependencies) {
    auto it = dependents_.find(dep);
    if (it == dependents_.end()) {
      continue;
    }
    std::erase(it->second, task.id);
    if (it->second.empty()) {
      dependents_.erase(it);
    }
  }
}

auto TaskGraph::add_task(Task task) -> void {
  // Dependencies are a set; keep the first occurrence of each.
  std::vector<TaskId> unique_deps;
  unique_deps.reserve(task.dependencies.size());
  for (auto &dep : task.dependencies) {
    if (std::ranges::find(unique_deps, dep) == unique_deps.end()) {
      unique_deps.push_back(std::move(dep));
    }
  }
  task.dependencies = std::move(unique_deps);

  Index idx{};
  if (auto existing = index_of(task.id); existing) {
    idx = *existing;
    unlink(idx);
    log::debug("Replacing task {} in graph", task.id);
    tasks_[idx] = std::move(task);
  } else {
    idx = static_cast<Index>(tasks_.size());
    index_.emplace(task.id, idx);
    tasks_.push_back(std::move(task));
  }

  const auto &stored = tasks_[idx];
  for (const auto &dep : stored.dependencies) {
    auto &rev = dependents_[dep];
    if (std::ranges::find(rev, stored.id) == rev.end()) {
      rev.push_back(stored.id);
    }
  }
}

auto TaskGraph::get_ready_tasks(const TaskIdSet &completed) const
    -> std::vector<const Task *> {
  std::vector<const Task *> ready;
  for (const auto &task : tasks_) {
    if (!completed.contains(task.id) && task.dependencies_satisfied(completed)) {
      ready.push_back(&task);
    }
  }
  std::ranges::stable_sort(ready, std::greater<>{},
                           [](const Task *t) { return t->priority; });
  return ready;
}

auto TaskGraph::detect_cycles() const -> std::vector<std::vector<TaskId>> {
  enum class Mark : std::uint8_t { Unvisited, OnStack, Done };
  struct Frame {
    Index node;
    std::size_t next_dep;
  };

  std::vector<std::vector<TaskId>> cycles;
  std::vector<Mark> mark(tasks_.size(), Mark::Unvisited);
  std::vector<Frame> stack;
  std::vector<Index> path;

  for (Index root = 0; root < tasks_.size(); ++root) {
    if (mark[root] != Mark::Unvisited) {
      continue;
    }
    mark[root] = Mark::OnStack;
    stack.push_back({root, 0});
    path.push_back(root);

    while (!stack.empty()) {
      auto &frame = stack.back();
      const auto &deps = tasks_[frame.node].dependencies;
      if (frame.next_dep == deps.size()) {
        mark[frame.node] = Mark::Done;
        path.pop_back();
        stack.pop_back();
        continue;
      }

      auto dep = index_of(deps[frame.next_dep++]);
      if (!dep) {
        continue;
      }
      if (mark[*dep] == Mark::OnStack) {
        auto first = std::ranges::find(path, *dep);
        std::vector<TaskId> cycle;
        for (auto it = first; it != path.end(); ++it) {
          cycle.push_back(tasks_[*it].id);
        }
        cycle.push_back(tasks_[*dep].id);
        cycles.push_back(std::move(cycle));
      } else if (mark[*dep] == Mark::Unvisited) {
        mark[*dep] = Mark::OnStack;
        path.push_back(*dep);
        stack.push_back({*dep, 0});
      }
    }
  }
  return cycles;
}

auto TaskGraph::cycle_components() const -> std::vector<std::vector<TaskId>> {
  constexpr auto kUnset = std::numeric_limits<std::size_t>::max();
  struct Frame {
    Index node;
    std::size_t next_dep;
  };

  const auto n = tasks_.size();
  std::vector<std::size_t> order(n, kUnset);
  std::vector<std::size_t> low(n, 0);
  std::vector<bool> on_stack(n, false);
  std::vector<Index> scc_stack;
  std::vector<Frame> call_stack;
  std::vector<std::vector<TaskId>> components;
  std::size_t counter = 0;

  auto visit = [&](Index v) {
    order[v] = low[v] = counter++;
    scc_stack.push_back(v);
    on_stack[v] = true;
    call_stack.push_back({v, 0});
  };

  for (Index root = 0; root < n; ++root) {
    if (order[root] != kUnset) {
      continue;
    }
    visit(root);

    while (!call_stack.empty()) {
      auto &frame = call_stack.back();
      const auto v = frame.node;
      const auto &deps = tasks_[v].dependencies;

      if (frame.next_dep < deps.size()) {
        auto w = index_of(deps[frame.next_dep++]);
        if (!w) {
          continue;
        }
        if (order[*w] == kUnset) {
          visit(*w);
        } else if (on_stack[*w]) {
          low[v] = std::min(low[v], order[*w]);
        }
        continue;
      }

      if (low[v] == order[v]) {
        std::vector<Index> members;
        Index w{};
        do {
          w = scc_stack.back();
          scc_stack.pop_back();
          on_stack[w] = false;
          members.push_back(w);
        } while (w != v);

        if (members.size() > 1 || tasks_[v].depends_on(tasks_[v].id)) {
          std::ranges::sort(members);
          std::vector<TaskId> ids;
          ids.reserve(members.size());
          for (auto m : members) {
            ids.push_back(tasks_[m].id);
          }
          components.push_back(std::move(ids));
        }
      }

      call_stack.pop_back();
      if (!call_stack.empty()) {
        auto parent = call_stack.back().node;
        low[parent] = std::min(low[parent], low[v]);
      }
    }
  }
  return components;
}

auto TaskGraph::unresolved_dependencies() const
    -> std::vector<UnresolvedDependency> {
  std::vector<UnresolvedDependency> out;
  for (const auto &task : tasks_) {
    for (const auto &dep : task.dependencies) {
      if (!contains(dep)) {
        out.push_back({task.id, dep});
      }
    }
  }
  return out;
}

auto TaskGraph::get_execution_order() const -> Result<std::vector<TaskId>> {
  if (auto missing = unresolved_dependencies(); !missing.empty()) {
    log::warn("Task {} depends on unknown task {}", missing.front().task,
              missing.front().missing);
    return fail(Error::UnresolvedDependency);
  }

  std::vector<std::size_t> in_degree(tasks_.size());
  std::deque<Index> queue;
  for (Index i = 0; i < tasks_.size(); ++i) {
    in_degree[i] = tasks_[i].dependencies.size();
    if (in_degree[i] == 0) {
      queue.push_back(i);
    }
  }

  std::vector<TaskId> order;
  order.reserve(tasks_.size());
  while (!queue.empty()) {
    auto u = queue.front();
    queue.pop_front();
    order.push_back(tasks_[u].id);
    for (const auto &dependent : dependents_of(tasks_[u].id)) {
      auto d = index_of(dependent);
      if (d && --in_degree[*d] == 0) {
        queue.push_back(*d);
      }
    }
  }

  if (order.size() < tasks_.size()) {
    return fail(Error::CycleDetected);
  }
  return ok(std::move(order));
}

auto TaskGraph::get_critical_path() const -> Result<CriticalPath> {
  auto order = get_execution_order();
  if (!order) {
    return fail(order.error());
  }

  using std::chrono::milliseconds;
  std::vector<milliseconds> distance(tasks_.size(), milliseconds{0});
  std::vector<std::optional<Index>> predecessor(tasks_.size());

  // distance(dependent) = max(distance(dependent), distance(t) + estimate(t)).
  // The first task in topological order to reach the maximum keeps it.
  for (const auto &id : *order) {
    const auto i = *index_of(id);
    const auto reach = distance[i] + tasks_[i].duration_estimate();
    for (const auto &dependent : dependents_of(id)) {
      const auto d = *index_of(dependent);
      if (reach > distance[d]) {
        distance[d] = reach;
        predecessor[d] = i;
      }
    }
  }

  // The path ends at the first task, in insertion order, with the largest
  // positive distance. A graph without edges has no path.
  CriticalPath result;
  std::optional<Index> end;
  for (Index i = 0; i < tasks_.size(); ++i) {
    if (distance[i] > (end ? distance[*end] : milliseconds{0})) {
      end = i;
    }
  }
  if (!end) {
    return ok(std::move(result));
  }

  for (auto cur = end; cur; cur = predecessor[*cur]) {
    result.path.push_back(tasks_[*cur].id);
    result.tasks.push_back(tasks_[*cur]);
  }
  std::ranges::reverse(result.path);
  std::ranges::reverse(result.tasks);
  result.duration = distance[*end];
  return ok(std::move(result));
}

} // namespace lockstep
