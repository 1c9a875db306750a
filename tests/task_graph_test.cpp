#include "lockstep/graph/task_graph.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lockstep;
using namespace std::chrono_literals;

namespace {

auto make_task(std::string id, std::initializer_list<const char *> deps = {},
               int priority = 0,
               std::optional<std::chrono::milliseconds> estimate = {})
    -> Task {
  auto builder = Task::builder().id(std::move(id)).priority(priority);
  for (const char *dep : deps) {
    builder.depends_on(dep);
  }
  if (estimate) {
    builder.estimated_duration(*estimate);
  }
  auto task = std::move(builder).build();
  if (!task) {
    throw std::runtime_error("invalid test task");
  }
  return std::move(*task);
}

auto ids(const std::vector<const Task *> &tasks) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto *t : tasks) {
    out.push_back(t->id.str());
  }
  return out;
}

auto ids(const std::vector<TaskId> &tasks) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &t : tasks) {
    out.push_back(t.str());
  }
  return out;
}

auto position(const std::vector<TaskId> &order, std::string_view id)
    -> std::ptrdiff_t {
  return std::ranges::find(order, TaskId{id}) - order.begin();
}

} // namespace

class TaskGraphTest : public ::testing::Test {
protected:
  TaskGraph graph_;
};

TEST_F(TaskGraphTest, EmptyGraph) {
  EXPECT_TRUE(graph_.empty());
  EXPECT_TRUE(graph_.get_ready_tasks({}).empty());
  EXPECT_TRUE(graph_.detect_cycles().empty());

  auto order = graph_.get_execution_order();
  ASSERT_TRUE(order.has_value());
  EXPECT_TRUE(order->empty());

  auto path = graph_.get_critical_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(path->path.empty());
  EXPECT_EQ(path->duration, 0ms);
}

TEST_F(TaskGraphTest, ReverseEdgesAreMaintained) {
  graph_.add_task(make_task("lint", {"prepare"}));
  graph_.add_task(make_task("prepare"));
  graph_.add_task(make_task("test", {"prepare", "lint"}));

  EXPECT_EQ(graph_.size(), 3U);
  auto dependents = graph_.dependents_of(TaskId{"prepare"});
  EXPECT_EQ(dependents.size(), 2U);
  EXPECT_EQ(graph_.dependencies_of(TaskId{"test"}).size(), 2U);
  EXPECT_TRUE(graph_.dependents_of(TaskId{"test"}).empty());
}

TEST_F(TaskGraphTest, ReadinessFollowsCompletion) {
  graph_.add_task(make_task("prepare"));
  graph_.add_task(make_task("lint", {"prepare"}));
  graph_.add_task(make_task("test", {"prepare", "lint"}));

  TaskIdSet completed;
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"prepare"}));

  completed.insert(TaskId{"prepare"});
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"lint"}));

  completed.insert(TaskId{"lint"});
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"test"}));

  completed.insert(TaskId{"test"});
  EXPECT_TRUE(graph_.get_ready_tasks(completed).empty());
}

TEST_F(TaskGraphTest, ReadySetDrainsByPriority) {
  graph_.add_task(make_task("prepare", {}, 1));
  graph_.add_task(make_task("lint", {}, 5));
  graph_.add_task(make_task("test", {"prepare", "lint"}, 3));

  TaskIdSet completed;
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"lint", "prepare"}));

  completed.insert(TaskId{"lint"});
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"prepare"}));

  completed.insert(TaskId{"prepare"});
  EXPECT_EQ(ids(graph_.get_ready_tasks(completed)),
            (std::vector<std::string>{"test"}));
}

TEST_F(TaskGraphTest, ReadyTasksOrderedByPriorityThenInsertion) {
  graph_.add_task(make_task("low", {}, 1));
  graph_.add_task(make_task("high", {}, 10));
  graph_.add_task(make_task("mid_a", {}, 5));
  graph_.add_task(make_task("mid_b", {}, 5));

  EXPECT_EQ(ids(graph_.get_ready_tasks({})),
            (std::vector<std::string>{"high", "mid_a", "mid_b", "low"}));
}

TEST_F(TaskGraphTest, ThreeTaskCycleIsDetected) {
  graph_.add_task(make_task("a", {"c"}));
  graph_.add_task(make_task("b", {"a"}));
  graph_.add_task(make_task("c", {"b"}));

  auto cycles = graph_.detect_cycles();
  ASSERT_FALSE(cycles.empty());
  const auto &cycle = cycles.front();
  EXPECT_EQ(cycle.front(), cycle.back());
  EXPECT_EQ(cycle.size(), 4U);

  auto components = graph_.cycle_components();
  ASSERT_EQ(components.size(), 1U);
  EXPECT_EQ(ids(components.front()),
            (std::vector<std::string>{"a", "b", "c"}));

  auto order = graph_.get_execution_order();
  ASSERT_FALSE(order.has_value());
  EXPECT_EQ(order.error(), make_error_code(Error::CycleDetected));
  EXPECT_FALSE(graph_.get_critical_path().has_value());
}

TEST_F(TaskGraphTest, SelfLoopIsAOneTaskCycle) {
  auto task = make_task("loop");
  task.dependencies.push_back(TaskId{"loop"});
  graph_.add_task(std::move(task));

  auto cycles = graph_.detect_cycles();
  ASSERT_EQ(cycles.size(), 1U);
  EXPECT_EQ(ids(cycles.front()), (std::vector<std::string>{"loop", "loop"}));
  EXPECT_EQ(graph_.cycle_components().size(), 1U);
}

TEST_F(TaskGraphTest, TarjanFindsEveryComponent) {
  graph_.add_task(make_task("a", {"b"}));
  graph_.add_task(make_task("b", {"a"}));
  graph_.add_task(make_task("c", {"d"}));
  graph_.add_task(make_task("d", {"c"}));
  graph_.add_task(make_task("e", {"a", "c"}));

  auto components = graph_.cycle_components();
  ASSERT_EQ(components.size(), 2U);
  std::vector<std::vector<std::string>> got;
  for (const auto &c : components) {
    got.push_back(ids(c));
  }
  std::ranges::sort(got);
  EXPECT_EQ(got, (std::vector<std::vector<std::string>>{{"a", "b"},
                                                        {"c", "d"}}));
}

TEST_F(TaskGraphTest, UnresolvedDependenciesBlockOrdering) {
  graph_.add_task(make_task("a", {"ghost"}));

  auto missing = graph_.unresolved_dependencies();
  ASSERT_EQ(missing.size(), 1U);
  EXPECT_EQ(missing.front().task, TaskId{"a"});
  EXPECT_EQ(missing.front().missing, TaskId{"ghost"});
  EXPECT_TRUE(graph_.get_ready_tasks({}).empty());

  auto order = graph_.get_execution_order();
  ASSERT_FALSE(order.has_value());
  EXPECT_EQ(order.error(), make_error_code(Error::UnresolvedDependency));

  // Adding the missing task later resolves the edge.
  graph_.add_task(make_task("ghost"));
  EXPECT_TRUE(graph_.unresolved_dependencies().empty());
  EXPECT_TRUE(graph_.get_execution_order().has_value());
}

TEST_F(TaskGraphTest, ExecutionOrderRespectsEveryEdge) {
  graph_.add_task(make_task("deploy", {"test", "build"}));
  graph_.add_task(make_task("build", {"fetch"}));
  graph_.add_task(make_task("test", {"build"}));
  graph_.add_task(make_task("fetch"));
  graph_.add_task(make_task("docs"));

  auto order = graph_.get_execution_order();
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), graph_.size());
  for (const auto &task : graph_.tasks()) {
    for (const auto &dep : task.dependencies) {
      EXPECT_LT(position(*order, dep.value()),
                position(*order, task.id.value()))
          << dep << " before " << task.id;
    }
  }
}

TEST_F(TaskGraphTest, ReplacingATaskRewiresEdges) {
  graph_.add_task(make_task("a"));
  graph_.add_task(make_task("b"));
  graph_.add_task(make_task("c", {"a"}));
  graph_.add_task(make_task("c", {"b"}));

  EXPECT_EQ(graph_.size(), 3U);
  EXPECT_TRUE(graph_.dependents_of(TaskId{"a"}).empty());
  ASSERT_EQ(graph_.dependents_of(TaskId{"b"}).size(), 1U);
  EXPECT_EQ(graph_.dependents_of(TaskId{"b"}).front(), TaskId{"c"});
}

TEST_F(TaskGraphTest, CriticalPathFollowsLongestChain) {
  graph_.add_task(make_task("schema", {}, 0, 100ms));
  graph_.add_task(make_task("backfill", {"schema"}, 0, 500ms));
  graph_.add_task(make_task("index", {"schema"}, 0, 200ms));
  graph_.add_task(make_task("swap", {"backfill", "index"}, 0, 50ms));

  auto path = graph_.get_critical_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(ids(path->path),
            (std::vector<std::string>{"schema", "backfill", "swap"}));
  // The last task's own estimate is not part of the distance.
  EXPECT_EQ(path->duration, 600ms);
  ASSERT_EQ(path->tasks.size(), 3U);
  EXPECT_EQ(path->tasks.back().id, TaskId{"swap"});
}

TEST_F(TaskGraphTest, CriticalPathWithoutEstimatesCountsTasks) {
  graph_.add_task(make_task("a"));
  graph_.add_task(make_task("b", {"a"}));
  graph_.add_task(make_task("c"));

  auto path = graph_.get_critical_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(ids(path->path), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(path->duration, task_defaults::kEstimatedDuration);
}

TEST_F(TaskGraphTest, CriticalPathIgnoresIsolatedLongTask) {
  graph_.add_task(make_task("a", {}, 0, 1ms));
  graph_.add_task(make_task("b", {"a"}));
  graph_.add_task(make_task("c", {}, 0, 10ms));

  auto path = graph_.get_critical_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(ids(path->path), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(path->duration, 1ms);
}

TEST_F(TaskGraphTest, CriticalPathOfUnlinkedTasksIsEmpty) {
  graph_.add_task(make_task("a", {}, 0, 5ms));
  graph_.add_task(make_task("b", {}, 0, 7ms));

  auto path = graph_.get_critical_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(path->path.empty());
  EXPECT_TRUE(path->tasks.empty());
  EXPECT_EQ(path->duration, 0ms);
}
