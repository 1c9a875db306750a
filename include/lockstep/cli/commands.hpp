#pragma once

#include <string>

namespace lockstep::cli {

struct PlanOptions {
  std::string graph_file;
  bool json{false};
};

struct ClassifyOptions {
  std::string sql;
  bool json{false};
};

struct RunOptions {
  std::string config_file;
  std::string graph_file;
  bool json{false};
};

[[nodiscard]] auto cmd_plan(const PlanOptions &opts) -> int;
[[nodiscard]] auto cmd_classify(const ClassifyOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;

} // namespace lockstep::cli
