#pragma once

#include "lockstep/core/error.hpp"
#include "lockstep/graph/task_graph.hpp"

#include <string>
#include <string_view>

namespace lockstep {

// Reads a task graph from TOML:
//
//   name = "schema-v2"
//   [defaults]
//   max_retries = 1
//   timeout_ms = 60000
//
//   [[tasks]]
//   id = "add_email_index"
//   type = "sql"
//   sql = "CREATE INDEX CONCURRENTLY users_email_idx ON users (email)"
//   dependencies = ["create_users"]
//
// Dependencies may name tasks that do not exist; the graph reports them as
// unresolved instead of the loader rejecting the file.
class GraphDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<TaskGraph>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<TaskGraph>;
};

} // namespace lockstep
