#include "lockstep/cli/commands.hpp"
#include "lockstep/cli/formatting.hpp"
#include "lockstep/sql/lock_analysis.hpp"
#include "lockstep/util/json.hpp"

#include <print>
#include <string>
#include <vector>

namespace lockstep::cli {

auto cmd_classify(const ClassifyOptions &opts) -> int {
  const auto analysis = analyze_lock_level(opts.sql);
  const auto key = resource_key(opts.sql);

  if (opts.json) {
    auto tables = json_array();
    for (auto &t : extract_table_names(opts.sql)) {
      tables.get_array().emplace_back(std::move(t));
    }
    JsonValue output{
        {"type", std::string{to_string_view(analysis.type)}},
        {"lock_level", std::string{to_string_view(analysis.level)}},
        {"can_run_concurrently", analysis.can_run_concurrently},
        {"blocks_reads", analysis.blocks_reads},
        {"blocks_writes", analysis.blocks_writes},
        {"requires_special_handling", analysis.requires_special_handling},
        {"tables", std::move(tables)},
        {"resource_key", key},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  auto yes_no = [](bool b) { return b ? "yes" : "no"; };
  const auto level = to_string_view(analysis.level);
  std::println("Statement type:   {}", to_string_view(analysis.type));
  std::println("Lock level:       {}",
               analysis.level == LockLevel::AccessExclusive
                   ? fmt::ansi::red(level)
                   : fmt::ansi::bold(level));
  std::println("Concurrent:       {}", yes_no(analysis.can_run_concurrently));
  std::println("Blocks reads:     {}", yes_no(analysis.blocks_reads));
  std::println("Blocks writes:    {}", yes_no(analysis.blocks_writes));
  std::println("Special handling: {}",
               yes_no(analysis.requires_special_handling));
  std::println("Resource key:     {}",
               key.empty() ? fmt::ansi::dim("(none)") : key);
  return 0;
}

} // namespace lockstep::cli
