#pragma once

#include <glaze/json.hpp>

#include <string>
#include <vector>

namespace lockstep {

// Integers stay exact (i64) so lock keys and counters survive output.
using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto json_array() -> JsonValue {
  return JsonValue{std::vector<JsonValue>{}};
}

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  if (auto text = glz::write_json(value)) {
    return std::move(*text);
  }
  return "null";
}

} // namespace lockstep
