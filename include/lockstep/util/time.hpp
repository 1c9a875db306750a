#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace lockstep::util {

using SteadyPoint = std::chrono::steady_clock::time_point;

// Wall-clock "now" as UTC, second precision: 2026-03-01T12:00:00Z.
[[nodiscard]] inline auto format_timestamp() -> std::string {
  const auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  return std::format("{:%FT%TZ}", now);
}

[[nodiscard]] inline auto elapsed_ms(SteadyPoint since) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace lockstep::util
