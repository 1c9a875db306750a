#pragma once

#include <chrono>
#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace lockstep::cli::fmt {

namespace ansi {

enum class Style { Bold, Dim, Red, Green };

// Escapes are only emitted when stdout is a terminal, so piped JSON and
// captured test output stay plain.
inline auto stdout_is_terminal() noexcept -> bool {
  static const bool terminal = ::isatty(::fileno(stdout)) != 0;
  return terminal;
}

inline auto paint(Style style, std::string_view text) -> std::string {
  if (!stdout_is_terminal()) {
    return std::string{text};
  }
  std::string_view code;
  switch (style) {
  case Style::Bold:
    code = "1";
    break;
  case Style::Dim:
    code = "2";
    break;
  case Style::Red:
    code = "31";
    break;
  case Style::Green:
    code = "32";
    break;
  }
  return std::format("\033[{}m{}\033[0m", code, text);
}

inline auto bold(std::string_view text) -> std::string {
  return paint(Style::Bold, text);
}
inline auto dim(std::string_view text) -> std::string {
  return paint(Style::Dim, text);
}
inline auto red(std::string_view text) -> std::string {
  return paint(Style::Red, text);
}
inline auto green(std::string_view text) -> std::string {
  return paint(Style::Green, text);
}

} // namespace ansi

inline auto status_mark(bool ok) -> std::string {
  return ok ? ansi::green("✓") : ansi::red("✗");
}

// Sub-second durations print as whole milliseconds, longer ones as seconds
// with one decimal.
inline auto format_duration(std::chrono::milliseconds d) -> std::string {
  using std::chrono::duration;
  if (d < std::chrono::seconds{1}) {
    return std::format("{}ms", d.count());
  }
  return std::format("{:.1f}s", duration<double>{d}.count());
}

} // namespace lockstep::cli::fmt
