#pragma once

#include "lockstep/core/error.hpp"
#include "lockstep/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace lockstep::toml_util {

// Whole-file read. `diagnostic`, when given, names the path on failure.
[[nodiscard]] inline auto read_file(std::string_view path,
                                    std::string *diagnostic = nullptr)
    -> Result<std::string> {
  std::ifstream in{std::string{path}, std::ios::binary};
  if (!in.is_open()) {
    log::error("Cannot read {}", path);
    if (diagnostic != nullptr) {
      *diagnostic = std::format("cannot read {}", path);
    }
    return fail(Error::FileNotFound);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ok(std::move(buffer).str());
}

/// Decodes `text` into the glaze mirror struct `Doc`, tolerating keys the
/// mirror does not declare. `what` labels the document in log output.
template <typename Doc>
[[nodiscard]] auto parse_toml(std::string_view text, std::string_view what,
                              std::string *diagnostic = nullptr)
    -> Result<Doc> {
  Doc doc{};
  constexpr glz::opts kTolerant{.format = glz::TOML,
                                .error_on_unknown_keys = false};
  const auto ec = glz::read<kTolerant>(doc, text);
  if (!ec) {
    return ok(std::move(doc));
  }
  auto detail = glz::format_error(ec, text);
  log::error("Invalid {}: {}", what, detail);
  if (diagnostic != nullptr) {
    *diagnostic = std::move(detail);
  }
  return fail(Error::ParseError);
}

} // namespace lockstep::toml_util
