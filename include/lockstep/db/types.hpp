#pragma once

#include "lockstep/core/error.hpp"

#include <boost/lexical_cast.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockstep::db {

// Bound statement parameter; std::monostate binds SQL NULL.
using Param = std::variant<std::monostate, bool, std::int64_t, double,
                           std::string>;

// Cells are kept in PostgreSQL text format; std::nullopt is SQL NULL.
using Cell = std::optional<std::string>;

struct Row {
  std::vector<Cell> cells;

  [[nodiscard]] auto is_null(std::size_t col) const -> bool {
    return col >= cells.size() || !cells[col].has_value();
  }

  [[nodiscard]] auto text(std::size_t col) const -> std::string_view {
    return is_null(col) ? std::string_view{} : std::string_view{*cells[col]};
  }

  // PostgreSQL renders booleans as "t"/"f".
  [[nodiscard]] auto as_bool(std::size_t col) const -> std::optional<bool> {
    if (is_null(col)) {
      return std::nullopt;
    }
    const auto v = text(col);
    if (v == "t" || v == "true" || v == "1") {
      return true;
    }
    if (v == "f" || v == "false" || v == "0") {
      return false;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto as_int64(std::size_t col) const
      -> std::optional<std::int64_t> {
    if (is_null(col)) {
      return std::nullopt;
    }
    std::int64_t out{};
    if (!boost::conversion::try_lexical_convert(std::string{text(col)}, out)) {
      return std::nullopt;
    }
    return out;
  }
};

struct QueryResult {
  std::vector<std::string> columns;
  std::vector<Row> rows;
  std::size_t affected_rows{0};

  [[nodiscard]] auto column_index(std::string_view name) const
      -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (columns[i] == name) {
        return i;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }
};

} // namespace lockstep::db
