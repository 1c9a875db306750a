#pragma once

#include "lockstep/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lockstep {

// PostgreSQL table lock levels, weakest first.
enum class LockLevel : std::uint8_t {
  AccessShare,
  RowShare,
  RowExclusive,
  ShareUpdateExclusive,
  Share,
  Exclusive,
  AccessExclusive,
};
BOOST_DESCRIBE_ENUM(LockLevel, AccessShare, RowShare, RowExclusive,
                    ShareUpdateExclusive, Share, Exclusive, AccessExclusive)
LOCKSTEP_DEFINE_ENUM_SERDE(LockLevel, LockLevel::Exclusive)

enum class StatementType : std::uint8_t {
  Ddl,
  ConcurrentIndex,
  Dml,
  Select,
  LockTable,
  Unknown,
};
BOOST_DESCRIBE_ENUM(StatementType, Ddl, ConcurrentIndex, Dml, Select,
                    LockTable, Unknown)
LOCKSTEP_DEFINE_ENUM_SERDE(StatementType, StatementType::Unknown)

struct LockAnalysis {
  StatementType type{StatementType::Unknown};
  LockLevel level{LockLevel::Exclusive};
  bool can_run_concurrently{false};
  bool blocks_reads{true};
  bool blocks_writes{true};
  bool requires_special_handling{false};

  auto operator==(const LockAnalysis &) const -> bool = default;
};

namespace detail {
// conflict_masks[a] has bit b set when level a is listed as conflicting
// with level b. The relation is evaluated symmetrically.
inline constexpr std::array<std::uint8_t, 7> conflict_masks = {
    0b1100000, // AccessShare: Exclusive, AccessExclusive
    0b0100000, // RowShare: Exclusive
    0b0111000, // RowExclusive: ShareUpdateExclusive, Share, Exclusive
    0b0111100, // ShareUpdateExclusive: RowExclusive .. Exclusive
    0b0101100, // Share: RowExclusive, ShareUpdateExclusive, Exclusive
    0b0111111, // Exclusive: AccessShare .. Exclusive
    0b1111111, // AccessExclusive: everything
};
} // namespace detail

[[nodiscard]] constexpr auto locks_conflict(LockLevel a, LockLevel b) noexcept
    -> bool {
  const auto ia = std::to_underlying(a);
  const auto ib = std::to_underlying(b);
  return ((detail::conflict_masks[ia] >> ib) & 1U) != 0 ||
         ((detail::conflict_masks[ib] >> ia) & 1U) != 0;
}

namespace sql {

enum class TokenKind : std::uint8_t { Word, Quoted, Number, Symbol };

struct Token {
  TokenKind kind{TokenKind::Word};
  std::string text;  // as written (quotes stripped for Quoted)
  std::string upper; // upper-cased Word text, empty otherwise
  int depth{0};      // parenthesis nesting level

  [[nodiscard]] auto is_word(std::string_view kw) const noexcept -> bool {
    return kind == TokenKind::Word && upper == kw;
  }
  [[nodiscard]] auto is_symbol(char c) const noexcept -> bool {
    return kind == TokenKind::Symbol && text.size() == 1 && text[0] == c;
  }
};

// Splits SQL into words, quoted identifiers, numbers and symbols. Comments,
// string literals and dollar-quoted bodies are dropped.
[[nodiscard]] auto tokenize(std::string_view sql) -> std::vector<Token>;

} // namespace sql

// Classifies a single statement by its leading keywords. Shapes the scanner
// does not recognize fall back to a keyword search and are never treated as
// weaker than EXCLUSIVE.
[[nodiscard]] auto analyze_lock_level(std::string_view sql) -> LockAnalysis;

// Table names referenced after FROM, JOIN, INTO, UPDATE and TABLE (and ON in
// index statements), lower-cased, de-duplicated and sorted. This is a
// heuristic: CTE names are reported as tables, comma joins and USING lists
// are missed, and quoted identifiers lose their case.
[[nodiscard]] auto extract_table_names(std::string_view sql)
    -> std::vector<std::string>;

// Comma-joined extract_table_names(); empty when no table is referenced.
[[nodiscard]] auto resource_key(std::string_view sql) -> std::string;

} // namespace lockstep
