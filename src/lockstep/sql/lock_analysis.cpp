#include "lockstep/sql/lock_analysis.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lockstep {
namespace sql {

namespace {

[[nodiscard]] auto is_ident_start(char c) noexcept -> bool {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) != 0 || c == '_' || uc >= 0x80;
}

[[nodiscard]] auto is_ident_char(char c) noexcept -> bool {
  return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c)) != 0 ||
         c == '$';
}

[[nodiscard]] auto to_upper(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

[[nodiscard]] auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Position just past a dollar-quoted body starting at `pos`, or npos when the
// text at `pos` is not a dollar-quote opener.
[[nodiscard]] auto skip_dollar_quote(std::string_view sql, std::size_t pos)
    -> std::size_t {
  auto end_tag = sql.find('$', pos + 1);
  if (end_tag == std::string_view::npos) {
    return std::string_view::npos;
  }
  auto tag = sql.substr(pos, end_tag - pos + 1);
  for (char c : tag.substr(1, tag.size() - 2)) {
    if (!is_ident_char(c) || c == '$') {
      return std::string_view::npos;
    }
  }
  auto close = sql.find(tag, end_tag + 1);
  return close == std::string_view::npos ? sql.size() : close + tag.size();
}

} // namespace

auto tokenize(std::string_view sql) -> std::vector<Token> {
  std::vector<Token> out;
  int depth = 0;
  std::size_t i = 0;
  const auto n = sql.size();

  while (i < n) {
    const char c = sql[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
    } else if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
      auto eol = sql.find('\n', i);
      i = eol == std::string_view::npos ? n : eol + 1;
    } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
      auto close = sql.find("*/", i + 2);
      i = close == std::string_view::npos ? n : close + 2;
    } else if (c == '\'') {
      // '' escapes a quote inside the literal.
      ++i;
      while (i < n) {
        if (sql[i] == '\'' && i + 1 < n && sql[i + 1] == '\'') {
          i += 2;
        } else if (sql[i] == '\'') {
          ++i;
          break;
        } else {
          ++i;
        }
      }
    } else if (c == '$' &&
               skip_dollar_quote(sql, i) != std::string_view::npos) {
      i = skip_dollar_quote(sql, i);
    } else if (c == '"') {
      std::string ident;
      ++i;
      while (i < n) {
        if (sql[i] == '"' && i + 1 < n && sql[i + 1] == '"') {
          ident.push_back('"');
          i += 2;
        } else if (sql[i] == '"') {
          ++i;
          break;
        } else {
          ident.push_back(sql[i++]);
        }
      }
      out.push_back({TokenKind::Quoted, std::move(ident), {}, depth});
    } else if (is_ident_start(c)) {
      auto start = i;
      while (i < n && is_ident_char(sql[i])) {
        ++i;
      }
      auto word = sql.substr(start, i - start);
      out.push_back({TokenKind::Word, std::string(word), to_upper(word), depth});
    } else if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      auto start = i;
      while (i < n && (std::isalnum(static_cast<unsigned char>(sql[i])) != 0 ||
                       sql[i] == '.')) {
        ++i;
      }
      out.push_back(
          {TokenKind::Number, std::string(sql.substr(start, i - start)), {},
           depth});
    } else {
      if (c == ')') {
        depth = std::max(0, depth - 1);
      }
      out.push_back({TokenKind::Symbol, std::string(1, c), {}, depth});
      if (c == '(') {
        ++depth;
      }
      ++i;
    }
  }
  return out;
}

} // namespace sql

namespace {

using sql::Token;
using sql::TokenKind;
using TokenSpan = std::span<const Token>;

[[nodiscard]] auto describe(StatementType type, LockLevel level)
    -> LockAnalysis {
  switch (type) {
  case StatementType::Ddl:
    return {type, level, false, true, true, false};
  case StatementType::ConcurrentIndex:
    return {type, level, false, false, false, true};
  case StatementType::Dml:
  case StatementType::Select:
    return {type, level, true, false, false, false};
  case StatementType::LockTable:
    return {type, level, !locks_conflict(level, level),
            locks_conflict(level, LockLevel::AccessShare),
            locks_conflict(level, LockLevel::RowExclusive), false};
  case StatementType::Unknown:
    break;
  }
  return {StatementType::Unknown, LockLevel::Exclusive, false, true, true,
          false};
}

[[nodiscard]] auto word_at(TokenSpan t, std::size_t i) -> std::string_view {
  return i < t.size() && t[i].kind == TokenKind::Word
             ? std::string_view{t[i].upper}
             : std::string_view{};
}

[[nodiscard]] auto is_any(std::string_view w,
                          std::initializer_list<std::string_view> options)
    -> bool {
  return std::ranges::find(options, w) != options.end();
}

// DDL keyword pairs anywhere in the statement; used for shapes the leading
// keyword scan does not cover (DO blocks, CREATE RULE bodies, ...).
[[nodiscard]] auto mentions_ddl(TokenSpan t) -> bool {
  for (std::size_t i = 0; i < t.size(); ++i) {
    const auto w = word_at(t, i);
    const auto next = word_at(t, i + 1);
    if (w == "TRUNCATE") {
      return true;
    }
    if (is_any(w, {"CREATE", "ALTER", "DROP"}) && next == "TABLE") {
      return true;
    }
    if (is_any(w, {"CREATE", "DROP"}) && next == "INDEX") {
      return true;
    }
    if (is_any(w, {"ADD", "DROP"}) && is_any(next, {"COLUMN", "CONSTRAINT"})) {
      return true;
    }
  }
  return false;
}

[[nodiscard]] auto fallback(TokenSpan t) -> LockAnalysis {
  if (mentions_ddl(t)) {
    return describe(StatementType::Ddl, LockLevel::AccessExclusive);
  }
  return describe(StatementType::Unknown, LockLevel::Exclusive);
}

[[nodiscard]] auto has_row_locking_clause(TokenSpan t) -> bool {
  for (std::size_t i = 0; i + 1 < t.size(); ++i) {
    if (t[i].depth == 0 && t[i].is_word("FOR") &&
        is_any(word_at(t, i + 1), {"UPDATE", "SHARE", "NO", "KEY"})) {
      return true;
    }
  }
  return false;
}

// LOCK [TABLE] [ONLY] name [, ...] [IN <mode> MODE] [NOWAIT]
[[nodiscard]] auto lock_table_level(TokenSpan t) -> LockLevel {
  std::size_t in = t.size();
  for (std::size_t i = 0; i < t.size(); ++i) {
    if (t[i].is_word("IN")) {
      in = i;
      break;
    }
  }
  if (in == t.size()) {
    return LockLevel::AccessExclusive;
  }
  std::string mode;
  for (std::size_t i = in + 1; i < t.size() && !t[i].is_word("MODE"); ++i) {
    if (t[i].kind == TokenKind::Word) {
      mode += t[i].upper;
    }
  }
  if (auto level = util::try_parse_enum<LockLevel>(mode); level) {
    return *level;
  }
  // SHARE ROW EXCLUSIVE has no slot here; round up.
  return LockLevel::Exclusive;
}

[[nodiscard]] auto classify(TokenSpan t) -> LockAnalysis;

// WITH [RECURSIVE] name AS (...) [, ...] <statement>: the statement that
// follows the CTE list decides, raised to ROW_EXCLUSIVE when a CTE body
// modifies data.
[[nodiscard]] auto classify_with(TokenSpan t) -> LockAnalysis {
  bool modifying_cte = false;
  std::size_t main = t.size();
  for (std::size_t i = 1; i < t.size(); ++i) {
    if (t[i].depth == 1 && i > 0 && t[i - 1].is_symbol('(') &&
        is_any(word_at(t, i), {"INSERT", "UPDATE", "DELETE", "MERGE"})) {
      modifying_cte = true;
    }
    if (t[i].depth == 0 &&
        is_any(word_at(t, i), {"SELECT", "INSERT", "UPDATE", "DELETE",
                               "MERGE"}) &&
        main == t.size()) {
      main = i;
    }
  }
  if (main == t.size()) {
    return fallback(t);
  }
  auto analysis = classify(t.subspan(main));
  if (modifying_cte && analysis.type == StatementType::Select) {
    return describe(StatementType::Dml, LockLevel::RowExclusive);
  }
  return analysis;
}

[[nodiscard]] auto classify(TokenSpan t) -> LockAnalysis {
  std::size_t i = 0;
  while (i < t.size() && (t[i].is_symbol('(') || t[i].is_symbol(';'))) {
    ++i;
  }
  t = t.subspan(i);
  const auto head = word_at(t, 0);

  if (head == "SELECT" || head == "VALUES" || head == "TABLE") {
    if (head == "SELECT" && has_row_locking_clause(t)) {
      return describe(StatementType::Select, LockLevel::RowShare);
    }
    return describe(StatementType::Select, LockLevel::AccessShare);
  }
  if (is_any(head, {"INSERT", "UPDATE", "DELETE", "MERGE"})) {
    return describe(StatementType::Dml, LockLevel::RowExclusive);
  }
  if (head == "WITH") {
    return classify_with(t);
  }
  if (head == "TRUNCATE") {
    return describe(StatementType::Ddl, LockLevel::AccessExclusive);
  }
  if (head == "LOCK") {
    return describe(StatementType::LockTable, lock_table_level(t));
  }

  if (is_any(head, {"CREATE", "ALTER", "DROP"})) {
    std::size_t j = 1;
    while (is_any(word_at(t, j), {"OR", "REPLACE", "UNIQUE", "TEMP",
                                  "TEMPORARY", "UNLOGGED", "GLOBAL", "LOCAL"})) {
      ++j;
    }
    const auto object = word_at(t, j);
    if (object == "TABLE") {
      return describe(StatementType::Ddl, LockLevel::AccessExclusive);
    }
    if (object == "INDEX" && head != "ALTER") {
      if (word_at(t, j + 1) == "CONCURRENTLY") {
        return describe(StatementType::ConcurrentIndex,
                        LockLevel::ShareUpdateExclusive);
      }
      return describe(StatementType::Ddl, LockLevel::AccessExclusive);
    }
  }

  return fallback(t);
}

// Reads `name` or `schema.name` starting at `i`; nullopt when the token is
// not an identifier.
[[nodiscard]] auto read_name(TokenSpan t, std::size_t i)
    -> std::optional<std::string> {
  static constexpr std::array<std::string_view, 9> kNotNames = {
      "SELECT", "WITH", "VALUES", "LATERAL", "SET", "WHERE", "ON", "AS",
      "USING"};
  auto is_name = [&](std::size_t k) {
    if (k >= t.size()) {
      return false;
    }
    if (t[k].kind == TokenKind::Quoted) {
      return true;
    }
    return t[k].kind == TokenKind::Word &&
           std::ranges::find(kNotNames, t[k].upper) == kNotNames.end();
  };
  if (!is_name(i)) {
    return std::nullopt;
  }
  std::string name = to_lower(t[i].text);
  while (i + 2 < t.size() && t[i + 1].is_symbol('.') && is_name(i + 2)) {
    name += '.';
    name += to_lower(t[i + 2].text);
    i += 2;
  }
  return name;
}

} // namespace

auto analyze_lock_level(std::string_view sql) -> LockAnalysis {
  auto tokens = sql::tokenize(sql);
  return classify(tokens);
}

auto extract_table_names(std::string_view sql) -> std::vector<std::string> {
  auto tokens = sql::tokenize(sql);
  TokenSpan t{tokens};
  std::vector<std::string> names;

  const bool index_statement =
      is_any(word_at(t, 0), {"CREATE", "DROP"}) &&
      std::ranges::any_of(t.first(std::min<std::size_t>(t.size(), 4)),
                          [](const Token &tok) { return tok.is_word("INDEX"); });

  for (std::size_t i = 0; i < t.size(); ++i) {
    const auto w = word_at(t, i);
    bool introduces_table = is_any(w, {"FROM", "JOIN", "INTO", "TABLE"}) ||
                            (w == "ON" && index_statement) ||
                            (w == "LOCK" && i == 0);
    // FOR UPDATE / FOR NO KEY UPDATE / ON CONFLICT DO UPDATE are not tables.
    if (w == "UPDATE") {
      const auto prev = i > 0 ? word_at(t, i - 1) : std::string_view{};
      introduces_table = !is_any(prev, {"FOR", "KEY", "DO", "ON"});
    }
    if (!introduces_table) {
      continue;
    }
    auto k = i + 1;
    while (is_any(word_at(t, k), {"ONLY", "IF", "NOT", "EXISTS", "TABLE"})) {
      ++k;
    }
    if (auto name = read_name(t, k); name) {
      names.push_back(std::move(*name));
    }
  }

  std::ranges::sort(names);
  auto dup = std::ranges::unique(names);
  names.erase(dup.begin(), dup.end());
  return names;
}

auto resource_key(std::string_view sql) -> std::string {
  std::string key;
  for (const auto &name : extract_table_names(sql)) {
    if (!key.empty()) {
      key += ',';
    }
    key += name;
  }
  return key;
}

} // namespace lockstep
