#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace lockstep {

// Ids come from graph files and log lines; anything printable goes, but not
// an empty string or control characters.
[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  if (value.empty()) {
    return false;
  }
  return std::ranges::none_of(
      value, [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

namespace detail {
struct TaskIdTag {};
struct OperationIdTag {};
} // namespace detail

/// String identifier tagged with what it names, so a task id and an
/// operation id are distinct types that compare, hash and format alike.
template <typename Tag> class Identifier {
public:
  Identifier() = default;
  explicit Identifier(std::string text) : text_(std::move(text)) {}
  explicit Identifier(std::string_view text) : text_(text) {}
  explicit Identifier(const char *text) : text_(text != nullptr ? text : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return text_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return text_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return text_.empty(); }

  friend auto operator<=>(const Identifier &, const Identifier &) = default;
  friend auto operator==(const Identifier &, const Identifier &)
      -> bool = default;
  friend auto operator==(const Identifier &id, std::string_view text) noexcept
      -> bool {
    return id.text_ == text;
  }

  friend auto operator<<(std::ostream &os, const Identifier &id)
      -> std::ostream & {
    return os << id.text_;
  }

private:
  std::string text_;
};

using TaskId = Identifier<detail::TaskIdTag>;
using OperationId = Identifier<detail::OperationIdTag>;

} // namespace lockstep

// ankerl::unordered_dense::hash defers to std::hash when the specialization
// declares itself avalanching.
template <typename Tag> struct std::hash<lockstep::Identifier<Tag>> {
  using is_avalanching = void;
  auto operator()(const lockstep::Identifier<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<lockstep::Identifier<Tag>>
    : std::formatter<std::string_view> {
  auto format(const lockstep::Identifier<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
