#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lockstep {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// "Access-Share", "access_share" and "ACCESS SHARE" all normalize to
// "accessshare".
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (const char c : token) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

// AccessExclusive -> access_exclusive. Enumerator names here never carry
// acronyms, so every interior capital starts a new word.
[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uc = static_cast<unsigned char>(name[i]);
    if (i > 0 && std::isupper(uc) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

template <typename E>
[[nodiscard]] inline auto
enum_to_snake_case_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  using descriptors = boost::describe::describe_enumerators<E>;
  static const auto names = [] {
    std::array<std::pair<E, std::string>,
               boost::mp11::mp_size<descriptors>::value>
        out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto d) {
      out[i++] = {d.value, enum_name_to_snake_case(d.name)};
    });
    return out;
  }();

  for (const auto &[e, text] : names) {
    if (e == value) {
      return text;
    }
  }
  return fallback;
}

// Empty when `input` names no enumerator.
template <typename E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  const auto wanted = normalize_enum_token(input);
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto d) {
        if (!out && wanted == normalize_enum_token(d.name)) {
          out = d.value;
        }
      });
  return out;
}

} // namespace util

// to_string_view() and parse<E>() for a described enum; unknown input
// parses as `DefaultValue`.
#define LOCKSTEP_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                     \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::lockstep::util::enum_to_snake_case_view(value);                   \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::lockstep::util::try_parse_enum<EnumType>(s).value_or(             \
        DefaultValue);                                                         \
  }

} // namespace lockstep
