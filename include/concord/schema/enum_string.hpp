#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace concord::schema {

// Name tables pair each enumerator with its wire/CLI name.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Name of `value`, or `fallback` for a value outside the table.
template <typename Enum, std::size_t N>
constexpr std::string_view to_string_or(const Enum value,
                                        const enum_names_t<Enum, N>& names,
                                        const std::string_view fallback) {
  return to_string(value, names).value_or(fallback);
}

/// Parse a user-supplied name. Only enums that are configurable specialize
/// this.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace concord::schema
