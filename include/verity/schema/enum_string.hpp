#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for registry enums. Audit attributes and query answers carry
// these names, so a table entry is part of the wire surface.
namespace verity::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view name,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [entry_name, entry_value] : names) {
    if (entry_name == name) {
      return entry_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [entry_name, entry_value] : names) {
    if (entry_value == value) {
      return entry_name;
    }
  }
  return std::nullopt;
}

/// Name of `value`, or "unknown" when the table has no entry for it.
template <typename Enum, std::size_t N>
constexpr std::string_view name_or_unknown(const Enum value,
                                           const enum_names_t<Enum, N>& names) {
  return to_string(value, names).value_or("unknown");
}

/// Parses a registry enum from its wire name. Each enum header specializes
/// this against its own table; there is no generic definition.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace verity::schema
