#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Document names for the schema enums. Each enum header declares its
// `k...Mappings` table and specializes `try_from_string` over it.
namespace bootforge::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Names of `mappings` in table order, joined by ", ".
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings) {
  auto joined = std::string{};
  for (const auto& [name, _] : mappings) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

// Enums without a table have no document form.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace bootforge::schema
