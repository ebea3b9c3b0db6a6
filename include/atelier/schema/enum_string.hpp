#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Each enum declares a constexpr array of
// (name, value) pairs and forwards its to_string/try_from_string to these.
namespace atelier::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_value(const std::string_view name,
                                           const enum_names_t<Enum, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view lookup_name(const Enum value,
                                       const enum_names_t<Enum, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace atelier::schema
