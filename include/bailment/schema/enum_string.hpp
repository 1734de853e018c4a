#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Textual forms of schema enums: one constexpr table per enum, shared by
// logging, the command line tool and tests.
namespace bailment::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

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

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  return to_string(value, mappings).value_or(kUnknownEnumName);
}

/// Each name and each value appears once; checked by a static_assert next
/// to every table.
template <typename Enum, std::size_t N>
constexpr bool is_bijective(const enum_mappings_t<Enum, N>& mappings) {
  for (std::size_t i = 0; i < N; ++i) {
    for (std::size_t j = i + 1; j < N; ++j) {
      if (mappings[i].first == mappings[j].first ||
          mappings[i].second == mappings[j].second) {
        return false;
      }
    }
  }
  return true;
}

/// Specialized next to each enum that can be parsed back from text.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace bailment::schema
