#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Display labels for the numeric codes returned by the ledger. The same
// tables back the operator CLI rendering and its argument parsing.
namespace provenance::schema {

template <typename Enum, std::size_t N>
using label_table_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_label(const std::string_view label,
                                         const label_table_t<Enum, N>& table) {
  for (const auto& [name, enum_value] : table) {
    if (name == label) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_label(
    const Enum value,
    const label_table_t<Enum, N>& table) {
  for (const auto& [name, enum_value] : table) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Specialized next to each enum that carries a label table.
template <typename Enum>
std::optional<Enum> try_from_label(const std::string_view label) {
  static_cast<void>(label);
  return std::nullopt;
}

}  // namespace provenance::schema
