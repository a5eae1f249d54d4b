#pragma once

#include <provenance/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Compliance workflow: who may move a batch. The administrator is the
// deployment identity and is never stored; `none` marks an account with no
// assignment.
namespace provenance::schema {

enum class role_id_t : uint8_t {
  administrator = 0,
  vendor = 1,
  inspector = 2,
  none = 99
};

inline constexpr auto kRoleIdLabels = label_table_t<role_id_t, 4>{
    std::pair<std::string_view, role_id_t>{"ADMIN", role_id_t::administrator},
    std::pair<std::string_view, role_id_t>{"VENDOR", role_id_t::vendor},
    std::pair<std::string_view, role_id_t>{"INSPECTOR", role_id_t::inspector},
    std::pair<std::string_view, role_id_t>{"NONE", role_id_t::none},
};

/// Only these roles may be written by `assign_role`.
inline constexpr bool is_assignable(const uint64_t code) {
  return code == static_cast<uint64_t>(role_id_t::vendor) ||
         code == static_cast<uint64_t>(role_id_t::inspector);
}

template <>
inline std::optional<role_id_t> try_from_label<role_id_t>(
    const std::string_view label) {
  return from_label(label, kRoleIdLabels);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_label(value, kRoleIdLabels).value_or("UNKNOWN");
}

}  // namespace provenance::schema
