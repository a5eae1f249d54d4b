#pragma once

#include <provenance/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: batch status.
// Compliance workflow: lifecycle position of a batch. Transitions only move
// forward one step at a time; `not_found` is reported for identifiers that
// were never created and is never stored.
namespace provenance::schema {

enum class batch_status_t : uint8_t {
  created = 0,
  approved = 1,
  certified = 2,
  not_found = 99
};

inline constexpr auto kBatchStatusLabels = label_table_t<batch_status_t, 4>{
    std::pair<std::string_view, batch_status_t>{"CREATED",
                                                batch_status_t::created},
    std::pair<std::string_view, batch_status_t>{"APPROVED",
                                                batch_status_t::approved},
    std::pair<std::string_view, batch_status_t>{"CERTIFIED",
                                                batch_status_t::certified},
    std::pair<std::string_view, batch_status_t>{"NOT FOUND",
                                                batch_status_t::not_found},
};

template <>
inline std::optional<batch_status_t> try_from_label<batch_status_t>(
    const std::string_view label) {
  return from_label(label, kBatchStatusLabels);
}

inline constexpr std::string_view to_string(const batch_status_t value) {
  return to_label(value, kBatchStatusLabels).value_or("UNKNOWN");
}

}  // namespace provenance::schema
