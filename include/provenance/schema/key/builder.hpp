#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace provenance::schema::key {

/// Appends raw key segments. Integers are written big-endian so that
/// bytewise key order matches numeric order under a shared prefix.
struct builder final {
  provenance::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write_big_endian(uint64_t value);
};

}  // namespace provenance::schema::key
