#pragma once
#include <provenance/schema/primitives.hpp>
#include <string_view>

namespace provenance::blake3 {

provenance::schema::hash32_t hash(const std::string_view& str);
provenance::schema::hash32_t hash(const provenance::schema::bytes_view_t& bytes);

}  // namespace provenance::blake3
