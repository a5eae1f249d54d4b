#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace provenance::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t version{1};
  std::string data{"provenance-compliance"};
  std::string app_version{"0.1.0"};
  uint64_t committed_calls{};
  hash32_t state_root{};
  account_id_t administrator{};
  account_id_t application{};
};

using app_info_t = app_info<1>;

}  // namespace provenance::schema
