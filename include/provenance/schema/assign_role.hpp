#pragma once

#include <provenance/schema/primitives.hpp>

namespace provenance::schema {

template <uint16_t Version>
struct assign_role;

/// `role` carries the raw code so out-of-range values reach validation.
template <>
struct assign_role<1> final {
  uint16_t version{1};
  account_id_t account{};
  uint64_t role{};
};

using assign_role_t = assign_role<1>;

}  // namespace provenance::schema
