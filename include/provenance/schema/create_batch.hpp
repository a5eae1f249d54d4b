#pragma once

#include <provenance/schema/primitives.hpp>

namespace provenance::schema {

template <uint16_t Version>
struct create_batch;

template <>
struct create_batch<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
};

using create_batch_t = create_batch<1>;

}  // namespace provenance::schema
