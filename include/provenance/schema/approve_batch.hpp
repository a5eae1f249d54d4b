#pragma once

#include <provenance/schema/primitives.hpp>

namespace provenance::schema {

template <uint16_t Version>
struct approve_batch;

template <>
struct approve_batch<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
};

using approve_batch_t = approve_batch<1>;

}  // namespace provenance::schema
