#pragma once

#include <provenance/schema/primitives.hpp>

namespace provenance::schema {

template <uint16_t Version>
struct certify_batch;

template <>
struct certify_batch<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
};

using certify_batch_t = certify_batch<1>;

}  // namespace provenance::schema
