#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: certificate asset.
// Compliance workflow: parameters of the one-unit token minted when a batch
// is certified. Freeze and clawback stay at the zero account so no party can
// ever hold either authority.
namespace provenance::schema {

template <uint16_t Version>
struct certificate_asset;

template <>
struct certificate_asset<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  batch_id_t batch_id;
  uint64_t total{1};
  uint32_t decimals{};
  bool default_frozen{};
  bytes_t unit_name;
  bytes_t asset_name;
  account_id_t manager{};
  account_id_t reserve{};
  account_id_t freeze{};
  account_id_t clawback{};
  hash32_t metadata_hash{};
  uint64_t created_at_call{};
};

using certificate_asset_t = certificate_asset<1>;

}  // namespace provenance::schema
