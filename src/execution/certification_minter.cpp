#include <spdlog/spdlog.h>
#include <provenance/blake3/hash.hpp>
#include <provenance/execution/certification_minter.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

using namespace provenance::schema;

namespace provenance::execution {

template <typename Library>
certification_minter<Library>::certification_minter(
    asset_facility<Library>& assets,
    const account_id_t& application)
    : assets_{assets}, application_{application} {}

template <typename Library>
result_t<asset_id_t> certification_minter<Library>::mint_certificate(
    call_frame<Library>& frame,
    const bytes_view_t& batch_id) {
  auto asset_name = make_asset_name(batch_id);
  auto parameters = certificate_asset_t{
      .batch_id = make_bytes(batch_id),
      .total = 1,
      .decimals = 0,
      .default_frozen = false,
      .unit_name = make_bytes(kUnitName),
      .asset_name = asset_name,
      .manager = application_,
      .reserve = application_,
      .freeze = make_zero_hash(),
      .clawback = make_zero_hash(),
      .metadata_hash = provenance::blake3::hash(make_bytes_view(asset_name)),
      .created_at_call = frame.call_index};

  auto created = assets_.create(frame.session, std::move(parameters));
  if (auto* rejected = std::get_if<failure>(&created)) {
    spdlog::warn("Certificate minting for batch '{}' rejected: {}",
                 make_string_view(batch_id), rejected->message);
    return make_failure(transaction_error_code::minting_failure,
                        "certificate minting failed: " + rejected->message);
  }
  return std::get<asset_id_t>(created);
}

template <typename Library>
bytes_t certification_minter<Library>::make_asset_name(
    const bytes_view_t& batch_id) {
  auto name = make_bytes(kAssetNamePrefix);
  name.insert(std::end(name), std::begin(batch_id), std::end(batch_id));
  return name;
}

template class certification_minter<provenance::storage::rocksdb_storage_tag>;
template class certification_minter<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
