#include <spdlog/spdlog.h>
#include <limits>
#include <provenance/execution/asset_facility.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

using namespace provenance::schema;

namespace provenance::execution {

template <typename Library>
result_t<asset_id_t> asset_facility<Library>::create(
    provenance::storage::session<Library>& session,
    certificate_asset_t parameters) {
  if (parameters.total == 0) {
    return make_failure(transaction_error_code::minting_failure,
                        "asset total must be nonzero");
  }
  if (parameters.decimals > kMaxDecimals) {
    return make_failure(transaction_error_code::minting_failure,
                        "asset decimals out of range");
  }
  if (parameters.asset_name.size() > kMaxAssetNameLength) {
    return make_failure(transaction_error_code::minting_failure,
                        "asset name exceeds 32 bytes");
  }
  if (parameters.unit_name.size() > kMaxUnitNameLength) {
    return make_failure(transaction_error_code::minting_failure,
                        "asset unit name exceeds 8 bytes");
  }

  auto seq_key = make_bytes(key::kAssetSeqKey);
  auto last = session.template get<asset_id_t>(make_bytes_view(seq_key))
                  .value_or(0);
  if (last == std::numeric_limits<asset_id_t>::max()) {
    return make_failure(transaction_error_code::minting_failure,
                        "asset id space exhausted");
  }

  parameters.asset_id = last + 1;
  auto record_key = key::make_asset_record_key(parameters.asset_id);
  session.put(make_bytes_view(record_key), parameters);
  session.put(make_bytes_view(seq_key), parameters.asset_id);
  spdlog::debug("Staged asset {} '{}'", parameters.asset_id,
                make_string_view(parameters.asset_name));
  return parameters.asset_id;
}

template <typename Library>
std::optional<certificate_asset_t> asset_facility<Library>::find(
    provenance::storage::session<Library>& session,
    const asset_id_t asset_id) const {
  if (asset_id == 0) {
    return std::nullopt;
  }
  auto record_key = key::make_asset_record_key(asset_id);
  return session.template get<certificate_asset_t>(
      make_bytes_view(record_key));
}

template class asset_facility<provenance::storage::rocksdb_storage_tag>;
template class asset_facility<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
