#pragma once

#include <provenance/execution/failure.hpp>
#include <provenance/schema/certificate_asset.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/storage/session.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace provenance::execution {

/// Token creation facility of the ledger.
///
/// Assigns strictly increasing nonzero asset ids and keeps the parameters of
/// every created asset. Creation is staged in the caller's session, so an
/// aborted call neither creates the asset nor consumes its id.
template <typename Library>
class asset_facility final {
 public:
  static constexpr std::size_t kMaxAssetNameLength = 32;
  static constexpr std::size_t kMaxUnitNameLength = 8;
  static constexpr uint32_t kMaxDecimals = 19;

  /// Validate `parameters`, assign the next asset id and stage the record.
  /// The `asset_id` field of `parameters` is ignored.
  result_t<provenance::schema::asset_id_t> create(
      provenance::storage::session<Library>& session,
      provenance::schema::certificate_asset_t parameters);

  std::optional<provenance::schema::certificate_asset_t> find(
      provenance::storage::session<Library>& session,
      provenance::schema::asset_id_t asset_id) const;
};

}  // namespace provenance::execution
