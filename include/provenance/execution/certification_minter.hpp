#pragma once

#include <provenance/execution/asset_facility.hpp>
#include <provenance/execution/call_frame.hpp>
#include <provenance/execution/failure.hpp>
#include <provenance/schema/primitives.hpp>

#include <string_view>

namespace provenance::execution {

/// Mints the single certificate token of a batch.
template <typename Library>
class certification_minter final {
 public:
  static constexpr std::string_view kUnitName{"CERT"};
  static constexpr std::string_view kAssetNamePrefix{"CERT-"};

  /// `application` is the engine's own account; it manages and reserves
  /// every certificate.
  certification_minter(asset_facility<Library>& assets,
                       const provenance::schema::account_id_t& application);

  /// Request one unit of `CERT-<batch id>`. Fails with `minting_failure`
  /// when the facility rejects the parameters.
  result_t<provenance::schema::asset_id_t> mint_certificate(
      call_frame<Library>& frame,
      const provenance::schema::bytes_view_t& batch_id);

  static provenance::schema::bytes_t make_asset_name(
      const provenance::schema::bytes_view_t& batch_id);

 private:
  asset_facility<Library>& assets_;
  provenance::schema::account_id_t application_;
};

}  // namespace provenance::execution
