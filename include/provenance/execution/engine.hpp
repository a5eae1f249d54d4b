#pragma once

#include <provenance/execution/asset_facility.hpp>
#include <provenance/execution/audit_log.hpp>
#include <provenance/execution/batch_lifecycle.hpp>
#include <provenance/execution/call_frame.hpp>
#include <provenance/execution/certification_minter.hpp>
#include <provenance/execution/failure.hpp>
#include <provenance/execution/role_registry.hpp>
#include <provenance/execution/vendor_registry.hpp>
#include <provenance/schema/app_info.hpp>
#include <provenance/schema/audit_event_record.hpp>
#include <provenance/schema/batch_status.hpp>
#include <provenance/schema/certificate_asset.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/query_result.hpp>
#include <provenance/schema/role_id.hpp>
#include <provenance/schema/transaction.hpp>
#include <provenance/schema/transaction_result.hpp>
#include <provenance/storage/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace provenance::execution {

/// Deterministic compliance state machine.
///
/// The engine decodes call envelopes, runs each call inside its own storage
/// session and commits the session only when the call succeeds. Every
/// committed call advances the call counter and folds the encoded call into
/// the state root; both are written in the same atomic batch as the call's
/// state changes.
template <typename Library>
class engine final {
 public:
  using encoder_t = provenance::schema::encoding::scale_encoder_t;

  /// Open the engine over `storage`.
  ///
  /// The first open pins `administrator` in storage. Opening an existing
  /// store with a different administrator is a fatal configuration error.
  engine(encoder_t& encoder,
         provenance::storage::storage<Library>& storage,
         const provenance::schema::account_id_t& administrator);

  /// Decode and validate an envelope without executing it.
  provenance::schema::transaction_result_t check_transaction(
      const provenance::schema::bytes_view_t& raw_tx);

  /// Decode, execute and (on success) commit one SCALE-encoded call.
  provenance::schema::transaction_result_t execute(
      const provenance::schema::bytes_view_t& raw_tx);

  /// Convenience overload that encodes `tx` first.
  provenance::schema::transaction_result_t execute(
      const provenance::schema::transaction_t& tx);

  provenance::schema::role_id_t get_role(
      const provenance::schema::account_id_t& account);

  provenance::schema::batch_status_t get_batch_status(
      const provenance::schema::bytes_view_t& batch_id);

  provenance::schema::asset_id_t get_batch_asset(
      const provenance::schema::bytes_view_t& batch_id);

  /// Parameters of the certificate minted for `batch_id`, if any.
  std::optional<provenance::schema::certificate_asset_t> get_certificate(
      const provenance::schema::bytes_view_t& batch_id);

  std::vector<provenance::schema::batch_id_t> get_vendor_batches(
      const provenance::schema::account_id_t& vendor);

  /// Audit records with ids in the inclusive range.
  std::vector<provenance::schema::audit_event_record_t> events(
      uint64_t from_id,
      uint64_t to_id);

  provenance::schema::app_info_t info() const;

  /// Execute a read-only query by route.
  provenance::schema::query_result_t query(
      std::string_view path,
      const provenance::schema::bytes_view_t& data);

  /// Account that manages and reserves every certificate asset.
  static provenance::schema::account_id_t derive_application_account(
      const provenance::schema::account_id_t& administrator);

 private:
  provenance::schema::transaction_result_t execute_locked(
      const provenance::schema::bytes_view_t& raw_tx,
      const provenance::schema::transaction_t& tx);

  result_t<uint64_t> execute_operation(
      call_frame<Library>& frame,
      const provenance::schema::transaction_t& tx);

  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  provenance::storage::storage<Library>& storage_;
  provenance::schema::account_id_t administrator_;
  provenance::schema::account_id_t application_;
  audit_log<Library> audit_;
  role_registry<Library> roles_;
  vendor_registry<Library> vendors_;
  asset_facility<Library> assets_;
  certification_minter<Library> minter_;
  batch_lifecycle<Library> batches_;
  uint64_t committed_calls_{};
  provenance::schema::hash32_t state_root_{};
};

}  // namespace provenance::execution
