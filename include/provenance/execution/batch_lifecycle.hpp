#pragma once

#include <provenance/execution/audit_log.hpp>
#include <provenance/execution/call_frame.hpp>
#include <provenance/execution/certification_minter.hpp>
#include <provenance/execution/failure.hpp>
#include <provenance/execution/role_registry.hpp>
#include <provenance/execution/vendor_registry.hpp>
#include <provenance/schema/batch_status.hpp>
#include <provenance/schema/primitives.hpp>

#include <optional>

namespace provenance::execution {

/// Batch state machine: created -> approved -> certified.
///
/// Every transition re-derives the caller's role from the registry. Checks
/// run in a fixed order (role, arguments, existence, current state) because
/// that order decides which error a caller sees when several apply.
template <typename Library>
class batch_lifecycle final {
 public:
  batch_lifecycle(role_registry<Library>& roles,
                  vendor_registry<Library>& vendors,
                  certification_minter<Library>& minter,
                  audit_log<Library>& audit);

  result_t<provenance::schema::batch_status_t> create_batch(
      call_frame<Library>& frame,
      const provenance::schema::bytes_view_t& batch_id);

  result_t<provenance::schema::batch_status_t> approve_batch(
      call_frame<Library>& frame,
      const provenance::schema::bytes_view_t& batch_id);

  result_t<provenance::schema::batch_status_t> certify_batch(
      call_frame<Library>& frame,
      const provenance::schema::bytes_view_t& batch_id);

  provenance::schema::batch_status_t get_batch_status(
      provenance::storage::session<Library>& session,
      const provenance::schema::bytes_view_t& batch_id) const;

  /// Token id of a certified batch, 0 otherwise.
  provenance::schema::asset_id_t get_batch_asset(
      provenance::storage::session<Library>& session,
      const provenance::schema::bytes_view_t& batch_id) const;

 private:
  /// Existence and current-state checks shared by approve and certify.
  std::optional<failure> require_status(
      provenance::storage::session<Library>& session,
      const provenance::schema::bytes_view_t& batch_id,
      provenance::schema::batch_status_t expected) const;

  role_registry<Library>& roles_;
  vendor_registry<Library>& vendors_;
  certification_minter<Library>& minter_;
  audit_log<Library>& audit_;
};

}  // namespace provenance::execution
