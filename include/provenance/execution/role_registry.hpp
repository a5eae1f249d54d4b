#pragma once

#include <provenance/execution/audit_log.hpp>
#include <provenance/execution/call_frame.hpp>
#include <provenance/execution/failure.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/role_id.hpp>
#include <provenance/storage/session.hpp>

#include <cstdint>

namespace provenance::execution {

/// Account to role mapping plus the fixed administrator identity.
template <typename Library>
class role_registry final {
 public:
  role_registry(const provenance::schema::account_id_t& administrator,
                audit_log<Library>& audit);

  /// Store `role` for `account`. Only the administrator may call this and
  /// only vendor or inspector may be stored.
  result_t<provenance::schema::role_id_t> assign_role(
      call_frame<Library>& frame,
      const provenance::schema::account_id_t& account,
      uint64_t role);

  /// Administrator for the deployment identity, else the stored role, else
  /// `none`.
  provenance::schema::role_id_t get_role(
      provenance::storage::session<Library>& session,
      const provenance::schema::account_id_t& account) const;

  bool is_administrator(const provenance::schema::account_id_t& account) const;

  const provenance::schema::account_id_t& administrator() const {
    return administrator_;
  }

 private:
  provenance::schema::account_id_t administrator_;
  audit_log<Library>& audit_;
};

}  // namespace provenance::execution
