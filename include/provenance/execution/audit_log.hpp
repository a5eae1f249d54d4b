#pragma once

#include <provenance/execution/call_frame.hpp>
#include <provenance/schema/audit_event_record.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction_event_attribute.hpp>
#include <provenance/storage/session.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace provenance::execution {

/// Append-only audit trail of successful state-changing calls.
///
/// Event ids start at 1 and are gap-free because records are staged in the
/// call's session and committed together with the state writes they
/// describe.
template <typename Library>
class audit_log final {
 public:
  /// Stage one event for the current call. Must run after the call's state
  /// writes have been staged.
  void emit(call_frame<Library>& frame,
            std::string_view name,
            const provenance::schema::bytes_view_t& subject,
            std::vector<provenance::schema::transaction_event_attribute_t>
                extra_attributes = {});

  /// Committed (or staged) records with ids in [from_id, to_id].
  std::vector<provenance::schema::audit_event_record_t> range(
      provenance::storage::session<Library>& session,
      uint64_t from_id,
      uint64_t to_id) const;

  /// Id of the most recent event, 0 when the log is empty.
  uint64_t last_event_id(provenance::storage::session<Library>& session) const;

  static std::string format_message(
      std::string_view name,
      const provenance::schema::bytes_view_t& subject,
      const provenance::schema::account_id_t& caller);
};

}  // namespace provenance::execution
