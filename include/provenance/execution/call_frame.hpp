#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction_event.hpp>
#include <provenance/storage/session.hpp>

#include <cstdint>
#include <vector>

namespace provenance::execution {

/// Everything a state-changing operation may touch during one call.
///
/// `caller` is the authenticated sender of the call and is the only identity
/// authorization looks at. `events` collects the audit events staged by the
/// call; they are returned to the caller only if the session commits.
template <typename Library>
struct call_frame final {
  provenance::storage::session<Library>& session;
  provenance::schema::account_id_t caller{};
  uint64_t call_index{};
  std::vector<provenance::schema::transaction_event_t> events;
};

}  // namespace provenance::execution
