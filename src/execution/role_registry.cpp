#include <spdlog/spdlog.h>
#include <provenance/execution/role_registry.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

using namespace provenance::schema;

namespace provenance::execution {

template <typename Library>
role_registry<Library>::role_registry(const account_id_t& administrator,
                                      audit_log<Library>& audit)
    : administrator_{administrator}, audit_{audit} {}

template <typename Library>
result_t<role_id_t> role_registry<Library>::assign_role(
    call_frame<Library>& frame,
    const account_id_t& account,
    const uint64_t role) {
  if (!is_administrator(frame.caller)) {
    return make_failure(transaction_error_code::unauthorized,
                        "only the administrator can assign roles");
  }
  if (!is_assignable(role)) {
    return make_failure(transaction_error_code::invalid_argument,
                        "role must be vendor (1) or inspector (2)");
  }

  auto assigned = static_cast<role_id_t>(role);
  auto key = key::make_role_key(account);
  frame.session.put(make_bytes_view(key), assigned);
  audit_.emit(frame, "assign_role", make_bytes_view(account),
              {{.key = "role", .value = std::string{to_string(assigned)}}});
  spdlog::debug("Assigned role {} to {}", to_string(assigned),
                to_hex(account));
  return assigned;
}

template <typename Library>
role_id_t role_registry<Library>::get_role(
    provenance::storage::session<Library>& session,
    const account_id_t& account) const {
  if (is_administrator(account)) {
    return role_id_t::administrator;
  }
  auto key = key::make_role_key(account);
  return session.template get<role_id_t>(make_bytes_view(key))
      .value_or(role_id_t::none);
}

template <typename Library>
bool role_registry<Library>::is_administrator(
    const account_id_t& account) const {
  return account == administrator_;
}

template class role_registry<provenance::storage::rocksdb_storage_tag>;
template class role_registry<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
