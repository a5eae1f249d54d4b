#include <spdlog/spdlog.h>
#include <algorithm>
#include <provenance/execution/batch_lifecycle.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

using namespace provenance::schema;

namespace provenance::execution {

template <typename Library>
batch_lifecycle<Library>::batch_lifecycle(role_registry<Library>& roles,
                                          vendor_registry<Library>& vendors,
                                          certification_minter<Library>& minter,
                                          audit_log<Library>& audit)
    : roles_{roles}, vendors_{vendors}, minter_{minter}, audit_{audit} {}

template <typename Library>
result_t<batch_status_t> batch_lifecycle<Library>::create_batch(
    call_frame<Library>& frame,
    const bytes_view_t& batch_id) {
  auto& session = frame.session;
  if (roles_.get_role(session, frame.caller) != role_id_t::vendor) {
    return make_failure(transaction_error_code::unauthorized,
                        "only vendors can create batches");
  }
  if (batch_id.empty()) {
    return make_failure(transaction_error_code::invalid_argument,
                        "batch id must not be empty");
  }
  if (std::find(std::begin(batch_id), std::end(batch_id),
                vendor_registry<Library>::kDelimiter) != std::end(batch_id)) {
    return make_failure(transaction_error_code::invalid_argument,
                        "batch id must not contain '|'");
  }

  auto key = key::make_batch_key(batch_id);
  if (session.contains(make_bytes_view(key))) {
    return make_failure(transaction_error_code::already_exists,
                        "batch already exists");
  }

  session.put(make_bytes_view(key), batch_status_t::created);
  vendors_.append_batch(session, frame.caller, batch_id);
  audit_.emit(frame, "create_batch", batch_id);
  spdlog::debug("Batch '{}' created by {}", make_string_view(batch_id),
                to_hex(frame.caller));
  return batch_status_t::created;
}

template <typename Library>
result_t<batch_status_t> batch_lifecycle<Library>::approve_batch(
    call_frame<Library>& frame,
    const bytes_view_t& batch_id) {
  auto& session = frame.session;
  if (roles_.get_role(session, frame.caller) != role_id_t::inspector) {
    return make_failure(transaction_error_code::unauthorized,
                        "only inspectors can approve batches");
  }
  if (auto rejected =
          require_status(session, batch_id, batch_status_t::created)) {
    return *rejected;
  }

  auto key = key::make_batch_key(batch_id);
  session.put(make_bytes_view(key), batch_status_t::approved);
  audit_.emit(frame, "approve_batch", batch_id);
  spdlog::debug("Batch '{}' approved by {}", make_string_view(batch_id),
                to_hex(frame.caller));
  return batch_status_t::approved;
}

template <typename Library>
result_t<batch_status_t> batch_lifecycle<Library>::certify_batch(
    call_frame<Library>& frame,
    const bytes_view_t& batch_id) {
  auto& session = frame.session;
  auto role = roles_.get_role(session, frame.caller);
  if (role != role_id_t::administrator && role != role_id_t::inspector) {
    return make_failure(transaction_error_code::unauthorized,
                        "only the administrator or inspectors can certify");
  }
  if (auto rejected =
          require_status(session, batch_id, batch_status_t::approved)) {
    return *rejected;
  }

  auto key = key::make_batch_key(batch_id);
  session.put(make_bytes_view(key), batch_status_t::certified);

  auto minted = minter_.mint_certificate(frame, batch_id);
  if (auto* rejected = std::get_if<failure>(&minted)) {
    return *rejected;
  }
  auto asset_id = std::get<asset_id_t>(minted);
  auto asset_key = key::make_asset_key(batch_id);
  session.put(make_bytes_view(asset_key), asset_id);

  audit_.emit(frame, "certify_batch", batch_id,
              {{.key = "asset_id",
                .value = std::to_string(asset_id),
                .index = true}});
  spdlog::info("Batch '{}' certified with asset {}",
               make_string_view(batch_id), asset_id);
  return batch_status_t::certified;
}

template <typename Library>
batch_status_t batch_lifecycle<Library>::get_batch_status(
    provenance::storage::session<Library>& session,
    const bytes_view_t& batch_id) const {
  auto key = key::make_batch_key(batch_id);
  return session.template get<batch_status_t>(make_bytes_view(key))
      .value_or(batch_status_t::not_found);
}

template <typename Library>
asset_id_t batch_lifecycle<Library>::get_batch_asset(
    provenance::storage::session<Library>& session,
    const bytes_view_t& batch_id) const {
  auto key = key::make_asset_key(batch_id);
  return session.template get<asset_id_t>(make_bytes_view(key)).value_or(0);
}

template <typename Library>
std::optional<failure> batch_lifecycle<Library>::require_status(
    provenance::storage::session<Library>& session,
    const bytes_view_t& batch_id,
    const batch_status_t expected) const {
  auto status = get_batch_status(session, batch_id);
  if (status == batch_status_t::not_found) {
    return make_failure(transaction_error_code::not_found,
                        "batch does not exist");
  }
  if (status != expected) {
    return make_failure(transaction_error_code::invalid_transition,
                        "batch must be in " + std::string{to_string(expected)} +
                            " state, found " + std::string{to_string(status)});
  }
  return std::nullopt;
}

template class batch_lifecycle<provenance::storage::rocksdb_storage_tag>;
template class batch_lifecycle<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
