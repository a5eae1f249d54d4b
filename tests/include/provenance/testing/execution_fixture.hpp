#pragma once

#include <provenance/execution/engine.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace provenance::testing {

using scale_encoder_t = provenance::schema::encoding::scale_encoder_t;

inline provenance::schema::transaction_t make_tx(
    const provenance::schema::account_id_t& sender,
    const provenance::schema::transaction_payload_t& payload) {
  return provenance::schema::transaction_t{
      .version = 1, .sender = sender, .payload = payload};
}

inline provenance::schema::transaction_t make_assign_role(
    const provenance::schema::account_id_t& sender,
    const provenance::schema::account_id_t& account,
    const uint64_t role) {
  return make_tx(sender,
                 provenance::schema::assign_role_t{.account = account,
                                                   .role = role});
}

inline provenance::schema::transaction_t make_create_batch(
    const provenance::schema::account_id_t& sender,
    const std::string_view batch_id) {
  return make_tx(sender, provenance::schema::create_batch_t{
                             .batch_id = make_batch_id(batch_id)});
}

inline provenance::schema::transaction_t make_approve_batch(
    const provenance::schema::account_id_t& sender,
    const std::string_view batch_id) {
  return make_tx(sender, provenance::schema::approve_batch_t{
                             .batch_id = make_batch_id(batch_id)});
}

inline provenance::schema::transaction_t make_certify_batch(
    const provenance::schema::account_id_t& sender,
    const std::string_view batch_id) {
  return make_tx(sender, provenance::schema::certify_batch_t{
                             .batch_id = make_batch_id(batch_id)});
}

/// Engine over the in-memory backend with a fixed cast of accounts.
class execution_fixture final {
 public:
  using library_t = provenance::storage::memory_storage_tag;
  using engine_t = provenance::execution::engine<library_t>;

  execution_fixture()
      : encoder_{},
        storage_{provenance::storage::make_storage<library_t>("")},
        engine_{encoder_, storage_, administrator()} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;
  ~execution_fixture() = default;

  static provenance::schema::account_id_t administrator() {
    return make_hash(1);
  }
  static provenance::schema::account_id_t vendor() { return make_hash(40); }
  static provenance::schema::account_id_t inspector() {
    return make_hash(80);
  }
  static provenance::schema::account_id_t outsider() {
    return make_hash(120);
  }

  scale_encoder_t& encoder() { return encoder_; }
  provenance::storage::storage<library_t>& storage() { return storage_; }
  engine_t& engine() { return engine_; }

  /// Assign the vendor and inspector roles used by most scenarios.
  void assign_default_roles() {
    engine_.execute(make_assign_role(administrator(), vendor(), 1));
    engine_.execute(make_assign_role(administrator(), inspector(), 2));
  }

  uint64_t decode_return(const provenance::schema::transaction_result_t& r) {
    return encoder_.decode<uint64_t>(provenance::schema::make_bytes_view(r.data));
  }

 private:
  scale_encoder_t encoder_;
  provenance::storage::storage<library_t> storage_;
  engine_t engine_;
};

}  // namespace provenance::testing
