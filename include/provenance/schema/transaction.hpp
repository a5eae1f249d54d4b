#pragma once
#include <provenance/schema/approve_batch.hpp>
#include <provenance/schema/assign_role.hpp>
#include <provenance/schema/certify_batch.hpp>
#include <provenance/schema/create_batch.hpp>
#include <provenance/schema/primitives.hpp>
#include <variant>

// Schema type: transaction.
// Compliance workflow: one state-changing call. `sender` is the account the
// surrounding ledger authenticated for this call; signing happens upstream.
namespace provenance::schema {

using transaction_payload_t = std::variant<assign_role_t,
                                           create_batch_t,
                                           approve_batch_t,
                                           certify_batch_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t sender{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace provenance::schema
