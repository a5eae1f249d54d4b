#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: audit event record.
// Compliance workflow: immutable trail entry for one successful
// state-changing call. `message` is the human-decodable
// `name|hex(subject)|hex(caller)` line.
namespace provenance::schema {

template <uint16_t Version>
struct audit_event_record;

template <>
struct audit_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t call_index{};
  std::string name;
  bytes_t subject;
  account_id_t caller{};
  std::string message;
};

using audit_event_record_t = audit_event_record<1>;

}  // namespace provenance::schema
