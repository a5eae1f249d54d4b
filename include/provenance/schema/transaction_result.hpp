#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace provenance::schema {

template <uint16_t Version>
struct transaction_result;

/// `data` holds the SCALE-encoded uint64 return value on success.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace provenance::schema
