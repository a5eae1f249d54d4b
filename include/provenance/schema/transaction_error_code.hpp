#pragma once

#include <cstdint>

namespace provenance::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  unauthorized = 10,
  invalid_argument = 11,
  already_exists = 12,
  not_found = 13,
  invalid_transition = 14,
  minting_failure = 15,
};

}  // namespace provenance::schema
