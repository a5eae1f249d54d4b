#pragma once

#include <provenance/schema/transaction_error_code.hpp>

#include <string>
#include <utility>
#include <variant>

namespace provenance::execution {

/// Reason a call was rejected. Every failure aborts the whole call.
struct failure final {
  provenance::schema::transaction_error_code code{};
  std::string message;
};

template <typename T>
using result_t = std::variant<T, failure>;

inline failure make_failure(const provenance::schema::transaction_error_code code,
                            std::string message) {
  return failure{.code = code, .message = std::move(message)};
}

template <typename T>
bool succeeded(const result_t<T>& result) {
  return std::holds_alternative<T>(result);
}

}  // namespace provenance::execution
