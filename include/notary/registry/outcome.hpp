#pragma once

#include <notary/schema/transaction_error_code.hpp>
#include <variant>

namespace notary::registry {

/// Result of a registry state transition or read: the new state (or read
/// value) on success, the single precondition that failed otherwise.
template <typename T>
using outcome_t = std::variant<T, notary::schema::transaction_error_code>;

template <typename T>
bool succeeded(const outcome_t<T>& outcome) {
  return std::holds_alternative<T>(outcome);
}

template <typename T>
notary::schema::transaction_error_code error_of(const outcome_t<T>& outcome) {
  return std::get<notary::schema::transaction_error_code>(outcome);
}

}  // namespace notary::registry
