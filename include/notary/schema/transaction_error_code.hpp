#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace notary::schema {

/// Stable result codes. 1-9 are envelope failures raised before the payload
/// runs; 10+ are registry rejections, each tied to exactly one precondition.
enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 6,
  already_initialized = 10,
  unauthorized_admin = 11,
  admin_already_exists = 12,
  admin_not_found = 13,
  max_admins_reached = 14,
  cannot_remove_last_admin = 15,
  form_id_too_long = 16,
  metadata_too_long = 17,
  invalid_form_hash = 18,
  form_already_approved = 19,
  record_not_found = 20,
  registry_not_initialized = 21,
  form_id_empty = 22,
};

inline constexpr auto kTransactionErrorCodeNames = std::array<
    std::pair<std::string_view, transaction_error_code>,
    18>{{
    {"invalid_transaction", transaction_error_code::invalid_transaction},
    {"unsupported_transaction_version",
     transaction_error_code::unsupported_transaction_version},
    {"invalid_chain_id", transaction_error_code::invalid_chain_id},
    {"invalid_nonce", transaction_error_code::invalid_nonce},
    {"signature_verification_failed",
     transaction_error_code::signature_verification_failed},
    {"already_initialized", transaction_error_code::already_initialized},
    {"unauthorized_admin", transaction_error_code::unauthorized_admin},
    {"admin_already_exists", transaction_error_code::admin_already_exists},
    {"admin_not_found", transaction_error_code::admin_not_found},
    {"max_admins_reached", transaction_error_code::max_admins_reached},
    {"cannot_remove_last_admin",
     transaction_error_code::cannot_remove_last_admin},
    {"form_id_too_long", transaction_error_code::form_id_too_long},
    {"metadata_too_long", transaction_error_code::metadata_too_long},
    {"invalid_form_hash", transaction_error_code::invalid_form_hash},
    {"form_already_approved", transaction_error_code::form_already_approved},
    {"record_not_found", transaction_error_code::record_not_found},
    {"registry_not_initialized",
     transaction_error_code::registry_not_initialized},
    {"form_id_empty", transaction_error_code::form_id_empty},
}};

template <>
inline std::optional<transaction_error_code>
try_from_string<transaction_error_code>(const std::string_view value) {
  return from_string(value, kTransactionErrorCodeNames);
}

constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeNames).value_or("unknown");
}

constexpr uint32_t to_code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace notary::schema
