#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: query error code.
// Query failure taxonomy: stable numeric codes for read-path diagnostics and
// client behavior.
namespace notary::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  record_not_found = 4,
};

inline constexpr auto kQueryErrorCodeNames =
    std::array<std::pair<std::string_view, query_error_code>, 4>{{
        {"invalid_key", query_error_code::invalid_key},
        {"not_found", query_error_code::not_found},
        {"unsupported_path", query_error_code::unsupported_path},
        {"record_not_found", query_error_code::record_not_found},
    }};

template <>
inline std::optional<query_error_code> try_from_string<query_error_code>(
    const std::string_view value) {
  return from_string(value, kQueryErrorCodeNames);
}

constexpr std::string_view to_string(const query_error_code value) {
  return to_string(value, kQueryErrorCodeNames).value_or("unknown");
}

}  // namespace notary::schema
