#pragma once

#include <notary/schema/primitives.hpp>
#include <string_view>

// Schema key type: record addresses.
// Approval workflow: every record lives at an address any third party can
// recompute, so a document id maps to exactly one approval slot.
namespace notary::schema::key {

inline constexpr std::string_view kAdminConfigSeed{"admin_config"};
inline constexpr std::string_view kFormApprovalSeed{"form_approval"};

/// BLAKE3("admin_config").
notary::schema::hash32_t make_admin_registry_address();

/// BLAKE3("form_approval" || document_id). Raw concatenation, no length
/// prefix; ids are bounded and the seed is fixed.
notary::schema::hash32_t make_approval_record_address(
    const std::string_view& document_id);

/// Chain ids are given either as 64 hex characters or as a human-readable
/// name, which is hashed with BLAKE3.
notary::schema::hash32_t make_chain_id(const std::string_view& value);

}  // namespace notary::schema::key
