#pragma once

#include <notary/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

// Schema type: approval record.
// Approval workflow: immutable proof that an admin approved a document digest
// at a given block time. Only metadata may change after creation.
namespace notary::schema {

inline constexpr std::size_t kMaxFormIdLength = 64;
inline constexpr std::size_t kMaxMetadataLength = 256;

template <uint16_t Version>
struct approval_record;

template <>
struct approval_record<1> final {
  uint16_t version{1};
  std::string document_id;
  hash32_t document_hash{};
  account_id_t signer{};
  timestamp_seconds_t approved_at{};
  std::string metadata;
};

using approval_record_t = approval_record<1>;

}  // namespace notary::schema
