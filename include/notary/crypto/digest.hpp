#pragma once

#include <notary/schema/primitives.hpp>

#include <string_view>

namespace notary::crypto {

/// SHA-256 of a document body; the digest clients submit as document_hash.
notary::schema::hash32_t sha256(const notary::schema::bytes_view_t& bytes);
notary::schema::hash32_t sha256(const std::string_view& str);

/// Compares every byte regardless of where the first difference sits.
bool constant_time_equal(const notary::schema::hash32_t& lhs,
                         const notary::schema::hash32_t& rhs);

}  // namespace notary::crypto
