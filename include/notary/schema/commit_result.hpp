#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Commit output: finalized height and state root after the block's writes are
// durable.
namespace notary::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
};

using commit_result_t = commit_result<1>;

}  // namespace notary::schema
