#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Audit history row: ordered transaction bytes plus execution code, so any
// party holding the store can audit every approval ever submitted.
namespace notary::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  uint32_t code{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace notary::schema
