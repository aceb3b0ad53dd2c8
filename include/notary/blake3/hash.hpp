#pragma once
#include <notary/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace notary::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const notary::schema::bytes_view_t& bytes);

  notary::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

notary::schema::hash32_t hash(const std::string_view& str);
notary::schema::hash32_t hash(const notary::schema::bytes_view_t& bytes);

}  // namespace notary::blake3
