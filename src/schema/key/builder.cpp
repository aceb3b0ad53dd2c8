#include <algorithm>
#include <iterator>
#include <notary/blake3/hash.hpp>
#include <notary/schema/key/builder.hpp>
#include <ranges>

using namespace notary::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

notary::schema::hash32_t builder::digest() const {
  return notary::blake3::hash(notary::schema::bytes_view_t{data});
}
