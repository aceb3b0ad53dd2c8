#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>

// Schema type: remove admin.
// Approval workflow: authority-only membership change; never empties the set.
namespace notary::schema {

template <uint16_t Version>
struct remove_admin;

template <>
struct remove_admin<1> final {
  uint16_t version{1};
  account_id_t admin{};
};

using remove_admin_t = remove_admin<1>;

}  // namespace notary::schema
