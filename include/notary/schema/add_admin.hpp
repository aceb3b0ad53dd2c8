#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>

// Schema type: add admin.
// Approval workflow: authority-only membership change.
namespace notary::schema {

template <uint16_t Version>
struct add_admin;

template <>
struct add_admin<1> final {
  uint16_t version{1};
  account_id_t new_admin{};
};

using add_admin_t = add_admin<1>;

}  // namespace notary::schema
