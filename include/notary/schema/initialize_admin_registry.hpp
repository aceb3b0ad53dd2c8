#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>

// Schema type: initialize admin registry.
// Approval workflow: genesis of the admin set; the transaction signer becomes
// the authority and first admin.
namespace notary::schema {

template <uint16_t Version>
struct initialize_admin_registry;

template <>
struct initialize_admin_registry<1> final {
  uint16_t version{1};
};

using initialize_admin_registry_t = initialize_admin_registry<1>;

}  // namespace notary::schema
