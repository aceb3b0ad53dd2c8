#pragma once

#include <notary/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

// Schema type: admin registry.
// Approval workflow: singleton admin configuration. The authority manages the
// admin set; admins sign and update approval records.
namespace notary::schema {

inline constexpr std::size_t kMaxAdmins = 10;

template <uint16_t Version>
struct admin_registry;

template <>
struct admin_registry<1> final {
  uint16_t version{1};
  account_id_t authority{};
  // Fixed-size so the persisted record never changes size. Only the first
  // admin_count slots are active; the rest stay zero.
  std::array<account_id_t, kMaxAdmins> admins{};
  uint8_t admin_count{};
};

using admin_registry_t = admin_registry<1>;

}  // namespace notary::schema
