#pragma once

#include <notary/registry/outcome.hpp>
#include <notary/schema/admin_registry.hpp>
#include <notary/schema/primitives.hpp>
#include <optional>
#include <span>

// Admin set management. Every function is a pure transition over the loaded
// registry record; the caller persists the returned state.
namespace notary::registry {

/// Creates the singleton with the caller as authority and sole admin.
outcome_t<notary::schema::admin_registry_t> initialize(
    const std::optional<notary::schema::admin_registry_t>& existing,
    const notary::schema::account_id_t& caller);

outcome_t<notary::schema::admin_registry_t> add_admin(
    const std::optional<notary::schema::admin_registry_t>& registry,
    const notary::schema::account_id_t& caller,
    const notary::schema::account_id_t& new_admin);

/// The last active admin moves into the vacated slot; order is not stable.
outcome_t<notary::schema::admin_registry_t> remove_admin(
    const std::optional<notary::schema::admin_registry_t>& registry,
    const notary::schema::account_id_t& caller,
    const notary::schema::account_id_t& admin);

bool is_admin(const notary::schema::admin_registry_t& registry,
              const notary::schema::account_id_t& address);

std::span<const notary::schema::account_id_t> active_admins(
    const notary::schema::admin_registry_t& registry);

}  // namespace notary::registry
