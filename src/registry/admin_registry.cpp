#include <notary/registry/admin_registry.hpp>

#include <algorithm>
#include <iterator>

using notary::schema::account_id_t;
using notary::schema::admin_registry_t;
using notary::schema::transaction_error_code;

namespace notary::registry {

namespace {

// A corrupt count would index past the slot array; clamp reads to capacity.
std::size_t active_count(const admin_registry_t& registry) {
  return std::min<std::size_t>(registry.admin_count, registry.admins.size());
}

}  // namespace

outcome_t<admin_registry_t> initialize(
    const std::optional<admin_registry_t>& existing,
    const account_id_t& caller) {
  if (existing) {
    return transaction_error_code::already_initialized;
  }
  auto registry = admin_registry_t{};
  registry.authority = caller;
  registry.admins[0] = caller;
  registry.admin_count = 1;
  return registry;
}

outcome_t<admin_registry_t> add_admin(
    const std::optional<admin_registry_t>& registry,
    const account_id_t& caller,
    const account_id_t& new_admin) {
  if (!registry) {
    return transaction_error_code::registry_not_initialized;
  }
  if (caller != registry->authority) {
    return transaction_error_code::unauthorized_admin;
  }
  if (is_admin(*registry, new_admin)) {
    return transaction_error_code::admin_already_exists;
  }
  if (registry->admin_count >= notary::schema::kMaxAdmins) {
    return transaction_error_code::max_admins_reached;
  }

  auto updated = *registry;
  updated.admins[updated.admin_count] = new_admin;
  ++updated.admin_count;
  return updated;
}

outcome_t<admin_registry_t> remove_admin(
    const std::optional<admin_registry_t>& registry,
    const account_id_t& caller,
    const account_id_t& admin) {
  if (!registry) {
    return transaction_error_code::registry_not_initialized;
  }
  if (caller != registry->authority) {
    return transaction_error_code::unauthorized_admin;
  }
  // Checked before membership: a single-admin registry rejects every removal.
  if (registry->admin_count <= 1) {
    return transaction_error_code::cannot_remove_last_admin;
  }

  auto admins = active_admins(*registry);
  auto found = std::ranges::find(admins, admin);
  if (found == std::end(admins)) {
    return transaction_error_code::admin_not_found;
  }

  auto updated = *registry;
  auto index = static_cast<std::size_t>(std::distance(std::begin(admins), found));
  auto last = active_count(updated) - 1;
  updated.admins[index] = updated.admins[last];
  updated.admins[last] = account_id_t{};
  --updated.admin_count;
  return updated;
}

bool is_admin(const admin_registry_t& registry, const account_id_t& address) {
  auto admins = active_admins(registry);
  return std::ranges::find(admins, address) != std::end(admins);
}

std::span<const account_id_t> active_admins(const admin_registry_t& registry) {
  return std::span<const account_id_t>{registry.admins.data(),
                                       active_count(registry)};
}

}  // namespace notary::registry
