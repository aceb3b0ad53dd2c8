#pragma once

#include <notary/registry/outcome.hpp>
#include <notary/schema/admin_registry.hpp>
#include <notary/schema/approval_record.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/sign_form_submission.hpp>
#include <notary/schema/update_form_approval.hpp>
#include <optional>

// Document approval records. Mutations authorize against the admin registry;
// reads need only the addressed record.
namespace notary::registry {

/// Checks run in a fixed order and the first failure wins:
/// id length, digest, admin membership, metadata length, address occupancy.
outcome_t<notary::schema::approval_record_t> sign_form_submission(
    const std::optional<notary::schema::admin_registry_t>& registry,
    const std::optional<notary::schema::approval_record_t>& existing,
    const notary::schema::account_id_t& caller,
    const notary::schema::sign_form_submission_t& submission,
    notary::schema::timestamp_seconds_t block_time);

/// Only the original signer, while still an admin, may replace metadata.
outcome_t<notary::schema::approval_record_t> update_form_approval(
    const std::optional<notary::schema::admin_registry_t>& registry,
    const std::optional<notary::schema::approval_record_t>& existing,
    const notary::schema::account_id_t& caller,
    const notary::schema::update_form_approval_t& update);

outcome_t<bool> verify_form_approval(
    const std::optional<notary::schema::approval_record_t>& record,
    const notary::schema::hash32_t& expected_hash);

outcome_t<notary::schema::approval_record_t> get_form_approval_details(
    const std::optional<notary::schema::approval_record_t>& record);

}  // namespace notary::registry
