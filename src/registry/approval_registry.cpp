#include <notary/crypto/digest.hpp>
#include <notary/registry/admin_registry.hpp>
#include <notary/registry/approval_registry.hpp>

using notary::schema::account_id_t;
using notary::schema::admin_registry_t;
using notary::schema::approval_record_t;
using notary::schema::transaction_error_code;

namespace notary::registry {

outcome_t<approval_record_t> sign_form_submission(
    const std::optional<admin_registry_t>& registry,
    const std::optional<approval_record_t>& existing,
    const account_id_t& caller,
    const notary::schema::sign_form_submission_t& submission,
    const notary::schema::timestamp_seconds_t block_time) {
  if (submission.document_id.empty()) {
    return transaction_error_code::form_id_empty;
  }
  if (submission.document_id.size() > notary::schema::kMaxFormIdLength) {
    return transaction_error_code::form_id_too_long;
  }
  if (notary::schema::is_zero_hash(submission.document_hash)) {
    return transaction_error_code::invalid_form_hash;
  }
  if (!registry) {
    return transaction_error_code::registry_not_initialized;
  }
  if (!is_admin(*registry, caller)) {
    return transaction_error_code::unauthorized_admin;
  }
  if (submission.metadata &&
      submission.metadata->size() > notary::schema::kMaxMetadataLength) {
    return transaction_error_code::metadata_too_long;
  }
  if (existing) {
    return transaction_error_code::form_already_approved;
  }

  auto record = approval_record_t{};
  record.document_id = submission.document_id;
  record.document_hash = submission.document_hash;
  record.signer = caller;
  record.approved_at = block_time;
  record.metadata = submission.metadata.value_or(std::string{});
  return record;
}

outcome_t<approval_record_t> update_form_approval(
    const std::optional<admin_registry_t>& registry,
    const std::optional<approval_record_t>& existing,
    const account_id_t& caller,
    const notary::schema::update_form_approval_t& update) {
  if (!existing) {
    return transaction_error_code::record_not_found;
  }
  if (caller != existing->signer) {
    return transaction_error_code::unauthorized_admin;
  }
  if (!registry) {
    return transaction_error_code::registry_not_initialized;
  }
  if (!is_admin(*registry, caller)) {
    return transaction_error_code::unauthorized_admin;
  }
  if (update.metadata.size() > notary::schema::kMaxMetadataLength) {
    return transaction_error_code::metadata_too_long;
  }

  auto record = *existing;
  record.metadata = update.metadata;
  return record;
}

outcome_t<bool> verify_form_approval(
    const std::optional<approval_record_t>& record,
    const notary::schema::hash32_t& expected_hash) {
  if (!record) {
    return transaction_error_code::record_not_found;
  }
  return notary::crypto::constant_time_equal(record->document_hash,
                                             expected_hash);
}

outcome_t<approval_record_t> get_form_approval_details(
    const std::optional<approval_record_t>& record) {
  if (!record) {
    return transaction_error_code::record_not_found;
  }
  return *record;
}

}  // namespace notary::registry
