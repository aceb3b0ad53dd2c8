#pragma once
#include <notary/schema/add_admin.hpp>
#include <notary/schema/initialize_admin_registry.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/remove_admin.hpp>
#include <notary/schema/sign_form_submission.hpp>
#include <notary/schema/update_form_approval.hpp>
#include <variant>

namespace notary::schema {

using transaction_payload_t = std::variant<initialize_admin_registry_t,
                                           add_admin_t,
                                           remove_admin_t,
                                           sign_form_submission_t,
                                           update_form_approval_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace notary::schema
