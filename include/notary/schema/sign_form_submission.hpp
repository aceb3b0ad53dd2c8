#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: sign form submission.
// Approval workflow: one-shot creation of the approval record for a document.
namespace notary::schema {

template <uint16_t Version>
struct sign_form_submission;

template <>
struct sign_form_submission<1> final {
  uint16_t version{1};
  std::string document_id;
  hash32_t document_hash{};
  std::optional<std::string> metadata;
};

using sign_form_submission_t = sign_form_submission<1>;

}  // namespace notary::schema
