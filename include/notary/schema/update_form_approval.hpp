#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: update form approval.
// Approval workflow: replaces the metadata of an existing record; restricted
// to the original signer.
namespace notary::schema {

template <uint16_t Version>
struct update_form_approval;

template <>
struct update_form_approval<1> final {
  uint16_t version{1};
  std::string document_id;
  std::string metadata;
};

using update_form_approval_t = update_form_approval<1>;

}  // namespace notary::schema
