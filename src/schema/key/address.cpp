#include <notary/schema/key/address.hpp>
#include <notary/schema/key/builder.hpp>

namespace notary::schema::key {

notary::schema::hash32_t make_admin_registry_address() {
  return builder{}.write(kAdminConfigSeed).digest();
}

notary::schema::hash32_t make_approval_record_address(
    const std::string_view& document_id) {
  return builder{}.write(kFormApprovalSeed).write(document_id).digest();
}

notary::schema::hash32_t make_chain_id(const std::string_view& value) {
  if (auto hash = notary::schema::try_make_hash32(value)) {
    return *hash;
  }
  return builder{}.write(value).digest();
}

}  // namespace notary::schema::key
