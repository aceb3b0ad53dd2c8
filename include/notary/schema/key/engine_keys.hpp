#pragma once

#include <array>
#include <notary/schema/key/address.hpp>
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Approval workflow: canonical key prefixes and key codecs for registry
// state, signer nonces, and transaction history.
namespace notary::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAdminRegistryKeyPrefix{
    "SYS|STATE|ADMIN_CONFIG|"};
inline constexpr std::string_view kApprovalRecordKeyPrefix{
    "SYS|STATE|FORM_APPROVAL|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kAppPrefix{"SYS|APP|"};

inline const std::array<std::string_view, 6> kEngineKeyspaces{
    kStatePrefix,   kAdminRegistryKeyPrefix, kApprovalRecordKeyPrefix,
    kNonceKeyPrefix, kHistoryPrefix,         kAppPrefix};

template <typename Encoder, typename T>
notary::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
notary::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
notary::schema::bytes_t make_admin_registry_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kAdminRegistryKeyPrefix,
                           make_admin_registry_address());
}

template <typename Encoder>
notary::schema::bytes_t make_approval_record_key(
    Encoder& encoder,
    const std::string_view& document_id) {
  return make_prefixed_key(encoder, kApprovalRecordKeyPrefix,
                           make_approval_record_address(document_id));
}

template <typename Encoder>
notary::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const notary::schema::account_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

/// SCALE integers are little endian, so history keys do not sort by height.
/// Range reads scan the whole prefix and filter on the decoded entry.
template <typename Encoder>
notary::schema::bytes_t make_history_key(Encoder& encoder,
                                         uint64_t height,
                                         uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix,
                           std::tuple{height, index});
}

}  // namespace notary::schema::key
