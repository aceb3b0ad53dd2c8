#pragma once

#include <gtest/gtest.h>

#include <notary/crypto/sign.hpp>
#include <notary/execution/engine.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/encoding/signing_payload.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace notary::testing {

using scale_encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

/// An ed25519 identity whose public key is its ledger address.
struct test_signer final {
  notary::crypto::ed25519_private_key_t private_key{};
  notary::schema::account_id_t account{};
};

inline test_signer make_signer() {
  auto keypair = notary::crypto::generate_keypair();
  EXPECT_TRUE(keypair.has_value());
  if (!keypair) {
    return {};
  }
  return test_signer{.private_key = keypair->private_key,
                     .account = keypair->public_key};
}

inline notary::schema::transaction_t make_transaction(
    const notary::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const notary::schema::account_id_t& signer,
    const notary::schema::transaction_payload_t& payload) {
  return notary::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = notary::schema::signature_t{}};
}

inline void sign_transaction(notary::schema::transaction_t& tx,
                             const test_signer& signer) {
  auto encoder = scale_encoder_t{};
  auto message = notary::schema::encoding::make_signing_payload(encoder, tx);
  auto signature = notary::crypto::sign(notary::schema::bytes_view_t{message},
                                        signer.private_key);
  ASSERT_TRUE(signature.has_value());
  tx.signature = *signature;
}

inline notary::schema::bytes_t encode_transaction(
    const notary::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline notary::schema::hash32_t chain_id_from_engine(
    notary::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, notary::schema::hash32_t, notary::schema::hash32_t>>(
      notary::schema::bytes_view_t{query.value});
  return std::get<2>(decoded);
}

/// Find an attribute value on the first event of the given type.
inline std::optional<std::string> find_event_attribute(
    const notary::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
  }
  return std::nullopt;
}

template <typename T, typename Request>
std::optional<T> query_value(notary::execution::engine& engine,
                             const std::string_view path,
                             const Request& request) {
  auto encoder = scale_encoder_t{};
  const auto data = encoder.encode(request);
  const auto result =
      engine.query(path, notary::schema::bytes_view_t{data});
  if (result.code != 0) {
    return std::nullopt;
  }
  return encoder.decode<T>(notary::schema::bytes_view_t{result.value});
}

}  // namespace notary::testing
