#pragma once
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>
#include <tuple>

namespace notary::schema::encoding {

/// Bytes covered by the transaction signature: every envelope field except
/// the signature itself.
template <typename Encoder>
notary::schema::bytes_t make_signing_payload(
    Encoder& encoder,
    const notary::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace notary::schema::encoding
