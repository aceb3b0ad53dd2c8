#pragma once

#include <notary/schema/primitives.hpp>

namespace notary::crypto {

/// True when the linked OpenSSL exposes an ed25519 provider.
bool available();

bool verify_signature(const notary::schema::bytes_view_t& message,
                      const notary::schema::account_id_t& signer,
                      const notary::schema::signature_t& signature);

}  // namespace notary::crypto
