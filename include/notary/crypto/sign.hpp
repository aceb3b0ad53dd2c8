#pragma once

#include <notary/schema/primitives.hpp>

#include <array>
#include <optional>

namespace notary::crypto {

using ed25519_private_key_t = std::array<uint8_t, 32>;

/// Raw ed25519 key pair; the public half is the ledger account id.
struct ed25519_keypair final {
  ed25519_private_key_t private_key{};
  notary::schema::account_id_t public_key{};
};

std::optional<ed25519_keypair> generate_keypair();

std::optional<notary::schema::account_id_t> derive_public_key(
    const ed25519_private_key_t& private_key);

std::optional<notary::schema::signature_t> sign(
    const notary::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key);

}  // namespace notary::crypto
