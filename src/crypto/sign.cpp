#include <notary/crypto/sign.hpp>

#include <openssl/evp.h>

#include <memory>

namespace notary::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr load_private_key(const ed25519_private_key_t& private_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

std::optional<notary::schema::account_id_t> raw_public_key(EVP_PKEY* pkey) {
  auto public_key = notary::schema::account_id_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &length) != 1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

}  // namespace

std::optional<ed25519_keypair> generate_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto keypair = ed25519_keypair{};
  auto private_length = keypair.private_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey.get(), keypair.private_key.data(),
                                   &private_length) != 1 ||
      private_length != keypair.private_key.size()) {
    return std::nullopt;
  }
  auto public_key = raw_public_key(pkey.get());
  if (!public_key) {
    return std::nullopt;
  }
  keypair.public_key = *public_key;
  return keypair;
}

std::optional<notary::schema::account_id_t> derive_public_key(
    const ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  return raw_public_key(pkey.get());
}

std::optional<notary::schema::signature_t> sign(
    const notary::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = notary::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace notary::crypto
