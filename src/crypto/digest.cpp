#include <notary/common/critical.hpp>
#include <notary/crypto/digest.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace notary::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

notary::schema::hash32_t sha256_internal(const void* data,
                                         const std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    notary::common::critical("failed to allocate SHA-256 context");
  }
  auto digest = notary::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    notary::common::critical("SHA-256 digest failed");
  }
  return digest;
}

}  // namespace

notary::schema::hash32_t sha256(const notary::schema::bytes_view_t& bytes) {
  return sha256_internal(bytes.data(), bytes.size());
}

notary::schema::hash32_t sha256(const std::string_view& str) {
  return sha256_internal(str.data(), str.size());
}

bool constant_time_equal(const notary::schema::hash32_t& lhs,
                         const notary::schema::hash32_t& rhs) {
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace notary::crypto
