#include <gtest/gtest.h>
#include <notary/crypto/digest.hpp>
#include <notary/crypto/sign.hpp>
#include <notary/crypto/verify.hpp>

#include <string_view>

namespace {

std::string sha256_hex(const std::string_view input) {
  auto digest = notary::crypto::sha256(input);
  return notary::schema::to_hex(notary::schema::bytes_view_t{digest});
}

}  // namespace

TEST(crypto, sha256_matches_known_vectors) {
  EXPECT_EQ(sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex("hello"),
            "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
  EXPECT_EQ(sha256_hex("world"),
            "486ea46224d1bb4fb680f34f7c9ad96a8f24ec88be73ea8e5a6c65260e9cb8a7");
}

TEST(crypto, sha256_of_bytes_matches_string_overload) {
  auto text = std::string{"hello"};
  EXPECT_EQ(notary::crypto::sha256(notary::schema::make_bytes_view(text)),
            notary::crypto::sha256(std::string_view{text}));
}

TEST(crypto, constant_time_equal_compares_every_byte) {
  auto lhs = notary::crypto::sha256(std::string_view{"hello"});
  auto rhs = lhs;
  EXPECT_TRUE(notary::crypto::constant_time_equal(lhs, rhs));
  rhs[31] ^= 0x01;
  EXPECT_FALSE(notary::crypto::constant_time_equal(lhs, rhs));
  rhs = lhs;
  rhs[0] ^= 0x80;
  EXPECT_FALSE(notary::crypto::constant_time_equal(lhs, rhs));
}

TEST(crypto, ed25519_sign_and_verify) {
  ASSERT_TRUE(notary::crypto::available());
  auto keypair = notary::crypto::generate_keypair();
  ASSERT_TRUE(keypair.has_value());

  auto derived = notary::crypto::derive_public_key(keypair->private_key);
  ASSERT_TRUE(derived.has_value());
  EXPECT_EQ(*derived, keypair->public_key);

  auto message = notary::schema::make_bytes(std::string_view{"approve f1"});
  auto signature = notary::crypto::sign(notary::schema::bytes_view_t{message},
                                        keypair->private_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{message}, keypair->public_key, *signature));
}

TEST(crypto, ed25519_rejects_tampering_and_wrong_key) {
  auto keypair = notary::crypto::generate_keypair();
  auto other = notary::crypto::generate_keypair();
  ASSERT_TRUE(keypair.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = notary::schema::make_bytes(std::string_view{"approve f1"});
  auto signature = notary::crypto::sign(notary::schema::bytes_view_t{message},
                                        keypair->private_key);
  ASSERT_TRUE(signature.has_value());

  auto tampered = message;
  tampered.back() ^= 0x01;
  EXPECT_FALSE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{tampered}, keypair->public_key,
      *signature));
  EXPECT_FALSE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{message}, other->public_key, *signature));

  auto broken = *signature;
  broken[0] ^= 0x01;
  EXPECT_FALSE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{message}, keypair->public_key, broken));
  EXPECT_FALSE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{message}, keypair->public_key,
      notary::schema::signature_t{}));
}
