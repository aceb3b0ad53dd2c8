#include <gtest/gtest.h>
#include <notary/blake3/hash.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/key/address.hpp>
#include <notary/schema/key/builder.hpp>
#include <notary/schema/key/engine_keys.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <string_view>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

bool ends_with(const notary::schema::bytes_t& value,
               const notary::schema::hash32_t& suffix) {
  return value.size() >= suffix.size() &&
         std::equal(std::begin(suffix), std::end(suffix),
                    std::end(value) - static_cast<std::ptrdiff_t>(suffix.size()));
}

}  // namespace

TEST(schema_key, admin_registry_address_is_blake3_of_seed) {
  auto expected = notary::blake3::hash(std::string_view{"admin_config"});
  EXPECT_EQ(notary::schema::key::make_admin_registry_address(), expected);
}

TEST(schema_key, approval_address_is_blake3_of_seed_and_id) {
  auto expected = notary::blake3::hasher{}
                      .update(std::string_view{"form_approval"})
                      .update(std::string_view{"f1"})
                      .finalize();
  EXPECT_EQ(notary::schema::key::make_approval_record_address("f1"), expected);
  EXPECT_EQ(notary::schema::key::make_approval_record_address("f1"),
            notary::blake3::hash(std::string_view{"form_approvalf1"}));
}

TEST(schema_key, approval_addresses_are_distinct_per_document) {
  auto addresses = std::set<notary::schema::hash32_t>{};
  for (auto i = 0; i < 64; ++i) {
    addresses.insert(notary::schema::key::make_approval_record_address(
        "doc-" + std::to_string(i)));
  }
  addresses.insert(notary::schema::key::make_admin_registry_address());
  EXPECT_EQ(addresses.size(), 65u);
}

TEST(schema_key, builder_writes_little_endian_integers) {
  auto key = notary::schema::key::builder{};
  key.write(uint16_t{0x0102}).write(uint32_t{7});
  EXPECT_EQ(key.data,
            (notary::schema::bytes_t{0x02, 0x01, 0x07, 0x00, 0x00, 0x00}));
}

TEST(schema_key, builder_digest_covers_written_bytes) {
  auto key = notary::schema::key::builder{};
  key.write(std::string_view{"P|"}).write(std::string_view{"abc"});
  EXPECT_EQ(key.data.size(), 5u);
  EXPECT_EQ(key.digest(), notary::blake3::hash(std::string_view{"P|abc"}));
}

TEST(schema_key, record_keys_are_prefix_then_address) {
  auto encoder = encoder_t{};
  auto prefix = notary::schema::key::make_prefix_key(
      encoder, notary::schema::key::kApprovalRecordKeyPrefix);
  auto key = notary::schema::key::make_approval_record_key(encoder, "f1");
  ASSERT_EQ(key.size(), prefix.size() + 32u);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix), std::begin(key)));
  EXPECT_TRUE(ends_with(
      key, notary::schema::key::make_approval_record_address("f1")));

  auto registry_key = notary::schema::key::make_admin_registry_key(encoder);
  EXPECT_TRUE(ends_with(
      registry_key, notary::schema::key::make_admin_registry_address()));
  EXPECT_NE(registry_key, key);
}

TEST(schema_key, engine_keyspaces_list_every_prefix) {
  const auto& keyspaces = notary::schema::key::kEngineKeyspaces;
  auto contains = [&](std::string_view prefix) {
    return std::ranges::find(keyspaces, prefix) != std::end(keyspaces);
  };
  EXPECT_TRUE(contains("SYS|STATE|ADMIN_CONFIG|"));
  EXPECT_TRUE(contains("SYS|STATE|FORM_APPROVAL|"));
  EXPECT_TRUE(contains("SYS|STATE|NONCE|"));
  EXPECT_TRUE(contains("SYS|HISTORY|TX|"));
}

TEST(schema_key, chain_id_accepts_hex_or_name) {
  auto hex = std::string(64, 'a');
  EXPECT_EQ(notary::schema::key::make_chain_id(hex),
            notary::schema::make_hash32(std::string_view{hex}));
  EXPECT_EQ(notary::schema::key::make_chain_id("notary-local"),
            notary::blake3::hash(std::string_view{"notary-local"}));
}
