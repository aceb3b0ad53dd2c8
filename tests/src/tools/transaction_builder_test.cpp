#include <gtest/gtest.h>
#include <notary/crypto/digest.hpp>
#include <notary/crypto/verify.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/encoding/signing_payload.hpp>
#include <notary/schema/key/address.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef NOTARY_TRANSACTION_BUILDER_PATH
#define NOTARY_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

constexpr auto kChainId =
    "1111111111111111111111111111111111111111111111111111111111111111";
constexpr auto kAdmin =
    "2222222222222222222222222222222222222222222222222222222222222222";
constexpr auto kHelloHash =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args = {}) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args};
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{NOTARY_TRANSACTION_BUILDER_PATH};
}

}  // namespace

TEST(transaction_builder, document_hash_is_sha256_of_text) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  EXPECT_EQ(run_command(builder, "document-hash", "--text hello"), kHelloHash);
}

TEST(transaction_builder, derive_address_matches_library) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto record = notary::schema::key::make_approval_record_address("f1");
  EXPECT_EQ(run_command(builder, "derive-address", "--document-id f1"),
            notary::schema::to_hex(notary::schema::bytes_view_t{record}));

  auto registry = notary::schema::key::make_admin_registry_address();
  EXPECT_EQ(run_command(builder, "derive-address"),
            notary::schema::to_hex(notary::schema::bytes_view_t{registry}));

  auto chain = notary::schema::key::make_chain_id("notary-local");
  EXPECT_EQ(run_command(builder, "chain-id", "--chain-id notary-local"),
            notary::schema::to_hex(notary::schema::bytes_view_t{chain}));
}

TEST(transaction_builder, query_key_matches_route_contract) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};

  auto verify_key = encoder.encode(
      std::tuple{std::string{"f1"},
                 notary::schema::make_hash32(std::string_view{kHelloHash})});
  EXPECT_EQ(run_command(builder, "query-key",
                        "--path /approval/verify --document-id f1 "
                        "--document-hash " +
                            std::string{kHelloHash}),
            notary::schema::to_hex(verify_key));

  auto history_key = encoder.encode(std::tuple{uint64_t{1}, uint64_t{100}});
  EXPECT_EQ(run_command(builder, "query-key",
                        "--path /history/range --from-height 1 "
                        "--to-height 100"),
            notary::schema::to_hex(history_key));

  EXPECT_TRUE(
      run_command(builder, "query-key", "--path /admin/registry").empty());
}

TEST(transaction_builder, unsigned_transaction_decodes_with_payload) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto tx_hex = run_command(
      builder, "transaction",
      "--payload add_admin --chain-id " + std::string{kChainId} +
          " --nonce 4 --signer " + std::string{kAdmin} + " --admin " +
          std::string{kChainId});
  auto tx_bytes = notary::schema::from_hex(tx_hex);
  auto encoder = encoder_t{};
  auto tx = encoder.decode<notary::schema::transaction_t>(
      notary::schema::bytes_view_t{tx_bytes});

  EXPECT_EQ(tx.nonce, 4u);
  EXPECT_EQ(tx.signer, notary::schema::make_hash32(std::string_view{kAdmin}));
  ASSERT_TRUE(std::holds_alternative<notary::schema::add_admin_t>(tx.payload));
  EXPECT_EQ(std::get<notary::schema::add_admin_t>(tx.payload).new_admin,
            notary::schema::make_hash32(std::string_view{kChainId}));
  EXPECT_EQ(tx.signature, notary::schema::signature_t{});
}

TEST(transaction_builder, signed_transaction_verifies) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto keygen = run_command(builder, "keygen");
  auto private_at = keygen.find("private_key ");
  ASSERT_NE(private_at, std::string::npos);
  auto private_key = keygen.substr(private_at + 12, 64);

  auto tx_hex = run_command(
      builder, "transaction",
      "--payload sign_form_submission --chain-id notary-local --nonce 2 "
      "--private-key-hex " +
          private_key + " --document-id f1 --document-hash " +
          std::string{kHelloHash} + " --metadata v1");
  auto tx_bytes = notary::schema::from_hex(tx_hex);
  auto encoder = encoder_t{};
  auto tx = encoder.decode<notary::schema::transaction_t>(
      notary::schema::bytes_view_t{tx_bytes});

  EXPECT_EQ(tx.chain_id, notary::schema::key::make_chain_id("notary-local"));
  ASSERT_TRUE(std::holds_alternative<notary::schema::sign_form_submission_t>(
      tx.payload));
  const auto& submission =
      std::get<notary::schema::sign_form_submission_t>(tx.payload);
  EXPECT_EQ(submission.document_id, "f1");
  EXPECT_EQ(submission.metadata, std::optional<std::string>{"v1"});

  auto message = notary::schema::encoding::make_signing_payload(encoder, tx);
  EXPECT_TRUE(notary::crypto::verify_signature(
      notary::schema::bytes_view_t{message}, tx.signer, tx.signature));
  EXPECT_EQ(run_command(builder, "signing-payload",
                        "--payload sign_form_submission --chain-id "
                        "notary-local --nonce 2 --private-key-hex " +
                            private_key + " --document-id f1 "
                            "--document-hash " +
                            std::string{kHelloHash} + " --metadata v1"),
            notary::schema::to_hex(message));
}

TEST(transaction_builder, update_form_approval_requires_metadata) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto args = "--payload update_form_approval --chain-id " +
              std::string{kChainId} + " --nonce 3 --signer " +
              std::string{kAdmin} + " --document-id f1";

  auto [exit_code, output] = run_capture(shell_quote(builder) +
                                         " transaction " + args +
                                         " 2>/dev/null");
  EXPECT_NE(exit_code, 0) << output;

  auto tx_hex = run_command(builder, "transaction", args + " --metadata v2");
  auto tx_bytes = notary::schema::from_hex(tx_hex);
  auto encoder = encoder_t{};
  auto tx = encoder.decode<notary::schema::transaction_t>(
      notary::schema::bytes_view_t{tx_bytes});
  ASSERT_TRUE(std::holds_alternative<notary::schema::update_form_approval_t>(
      tx.payload));
  const auto& update =
      std::get<notary::schema::update_form_approval_t>(tx.payload);
  EXPECT_EQ(update.document_id, "f1");
  EXPECT_EQ(update.metadata, "v2");
}
