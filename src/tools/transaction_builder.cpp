#include <boost/program_options.hpp>
#include <notary/common/critical.hpp>
#include <notary/crypto/digest.hpp>
#include <notary/crypto/sign.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/encoding/signing_payload.hpp>
#include <notary/schema/key/address.hpp>
#include <notary/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string hex(const notary::schema::bytes_view_t& bytes) {
  return notary::schema::to_hex(bytes);
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    notary::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

notary::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto hash = notary::schema::try_make_hash32(require_string(vm, name));
  if (!hash) {
    notary::common::critical("--{} must be 64 hex characters", name);
  }
  return *hash;
}

std::optional<notary::crypto::ed25519_private_key_t> get_private_key(
    const po::variables_map& vm) {
  if (!vm.contains("private-key-hex")) {
    return std::nullopt;
  }
  auto bytes = notary::schema::try_from_hex(
      vm["private-key-hex"].as<std::string>());
  auto key = notary::crypto::ed25519_private_key_t{};
  if (!bytes || bytes->size() != key.size()) {
    notary::common::critical("--private-key-hex must be 32 bytes of hex");
  }
  std::ranges::copy(*bytes, std::begin(key));
  return key;
}

/// The signer is the explicit --signer, or else the key behind
/// --private-key-hex.
notary::schema::account_id_t get_signer(
    const po::variables_map& vm,
    const std::optional<notary::crypto::ed25519_private_key_t>& private_key) {
  if (vm.contains("signer")) {
    return get_hash32(vm, "signer");
  }
  if (private_key) {
    auto public_key = notary::crypto::derive_public_key(*private_key);
    if (!public_key) {
      notary::common::critical("failed to derive ed25519 public key");
    }
    return *public_key;
  }
  notary::common::critical("transaction requires --signer or --private-key-hex");
}

notary::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = require_string(vm, "payload");
  if (payload == "initialize_admin_registry") {
    return notary::schema::initialize_admin_registry_t{};
  }
  if (payload == "add_admin") {
    return notary::schema::add_admin_t{.new_admin = get_hash32(vm, "admin")};
  }
  if (payload == "remove_admin") {
    return notary::schema::remove_admin_t{.admin = get_hash32(vm, "admin")};
  }
  if (payload == "sign_form_submission") {
    return notary::schema::sign_form_submission_t{
        .document_id = require_string(vm, "document-id"),
        .document_hash = get_hash32(vm, "document-hash"),
        .metadata = vm.contains("metadata")
                        ? std::optional<std::string>{vm["metadata"]
                                                         .as<std::string>()}
                        : std::nullopt};
  }
  if (payload == "update_form_approval") {
    return notary::schema::update_form_approval_t{
        .document_id = require_string(vm, "document-id"),
        .metadata = require_string(vm, "metadata")};
  }
  notary::common::critical("unsupported payload type '{}'", payload);
}

notary::schema::transaction_t build_transaction(const po::variables_map& vm) {
  auto private_key = get_private_key(vm);
  auto transaction = notary::schema::transaction_t{
      .version = 1,
      .chain_id = notary::schema::key::make_chain_id(
          vm["chain-id"].as<std::string>()),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = get_signer(vm, private_key),
      .payload = build_payload(vm),
      .signature = {}};

  if (private_key) {
    auto encoder = encoder_t{};
    auto message =
        notary::schema::encoding::make_signing_payload(encoder, transaction);
    auto signature = notary::crypto::sign(
        notary::schema::bytes_view_t{message}, *private_key);
    if (!signature) {
      notary::common::critical("failed to sign transaction");
    }
    transaction.signature = *signature;
  } else if (vm.contains("signature-hex")) {
    auto bytes =
        notary::schema::try_from_hex(vm["signature-hex"].as<std::string>());
    if (!bytes || bytes->size() != transaction.signature.size()) {
      notary::common::critical("ed25519 signature must be 64 bytes of hex");
    }
    std::ranges::copy(*bytes, std::begin(transaction.signature));
  }
  return transaction;
}

notary::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require_string(vm, "path");
  if (path == "/engine/info" || path == "/engine/keyspaces" ||
      path == "/admin/registry") {
    return {};
  }
  if (path == "/admin/is_admin") {
    return encoder.encode(get_hash32(vm, "admin"));
  }
  if (path == "/nonce") {
    return encoder.encode(get_hash32(vm, "signer"));
  }
  if (path == "/approval/address" || path == "/approval/details") {
    return encoder.encode(require_string(vm, "document-id"));
  }
  if (path == "/approval/verify") {
    return encoder.encode(std::tuple{require_string(vm, "document-id"),
                                     get_hash32(vm, "document-hash")});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  notary::common::critical("unsupported query path '{}'", path);
}

notary::schema::hash32_t document_hash(const po::variables_map& vm) {
  if (vm.contains("text")) {
    return notary::crypto::sha256(vm["text"].as<std::string>());
  }
  auto path = require_string(vm, "file");
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    notary::common::critical("failed to open '{}'", path);
  }
  auto bytes = notary::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                       std::istreambuf_iterator<char>{}};
  return notary::crypto::sha256(notary::schema::bytes_view_t{bytes});
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  notary_transaction_builder transaction [options]\n"
            << "  notary_transaction_builder signing-payload [options]\n"
            << "  notary_transaction_builder query-key [options]\n"
            << "  notary_transaction_builder document-hash --text|--file\n"
            << "  notary_transaction_builder derive-address [--document-id]\n"
            << "  notary_transaction_builder chain-id [--chain-id]\n"
            << "  notary_transaction_builder keygen\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"notary_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|query-key|document-hash|derive-address|"
      "chain-id|keygen")("payload", po::value<std::string>(),
                         "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>()->default_value("notary-local"),
      "chain id hex or name")("nonce", po::value<uint64_t>()->default_value(1),
                              "transaction nonce")(
      "signer", po::value<std::string>(), "signer ed25519 public key hex")(
      "private-key-hex", po::value<std::string>(),
      "ed25519 private key hex; signs the transaction")(
      "signature-hex", po::value<std::string>(), "precomputed signature hex")(
      "admin", po::value<std::string>(), "admin address hex")(
      "document-id", po::value<std::string>(), "document identifier")(
      "document-hash", po::value<std::string>(), "document SHA-256 hex")(
      "metadata", po::value<std::string>(), "approval metadata")(
      "text", po::value<std::string>(), "document contents to hash")(
      "file", po::value<std::string>(), "document file to hash")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  if (command == "transaction" || command == "tx") {
    auto encoded = encoder.encode(build_transaction(vm));
    std::cout << hex(encoded) << '\n';
    return 0;
  }

  if (command == "signing-payload") {
    auto message = notary::schema::encoding::make_signing_payload(
        encoder, build_transaction(vm));
    std::cout << hex(message) << '\n';
    return 0;
  }

  if (command == "query-key") {
    std::cout << hex(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "document-hash") {
    std::cout << hex(document_hash(vm)) << '\n';
    return 0;
  }

  if (command == "derive-address") {
    auto address =
        vm.contains("document-id")
            ? notary::schema::key::make_approval_record_address(
                  vm["document-id"].as<std::string>())
            : notary::schema::key::make_admin_registry_address();
    std::cout << hex(address) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id =
        notary::schema::key::make_chain_id(vm["chain-id"].as<std::string>());
    std::cout << hex(chain_id) << '\n';
    return 0;
  }

  if (command == "keygen") {
    auto keypair = notary::crypto::generate_keypair();
    if (!keypair) {
      notary::common::critical("ed25519 key generation failed");
    }
    std::cout << "private_key " << hex(keypair->private_key) << '\n'
              << "public_key " << hex(keypair->public_key) << '\n';
    return 0;
  }

  notary::common::critical(
      "command must be transaction|signing-payload|query-key|document-hash|"
      "derive-address|chain-id|keygen");
}
