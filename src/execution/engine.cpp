#include <spdlog/spdlog.h>
#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <notary/crypto/verify.hpp>
#include <notary/execution/engine.hpp>
#include <notary/registry/admin_registry.hpp>
#include <notary/registry/approval_registry.hpp>
#include <notary/schema/encoding/signing_payload.hpp>
#include <notary/schema/key/builder.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/query_error_code.hpp>
#include <tuple>
#include <utility>

using namespace notary::schema;

namespace {

inline constexpr auto kCheckTxCodespace = std::string_view{"notary.checktx"};
inline constexpr auto kExecuteCodespace = std::string_view{"notary.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"notary.query"};
inline constexpr auto kChainIdKey = std::string_view{"SYS|APP|CHAIN_ID"};

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
using event_attributes_t =
    std::initializer_list<std::pair<std::string_view, std::string>>;

notary::schema::hash32_t fold_state_root(const notary::schema::hash32_t& seed,
                                         const notary::schema::bytes_t& tx,
                                         uint64_t height,
                                         uint32_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  return notary::schema::key::builder{}
      .write(bytes_view_t{seed})
      .write(bytes_view_t{tx})
      .write(bytes_view_t{encoded_suffix})
      .digest();
}

std::string hex(const notary::schema::hash32_t& value) {
  return to_hex(bytes_view_t{value});
}

transaction_event_t make_event(std::string_view type,
                               event_attributes_t attributes) {
  auto event = transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  return event;
}

transaction_result_t make_error_result(transaction_error_code code,
                                       std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

/// Every result, accepted or rejected, carries its code for indexers.
void append_result_event(transaction_result_t& result) {
  result.events.push_back(
      make_event("notary.tx_result", {{"code", std::to_string(result.code)},
                                      {"codespace", result.codespace}}));
}

query_result_t make_query_error(query_error_code code,
                                std::string info,
                                int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

uint16_t payload_version(const transaction_payload_t& payload) {
  return std::visit([](const auto& operation) { return operation.version; },
                    payload);
}

}  // namespace

namespace notary::execution {

engine::engine(encoder_t& encoder,
               notary::storage::storage<notary::storage::rocksdb_storage_tag>&
                   storage,
               const notary::schema::hash32_t& chain_id,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{notary::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !notary::crypto::available()) {
    notary::common::critical(
        "strict crypto requested but OpenSSL provides no ed25519 support");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; transaction signatures are not "
                 "verified");
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} for chain {}",
               last_committed_height_, hex(chain_id_));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (raw_tx.empty() || !maybe_tx) {
    auto result = make_error_result(transaction_error_code::invalid_transaction,
                                    kCheckTxCodespace,
                                    "failed to decode transaction");
    append_result_event(result);
    return result;
  }
  auto view = state_view{storage_, pending_writes_};
  auto result = validate_transaction(*maybe_tx, kCheckTxCodespace, view);
  append_result_event(result);
  return result;
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  std::string_view codespace,
                                                  const state_view& view) {
  if (tx.version != 1 || payload_version(tx.payload) != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace, "expected chain " + hex(chain_id_));
  }
  auto expected_nonce = next_nonce(tx.signer, view);
  if (tx.nonce != expected_nonce) {
    return make_error_result(transaction_error_code::invalid_nonce, codespace,
                             "expected nonce " +
                                 std::to_string(expected_nonce));
  }
  if (require_strict_crypto_) {
    auto message =
        notary::schema::encoding::make_signing_payload(encoder_, tx);
    if (!signature_verifier_(bytes_view_t{message}, tx.signer,
                             tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed, codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               timestamp_seconds_t block_time,
                                               state_view& view) {
  auto result = transaction_result_t{};
  auto registry_key = notary::schema::key::make_admin_registry_key(encoder_);
  auto registry = view.get<admin_registry_t>(encoder_, registry_key);

  auto fail = [&](transaction_error_code code) {
    result = make_error_result(code, kExecuteCodespace);
  };

  std::visit(
      overloaded{
          [&](const initialize_admin_registry_t&) {
            auto outcome = notary::registry::initialize(registry, tx.signer);
            if (!notary::registry::succeeded(outcome)) {
              return fail(notary::registry::error_of(outcome));
            }
            view.put(encoder_, registry_key, std::get<admin_registry_t>(outcome));
            result.events.push_back(
                make_event("notary.admin_registry_initialized",
                           {{"authority", hex(tx.signer)}}));
          },
          [&](const add_admin_t& operation) {
            auto outcome = notary::registry::add_admin(registry, tx.signer,
                                                       operation.new_admin);
            if (!notary::registry::succeeded(outcome)) {
              return fail(notary::registry::error_of(outcome));
            }
            view.put(encoder_, registry_key, std::get<admin_registry_t>(outcome));
            result.events.push_back(
                make_event("notary.admin_added",
                           {{"admin", hex(operation.new_admin)},
                            {"authority", hex(tx.signer)}}));
          },
          [&](const remove_admin_t& operation) {
            auto outcome = notary::registry::remove_admin(registry, tx.signer,
                                                          operation.admin);
            if (!notary::registry::succeeded(outcome)) {
              return fail(notary::registry::error_of(outcome));
            }
            view.put(encoder_, registry_key, std::get<admin_registry_t>(outcome));
            result.events.push_back(
                make_event("notary.admin_removed",
                           {{"admin", hex(operation.admin)},
                            {"authority", hex(tx.signer)}}));
          },
          [&](const sign_form_submission_t& operation) {
            auto record_key = notary::schema::key::make_approval_record_key(
                encoder_, operation.document_id);
            auto existing = view.get<approval_record_t>(encoder_, record_key);
            auto outcome = notary::registry::sign_form_submission(
                registry, existing, tx.signer, operation, block_time);
            if (!notary::registry::succeeded(outcome)) {
              return fail(notary::registry::error_of(outcome));
            }
            const auto& record = std::get<approval_record_t>(outcome);
            view.put(encoder_, record_key, record);
            auto address = notary::schema::key::make_approval_record_address(
                operation.document_id);
            result.data = make_bytes(bytes_view_t{address});
            result.events.push_back(make_event(
                "notary.form_approved",
                {{"form_id", record.document_id},
                 {"form_hash", hex(record.document_hash)},
                 {"signer", hex(record.signer)},
                 {"approved_at", std::to_string(record.approved_at)}}));
          },
          [&](const update_form_approval_t& operation) {
            auto record_key = notary::schema::key::make_approval_record_key(
                encoder_, operation.document_id);
            auto existing = view.get<approval_record_t>(encoder_, record_key);
            auto outcome = notary::registry::update_form_approval(
                registry, existing, tx.signer, operation);
            if (!notary::registry::succeeded(outcome)) {
              return fail(notary::registry::error_of(outcome));
            }
            view.put(encoder_, record_key, std::get<approval_record_t>(outcome));
            result.events.push_back(
                make_event("notary.form_approval_updated",
                           {{"form_id", operation.document_id},
                            {"signer", hex(tx.signer)}}));
          }},
      tx.payload);
  return result;
}

block_result_t engine::finalize_block(
    uint64_t height,
    timestamp_seconds_t block_time,
    const std::vector<notary::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  pending_writes_.clear();

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto tx_result = transaction_result_t{};
    auto maybe_tx = encoder_.try_decode<transaction_t>(bytes_view_t{txs[i]});
    if (txs[i].empty() || !maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    kExecuteCodespace,
                                    "failed to decode transaction");
    } else {
      auto envelope_view = state_view{storage_, pending_writes_};
      tx_result =
          validate_transaction(*maybe_tx, kExecuteCodespace, envelope_view);
      if (tx_result.code == 0) {
        // A valid envelope consumes the nonce even if the operation fails.
        pending_writes_.insert_or_assign(
            notary::schema::key::make_nonce_key(encoder_, maybe_tx->signer),
            encoder_.encode(maybe_tx->nonce));

        auto operation_view = state_view{storage_, pending_writes_};
        tx_result = execute_operation(*maybe_tx, block_time, operation_view);
        if (tx_result.code == 0) {
          merge_writes(pending_writes_, operation_view.writes());
          rolling_root = fold_state_root(rolling_root, txs[i], height, index);
        }
      }
    }

    if (tx_result.code != 0) {
      spdlog::debug("Rejected tx {} at height {}: {}", index, height,
                    tx_result.log);
    }
    append_result_event(tx_result);
    pending_writes_.insert_or_assign(
        notary::schema::key::make_history_key(encoder_, height, index),
        encoder_.encode(history_entry_t{.height = height,
                                        .index = index,
                                        .code = tx_result.code,
                                        .tx = txs[i]}));
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    auto entries = std::vector<notary::storage::key_value_entry_t>(
        std::begin(pending_writes_), std::end(pending_writes_));
    storage_.commit_batch(
        entries, notary::storage::committed_state{
                     .height = pending_height_,
                     .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    pending_writes_.clear();
    spdlog::info("Committed height {} ({} writes) state root {}",
                 last_committed_height_, entries.size(),
                 hex(last_committed_state_root_));
  }

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = chain_id_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.height = last_committed_height_;
  result.key = make_bytes(data);

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& prefix : notary::schema::key::kEngineKeyspaces) {
      keyspaces.emplace_back(prefix);
    }
    result.value = encoder_.encode(keyspaces);
    return result;
  }
  if (path == "/admin/registry") {
    auto key = notary::schema::key::make_admin_registry_key(encoder_);
    auto registry = storage_.get<admin_registry_t>(encoder_, key);
    if (!registry) {
      return make_query_error(query_error_code::not_found,
                              "admin registry not initialized",
                              last_committed_height_);
    }
    result.key = key;
    result.value = encoder_.encode(*registry);
    return result;
  }
  if (path == "/admin/is_admin") {
    auto address = encoder_.try_decode<account_id_t>(data);
    if (!address) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte address",
                              last_committed_height_);
    }
    auto registry = storage_.get<admin_registry_t>(
        encoder_, notary::schema::key::make_admin_registry_key(encoder_));
    auto admin = registry && notary::registry::is_admin(*registry, *address);
    result.value = encoder_.encode(admin);
    return result;
  }
  if (path == "/approval/address") {
    auto document_id = encoder_.try_decode<std::string>(data);
    if (!document_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected document id", last_committed_height_);
    }
    result.value = encoder_.encode(
        notary::schema::key::make_approval_record_address(*document_id));
    return result;
  }
  if (path == "/approval/details") {
    auto document_id = encoder_.try_decode<std::string>(data);
    if (!document_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected document id", last_committed_height_);
    }
    auto key =
        notary::schema::key::make_approval_record_key(encoder_, *document_id);
    auto outcome = notary::registry::get_form_approval_details(
        storage_.get<approval_record_t>(encoder_, key));
    if (!notary::registry::succeeded(outcome)) {
      return make_query_error(query_error_code::record_not_found,
                              "no approval for " + *document_id,
                              last_committed_height_);
    }
    result.key = key;
    result.value = encoder_.encode(std::get<approval_record_t>(outcome));
    return result;
  }
  if (path == "/approval/verify") {
    auto request =
        encoder_.try_decode<std::tuple<std::string, hash32_t>>(data);
    if (!request) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (document id, hash32)",
                              last_committed_height_);
    }
    const auto& [document_id, expected_hash] = *request;
    auto key =
        notary::schema::key::make_approval_record_key(encoder_, document_id);
    auto outcome = notary::registry::verify_form_approval(
        storage_.get<approval_record_t>(encoder_, key), expected_hash);
    if (!notary::registry::succeeded(outcome)) {
      return make_query_error(query_error_code::record_not_found,
                              "no approval for " + document_id,
                              last_committed_height_);
    }
    result.key = key;
    result.value = encoder_.encode(std::get<bool>(outcome));
    return result;
  }
  if (path == "/nonce") {
    auto signer = encoder_.try_decode<account_id_t>(data);
    if (!signer) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte address",
                              last_committed_height_);
    }
    auto empty = write_set_t{};
    auto view = state_view{storage_, empty};
    result.value = encoder_.encode(next_nonce(*signer, view));
    return result;
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (from_height, to_height)",
                              last_committed_height_);
    }
    result.value = encoder_.encode(
        history_locked(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path " + std::string{path},
                          last_committed_height_);
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return history_locked(from_height, to_height);
}

std::vector<history_entry_t> engine::history_locked(uint64_t from_height,
                                                    uint64_t to_height) const {
  auto entries = std::vector<history_entry_t>{};
  auto prefix = notary::schema::key::make_prefix_key(
      encoder_, notary::schema::key::kHistoryPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto entry = encoder_.try_decode<history_entry_t>(bytes_view_t{value});
    if (!entry) {
      spdlog::warn("Skipping undecodable history row ({} bytes)", value.size());
      continue;
    }
    if (entry->height >= from_height && entry->height <= to_height) {
      entries.push_back(std::move(*entry));
    }
  }
  std::ranges::sort(entries, [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.height, lhs.index) < std::tie(rhs.height, rhs.index);
  });
  return entries;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

const notary::schema::hash32_t& engine::chain_id() const {
  return chain_id_;
}

uint64_t engine::next_nonce(const account_id_t& signer,
                            const state_view& view) {
  auto last = view.get<uint64_t>(
      encoder_, notary::schema::key::make_nonce_key(encoder_, signer));
  return last.value_or(0) + 1;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  } else {
    storage_.save_committed_state(notary::storage::committed_state{
        .height = 0, .state_root = make_zero_hash()});
  }
  pending_state_root_ = last_committed_state_root_;

  auto chain_key = notary::schema::key::make_prefix_key(encoder_, kChainIdKey);
  auto stored_chain = storage_.get<hash32_t>(encoder_, chain_key);
  if (!stored_chain) {
    storage_.put(encoder_, chain_key, chain_id_);
  } else if (*stored_chain != chain_id_) {
    notary::common::critical("store belongs to chain {}, not {}",
                             hex(*stored_chain), hex(chain_id_));
  }
}

}  // namespace notary::execution
