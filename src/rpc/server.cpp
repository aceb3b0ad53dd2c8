#include <spdlog/spdlog.h>
#include <chrono>
#include <notary/rpc/server.hpp>
#include <string>

using namespace notary::rpc;
using namespace notary::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

timestamp_seconds_t system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void populate_transaction_response(const transaction_result_t& source,
                                   notary::v1::TransactionResponse* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(notary::execution::engine& engine, block_clock_t clock)
    : execution_engine_{engine}, clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_seconds;
  }
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const notary::v1::InfoRequest* /*request*/,
    notary::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(
      make_string(bytes_view_t{info.last_block_state_root}));
  response->set_chain_id(make_string(bytes_view_t{info.chain_id}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const notary::v1::TransactionRequest* request,
    notary::v1::TransactionResponse* response) {
  auto result = execution_engine_.check_transaction(make_bytes_view(request->tx()));
  populate_transaction_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::BroadcastTx(
    grpc::CallbackServerContext* context,
    const notary::v1::TransactionRequest* request,
    notary::v1::TransactionResponse* response) {
  auto lock = std::scoped_lock{sequencer_mutex_};
  auto admitted =
      execution_engine_.check_transaction(make_bytes_view(request->tx()));
  if (admitted.code != 0) {
    populate_transaction_response(admitted, response);
    response->set_height(execution_engine_.info().last_block_height);
    spdlog::debug("Rejected tx before sequencing with code {}", admitted.code);
    return finish_ok(context);
  }
  auto height =
      static_cast<uint64_t>(execution_engine_.info().last_block_height) + 1;
  auto block = execution_engine_.finalize_block(height, clock_(),
                                                {make_bytes(request->tx())});
  auto commit = execution_engine_.commit();
  populate_transaction_response(block.tx_results.front(), response);
  response->set_height(commit.committed_height);
  response->set_state_root(make_string(bytes_view_t{commit.state_root}));
  spdlog::debug("Sequenced tx at height {} with code {}", height,
                response->code());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const notary::v1::QueryRequest* request,
    notary::v1::QueryResponse* response) {
  auto query = execution_engine_.query(request->path(),
                                       make_bytes_view(request->data()));
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
