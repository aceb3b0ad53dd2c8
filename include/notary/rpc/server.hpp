#pragma once

#include <notary/v1/ledger.grpc.pb.h>
#include <notary/execution/engine.hpp>
#include <functional>
#include <mutex>

namespace notary::rpc {

/// Clock used to stamp sequenced blocks, in seconds since the epoch.
using block_clock_t = std::function<notary::schema::timestamp_seconds_t()>;

/// Callback listener for the notary.v1.Ledger service.
///
/// Quick reference:
/// - Info: committed height, state root and chain id.
/// - CheckTx: envelope admission checks; no state mutation.
/// - BroadcastTx: runs an admitted tx as the next single-tx block and commits
///   it. Rejected envelopes are answered without a block.
/// - Query: read-only routes over committed state.
struct listener final : public notary::v1::Ledger::CallbackService {
  /// Bind listener to execution engine instance. Defaults to the system clock.
  explicit listener(notary::execution::engine& engine,
                    block_clock_t clock = {});

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const notary::v1::InfoRequest* request,
      notary::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const notary::v1::TransactionRequest* request,
      notary::v1::TransactionResponse* response) override final;

  /// Sequence and commit one transaction. Block heights are strictly
  /// increasing; calls are serialized so each block holds exactly one tx.
  /// A tx that fails CheckTx is returned with its code and is not sequenced.
  virtual grpc::ServerUnaryReactor* BroadcastTx(
      grpc::CallbackServerContext* context,
      const notary::v1::TransactionRequest* request,
      notary::v1::TransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const notary::v1::QueryRequest* request,
      notary::v1::QueryResponse* response) override final;

 private:
  notary::execution::engine& execution_engine_;
  block_clock_t clock_;
  std::mutex sequencer_mutex_;
};

}  // namespace notary::rpc
