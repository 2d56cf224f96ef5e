#pragma once

#include <tessera/v1/custody.grpc.pb.h>
#include <tessera/execution/engine.hpp>
#include <mutex>

namespace tessera::rpc {

/// Callback-style gRPC front end over the execution engine.
///
/// Quick reference:
/// - Submit: one transaction per block, finalized and committed at once.
/// - CheckTx: decode and envelope validation; no state mutation.
/// - Query: read-only route over committed state.
/// - Info: height, state root and chain id.
struct listener final : public tessera::v1::Custody::CallbackService {
  explicit listener(tessera::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const tessera::v1::SubmitRequest* request,
      tessera::v1::SubmitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const tessera::v1::SubmitRequest* request,
      tessera::v1::TxResult* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const tessera::v1::QueryRequest* request,
      tessera::v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const tessera::v1::InfoRequest* request,
      tessera::v1::InfoResponse* response) override final;

  tessera::execution::engine& execution_engine_;
  /// Serializes finalize+commit pairs so block heights stay contiguous.
  std::mutex block_mutex_;
};

}  // namespace tessera::rpc
