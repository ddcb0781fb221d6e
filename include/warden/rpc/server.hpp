#pragma once

#include <warden/node/v1/node.grpc.pb.h>
#include <warden/execution/engine.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::rpc {

/// Node callback listener driven by an external sequencer.
///
/// Quick reference:
/// - Info: handshake; last committed height, state root and chain id.
/// - CheckTx: mempool admission checks; no state mutation.
/// - FinalizeBlock: execute block and return tx results + state root.
/// - Commit: persist finalized state.
/// - Query: read committed state.
struct listener final : public warden::node::v1::Node::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(warden::execution::engine& engine);

  /// Return app metadata used during node/sequencer handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const warden::node::v1::RequestInfo* request,
      warden::node::v1::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const warden::node::v1::RequestCheckTx* request,
      warden::node::v1::ResponseCheckTx* response) override final;

  /// Execute ordered block transactions and return tx results + state root.
  ///
  /// The sequencer-assigned block time is shared by every transaction of
  /// the block. A request without a positive block time is rejected with
  /// INVALID_ARGUMENT and executes nothing.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const warden::node::v1::RequestFinalizeBlock* request,
      warden::node::v1::ResponseFinalizeBlock* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const warden::node::v1::RequestCommit* request,
      warden::node::v1::ResponseCommit* response) override final;

  /// Execute read query against current committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const warden::node::v1::RequestQuery* request,
      warden::node::v1::ResponseQuery* response) override final;

  warden::execution::engine& execution_engine_;
};

}  // namespace warden::rpc
