#include <spdlog/spdlog.h>
#include <warden/rpc/server.hpp>
#include <string>
#include <vector>

using namespace warden::rpc;
using namespace warden::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

void populate_event(const transaction_event_t& source,
                    warden::node::v1::Event* destination) {
  destination->set_type(source.type);
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.index);
  }
}

void populate_exec_tx_result(const transaction_result_t& source,
                             warden::node::v1::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

std::string hash_string(const hash32_t& hash) {
  return std::string{reinterpret_cast<const char*>(hash.data()), hash.size()};
}

}  // namespace

listener::listener(warden::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const warden::node::v1::RequestInfo* /*request*/,
    warden::node::v1::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(hash_string(info.last_block_state_root));
  response->set_chain_id(hash_string(info.chain_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const warden::node::v1::RequestCheckTx* request,
    warden::node::v1::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_gas_wanted(check.gas_wanted);
  response->set_gas_used(check.gas_used);
  response->set_codespace(check.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const warden::node::v1::RequestFinalizeBlock* request,
    warden::node::v1::ResponseFinalizeBlock* response) {
  // Every replica must see the same time, so the node never substitutes
  // its own clock.
  auto block_time = request->block_time_seconds();
  if (block_time <= 0) {
    spdlog::warn("rejecting block {} without a block time", request->height());
    return finish_invalid(context, "block_time_seconds must be positive");
  }

  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }
  auto execution =
      execution_engine_.finalize_block(request->height(), block_time, txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(hash_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const warden::node::v1::RequestCommit* /*request*/,
    warden::node::v1::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(hash_string(commit.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const warden::node::v1::RequestQuery* request,
    warden::node::v1::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
