#include <spdlog/spdlog.h>
#include <tessera/rpc/server.hpp>
#include <algorithm>
#include <chrono>
#include <vector>

using namespace tessera::rpc;
using namespace tessera::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

timestamp_milliseconds_t wall_clock_ms() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void populate_tx_result(const transaction_result_t& source,
                        tessera::v1::TxResult* destination) {
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

listener::listener(tessera::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const tessera::v1::SubmitRequest* request,
    tessera::v1::SubmitResponse* response) {
  auto lock = std::scoped_lock{block_mutex_};
  auto info = execution_engine_.info();
  auto height = static_cast<uint64_t>(info.last_block_height) + 1;
  // The node clock is the only time source; it never runs behind the last
  // committed block.
  auto block_time = std::max(wall_clock_ms(), info.last_block_time);

  auto txs = std::vector<bytes_t>{make_bytes(request->tx())};
  auto block = execution_engine_.finalize_block(height, block_time, txs);
  auto commit = execution_engine_.commit();

  const auto& tx_result = block.tx_results.front();
  if (!accepted(tx_result)) {
    spdlog::warn("Rejected transaction at height {}: [{}] {}", height,
                 tx_result.codespace, tx_result.log);
  }
  populate_tx_result(tx_result, response->mutable_result());
  response->set_height(commit.committed_height);
  response->set_state_root(make_string(bytes_view_t{commit.state_root}));
  response->set_block_time_ms(block_time);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const tessera::v1::SubmitRequest* request,
    tessera::v1::TxResult* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  populate_tx_result(check, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const tessera::v1::QueryRequest* request,
    tessera::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const tessera::v1::InfoRequest* /*request*/,
    tessera::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_time_ms(info.last_block_time);
  response->set_last_block_state_root(
      make_string(bytes_view_t{info.last_block_state_root}));
  response->set_chain_id(make_string(bytes_view_t{info.chain_id}));
  return finish_ok(context);
}
