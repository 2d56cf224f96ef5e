#include <gtest/gtest.h>
#include <tessera/rpc/server.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <tessera/testing/execution_fixture.hpp>

#include <string>

using namespace tessera::schema;
using tessera::testing::encode_transaction;
using tessera::testing::execution_fixture;
using tessera::testing::kGenesisTime;
using tessera::testing::make_transaction;

TEST(rpc_server, submit_finalizes_and_commits_one_block) {
  auto fixture = execution_fixture{"tessera_rpc_submit"};
  auto listener = tessera::rpc::listener{fixture.engine()};

  auto request = tessera::v1::SubmitRequest{};
  request.set_tx(make_string(encode_transaction(make_transaction(
      fixture.chain_id(), 1, fixture.who.alice, deposit_t{.asset_ids = {7}}))));
  auto response = tessera::v1::SubmitResponse{};
  auto context = grpc::CallbackServerContext{};
  auto* reactor = listener.Submit(&context, &request, &response);
  ASSERT_NE(reactor, nullptr);

  EXPECT_EQ(response.result().code(), 0u) << response.result().log();
  EXPECT_EQ(response.height(), 1);
  EXPECT_GT(response.block_time_ms(), kGenesisTime);
  ASSERT_EQ(response.result().events_size(), 1);
  EXPECT_EQ(response.result().events(0).type(), "deposit");

  auto info = tessera::testing::query_info(fixture.engine());
  EXPECT_EQ(info.last_block_height, 1);
  EXPECT_EQ(info.last_block_time, response.block_time_ms());
  EXPECT_EQ(response.state_root(),
            make_string(bytes_view_t{info.last_block_state_root}));
}

TEST(rpc_server, submit_reports_rejection_and_still_advances_height) {
  auto fixture = execution_fixture{"tessera_rpc_reject"};
  auto listener = tessera::rpc::listener{fixture.engine()};

  auto request = tessera::v1::SubmitRequest{};
  request.set_tx(make_string(encode_transaction(make_transaction(
      fixture.chain_id(), 1, fixture.who.bob, withdraw_pending_t{}))));
  auto response = tessera::v1::SubmitResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Submit(&context, &request, &response), nullptr);

  EXPECT_EQ(response.result().code(),
            static_cast<uint32_t>(transaction_error_code::no_funds));
  EXPECT_EQ(response.result().codespace(), "tessera.payments");
  EXPECT_EQ(response.height(), 1);
}

TEST(rpc_server, submit_never_moves_block_time_backwards) {
  auto fixture = execution_fixture{"tessera_rpc_clock"};
  // A committed block stamped far beyond the node clock.
  constexpr auto kFarFuture = timestamp_milliseconds_t{4'000'000'000'000};
  auto driver = tessera::testing::block_driver{fixture.engine()};
  ASSERT_EQ(driver.submit(fixture.who.alice, deposit_t{.asset_ids = {7}},
                          kFarFuture)
                .code,
            0u);

  auto listener = tessera::rpc::listener{fixture.engine()};
  auto request = tessera::v1::SubmitRequest{};
  request.set_tx(make_string(encode_transaction(make_transaction(
      fixture.chain_id(), 2, fixture.who.alice, deposit_t{.asset_ids = {8}}))));
  auto response = tessera::v1::SubmitResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Submit(&context, &request, &response), nullptr);

  EXPECT_EQ(response.result().code(), 0u) << response.result().log();
  EXPECT_EQ(response.height(), 2);
  EXPECT_EQ(response.block_time_ms(), kFarFuture);
}

TEST(rpc_server, check_tx_validates_without_mutation) {
  auto fixture = execution_fixture{"tessera_rpc_check"};
  auto listener = tessera::rpc::listener{fixture.engine()};

  auto request = tessera::v1::SubmitRequest{};
  request.set_tx(std::string{"\xAA\xBB\xCC", 3});
  auto response = tessera::v1::TxResult{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.CheckTx(&context, &request, &response), nullptr);
  EXPECT_EQ(response.code(),
            static_cast<uint32_t>(transaction_error_code::invalid_transaction));
  EXPECT_EQ(response.codespace(), "tessera.checktx");
  EXPECT_EQ(tessera::testing::query_info(fixture.engine()).last_block_height,
            0);
}

TEST(rpc_server, query_and_info_expose_committed_state) {
  auto fixture = execution_fixture{"tessera_rpc_query"};
  auto listener = tessera::rpc::listener{fixture.engine()};

  auto key = fixture.encoder().encode(fixture.who.alice);
  auto request = tessera::v1::QueryRequest{};
  request.set_path("/state/balance");
  request.set_data(make_string(key));
  auto response = tessera::v1::QueryResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Query(&context, &request, &response), nullptr);
  EXPECT_EQ(response.code(), 0u);
  auto value = make_bytes(response.value());
  EXPECT_EQ(fixture.encoder().decode<amount_t>(bytes_view_t{value}),
            amount_t{tessera::testing::kStartingBalance});

  auto info_request = tessera::v1::InfoRequest{};
  auto info_response = tessera::v1::InfoResponse{};
  auto info_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Info(&info_context, &info_request, &info_response),
            nullptr);
  EXPECT_EQ(info_response.data(), "tessera-custody");
  EXPECT_EQ(info_response.last_block_height(), 0);
  EXPECT_EQ(info_response.last_block_time_ms(), 0u);
  EXPECT_EQ(info_response.chain_id(),
            make_string(bytes_view_t{fixture.chain_id()}));
}
