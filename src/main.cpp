#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tessera/config/genesis.hpp>
#include <tessera/encoding/scale/encoder.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/rpc/server.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto genesis_path = std::string{};
  auto log_file = std::string{};
  auto strict_crypto = true;

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Tessera"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the custody gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "tessera.db"),
      "RocksDB directory")(
      "genesis",
      boost::program_options::value<std::string>(&genesis_path)->required(),
      "Genesis configuration file")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "tessera.log"),
      "Log file path")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify ed25519 transaction signatures")("verbose,v",
                                               "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tessera", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto genesis_error = std::string{};
  auto genesis = tessera::config::load_genesis(genesis_path, genesis_error);
  if (!genesis) {
    spdlog::error("Invalid genesis '{}': {}", genesis_path, genesis_error);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = tessera::encoding::scale_encoder_t{};
  auto storage =
      tessera::storage::make_storage<tessera::storage::rocksdb_storage_tag>(
          db_path);
  auto engine =
      tessera::execution::engine{encoder, storage, *genesis, strict_crypto};

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = tessera::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Shut down at height {}", engine.info().last_block_height);
  spdlog::shutdown();
  return 0;
}
