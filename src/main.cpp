#include <atomic>
#include <chrono>
#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <notary/common/critical.hpp>
#include <notary/execution/engine.hpp>
#include <notary/rpc/server.hpp>
#include <notary/schema/key/address.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

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

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto strict_crypto = true;
  auto config_path = std::string{};

  auto description = po::options_description{"Notary node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with the same options; command line wins")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("notary-data"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>(&chain_id)->default_value("notary-local"),
      "Chain id as 64 hex characters, or a name hashed to one")(
      "log-file", po::value<std::string>(&log_file)->default_value("notary.log"),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "strict-crypto",
      po::value<bool>(&strict_crypto)->default_value(true),
      "Verify ed25519 transaction signatures");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "notary", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto encoder = notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>{};
  auto storage =
      notary::storage::make_storage<notary::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = notary::execution::engine{
      encoder, storage, notary::schema::key::make_chain_id(chain_id),
      strict_crypto};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = notary::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    notary::common::critical("failed to start gRPC server on {}",
                             grpc_address);
  }
  spdlog::info("gRPC service listening on {}", grpc_address);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
