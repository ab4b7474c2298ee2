#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <notary/abci/server.hpp>
#include <notary/blake3/hash.hpp>
#include <notary/execution/engine.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void configure_logging(const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "notary", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto max_bytes_in_hash = uint32_t{};
  auto strict_crypto = true;
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_file = std::string{};

  auto description = po::options_description{"Notary"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style configuration file; command line values take precedence")(
      "grpc-port,g",
      po::value<std::string>(&grpc_port)->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("notary-db"),
      "RocksDB directory")(
      "chain-id", po::value<std::string>(&chain_name)->default_value("notary-local"),
      "chain name; its BLAKE3 hash is the 32-byte chain id")(
      "max-bytes-in-hash",
      po::value<uint32_t>(&max_bytes_in_hash)->default_value(64),
      "longest accepted proof in bytes")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "verify ed25519 transaction signatures")(
      "log-file", po::value<std::string>(&log_file)->default_value("notary.log"),
      "log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "verbose,v", "Enable verbose output (debug level)");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config_path = vm["config"].as<std::string>();
      auto config_stream = std::ifstream{config_path};
      if (!config_stream.good()) {
        std::cerr << "cannot open config file '" << config_path << "'\n";
        return 1;
      }
      po::store(po::parse_config_file(config_stream, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  if (max_bytes_in_hash == 0) {
    std::cerr << "max-bytes-in-hash must be greater than zero" << std::endl;
    return 1;
  }

  configure_logging(log_file);
  auto level = spdlog::level::from_str(log_level);
  if (vm.contains("verbose")) {
    level = spdlog::level::debug;
  }
  spdlog::set_level(level);

  auto encoder = notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>{};
  auto storage =
      notary::storage::make_storage<notary::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = notary::execution::engine{
      encoder, storage,
      notary::execution::engine_config{
          .chain_id = notary::blake3::hash(std::string_view{chain_name}),
          .max_bytes_in_hash = max_bytes_in_hash,
          .require_strict_crypto = strict_crypto}};

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = notary::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
