#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/execution/engine.hpp>
#include <warden/rpc/server.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <atomic>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

/// Parse `<identity>=<amount>`; the identity is base58 or hex.
std::optional<warden::execution::genesis_account_t> parse_genesis_account(
    const std::string& text) {
  auto separator = text.find('=');
  if (separator == std::string::npos) {
    return std::nullopt;
  }
  auto account = warden::schema::try_parse_identity(
      std::string_view{text}.substr(0, separator));
  if (!account) {
    return std::nullopt;
  }
  auto amount = warden::schema::amount_t{};
  auto digits = std::string_view{text}.substr(separator + 1);
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), amount);
  if (error != std::errc{} || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return warden::execution::genesis_account_t{*account, amount};
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_id_hex = std::string{};
  auto strict_crypto = true;
  auto genesis_accounts = std::vector<std::string>{};
  auto log_file = std::string{};
  auto config_file = std::string{};

  namespace po = boost::program_options;
  auto vm = po::variables_map{};
  auto description = po::options_description{"Warden"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the node gRPC server")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("warden.db"),
      "RocksDB directory")(
      "chain-id", po::value<std::string>(&chain_id_hex),
      "Chain id as 64 hex digits (default: blake3 of \"warden-devnet\")")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify ed25519 transaction signatures")(
      "genesis-account",
      po::value<std::vector<std::string>>(&genesis_accounts)->composing(),
      "Fund <identity>=<amount> on a fresh database (repeatable)")(
      "log-file", po::value<std::string>(&log_file)->default_value("warden.log"),
      "Log file path")("config,c", po::value<std::string>(&config_file),
                       "Config file with the same keys")(
      "verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto config = std::ifstream{config_file};
      if (!config.good()) {
        std::cerr << "cannot open config file '" << config_file << "'"
                  << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
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
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto chain_id = warden::blake3::hash(std::string_view{"warden-devnet"});
  if (!chain_id_hex.empty()) {
    auto parsed = warden::schema::try_make_hash32(chain_id_hex);
    if (!parsed) {
      spdlog::error("--chain-id must be 64 hex digits");
      spdlog::shutdown();
      return 1;
    }
    chain_id = *parsed;
  }

  auto genesis = std::vector<warden::execution::genesis_account_t>{};
  for (const auto& entry : genesis_accounts) {
    auto account = parse_genesis_account(entry);
    if (!account) {
      spdlog::error("Invalid --genesis-account '{}'", entry);
      spdlog::shutdown();
      return 1;
    }
    genesis.push_back(*account);
  }

  auto encoder = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>{};
  auto storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          db_path);
  auto engine =
      warden::execution::engine{encoder, storage, chain_id, strict_crypto};
  if (!genesis.empty()) {
    engine.apply_genesis(genesis);
  }

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = warden::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
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

  spdlog::info("Shutting down");
  spdlog::shutdown();
  return 0;
}
