#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vouch/escrow/engine.hpp>
#include <vouch/escrow/event_notifier.hpp>
#include <vouch/ledger/store_ledger.hpp>
#include <vouch/rpc/server.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

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

  namespace po = boost::program_options;

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_file = std::string{};
  auto admin_key_hex = std::string{};

  auto description = po::options_description{"vouchd"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26670"),
      "IP:Port for the gRPC escrow service")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("vouch.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_file)->default_value("vouchd.log"),
      "Log file")("log-level",
                  po::value<std::string>(&log_level)->default_value("info"),
                  "trace|debug|info|warn|error|critical")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with the same keys; the command line wins")(
      "admin-key-hex", po::value<std::string>(&admin_key_hex),
      "ed25519 public key allowed to call Ledger.Deposit; deposits are "
      "refused without one");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto stream = std::ifstream{vm["config"].as<std::string>()};
      if (!stream) {
        std::cerr << "cannot read config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(stream, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& error) {
    std::cerr << error.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    std::cerr << "unknown log level " << log_level << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "vouchd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);

  auto admin_key = std::optional<vouch::schema::public_key_t>{};
  if (!admin_key_hex.empty()) {
    auto raw = vouch::schema::try_from_hex(admin_key_hex);
    if (!raw || raw->size() != 32) {
      std::cerr << "--admin-key-hex must be 32 bytes of hex" << std::endl;
      return 1;
    }
    auto key = vouch::schema::ed25519_public_key{};
    std::copy(raw->begin(), raw->end(), key.public_key.begin());
    admin_key = key;
  }

  auto encoder = vouch::escrow::encoder_t{};
  auto storage =
      vouch::storage::make_storage<vouch::storage::rocksdb_storage_tag>(
          db_path);
  auto ledger = vouch::ledger::store_ledger{encoder, storage};
  auto journal = vouch::escrow::journal_notifier{encoder, storage};
  auto engine = vouch::rpc::escrow_engine_t{encoder, storage, ledger, ledger,
                                            journal};
  spdlog::info("Event journal at #{}", journal.last_sequence());

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto authenticator =
      vouch::rpc::authenticator{encoder, storage, std::move(admin_key)};
  if (admin_key_hex.empty()) {
    spdlog::warn("No --admin-key-hex given; Ledger.Deposit is disabled");
  }
  auto escrow_listener =
      vouch::rpc::escrow_listener{engine, journal, authenticator};
  auto ledger_listener = vouch::rpc::ledger_listener{ledger, authenticator};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&escrow_listener);
  grpc_builder.RegisterService(&ledger_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to listen on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("gRPC service listening on {}", grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
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
