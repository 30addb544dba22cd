#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <agentid/common/critical.hpp>
#include <agentid/crypto/verify.hpp>
#include <agentid/crypto/signer.hpp>
#include <agentid/execution/engine.hpp>
#include <agentid/rpc/server.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
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

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto signing_key_env = std::string{};
  auto workers = std::size_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"AgentID"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:50051"),
      "IP:Port for the credential service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "agentid.db"),
      "RocksDB directory")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "agentid.log"),
      "Log file path")(
      "workers,w",
      boost::program_options::value<std::size_t>(&workers)->default_value(2),
      "Side-effect worker threads")(
      "signing-key-env",
      boost::program_options::value<std::string>(&signing_key_env)
          ->default_value("AGENTID_SIGNING_KEY_SEED"),
      "Environment variable holding the master signing secret")(
      "verify-only", "Serve without a signing key; issuance is disabled");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
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
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  if (!agentid::crypto::available()) {
    agentid::common::critical("OpenSSL lacks Ed25519/HKDF support");
  }

  auto options = agentid::execution::engine_options{.worker_count = workers};
  options.secret = agentid::crypto::master_secret::from_environment(
      signing_key_env);
  if (!options.secret) {
    if (!vm.contains("verify-only")) {
      agentid::common::critical(
          signing_key_env +
          " is not set; refusing to start without --verify-only");
    }
    spdlog::warn("{} is not set; running in verify-only mode",
                 signing_key_env);
  }

  auto store = agentid::storage::make_storage<
      agentid::storage::rocksdb_storage_tag>(db_path);
  auto repository = agentid::storage::repository{store};
  auto engine = agentid::execution::engine{repository, std::move(options)};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = agentid::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    agentid::common::critical("Failed to start gRPC server on " + grpc_address);
  }

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto last_sweep = std::chrono::steady_clock::now();
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (std::chrono::steady_clock::now() - last_sweep >=
          std::chrono::minutes(1)) {
        auto summary = engine.sweep();
        if (summary.expired_credentials > 0 || !summary.expired_grants.empty()) {
          spdlog::info("Expired {} credentials and {} authorizations",
                       summary.expired_credentials,
                       summary.expired_grants.size());
        }
        last_sweep = std::chrono::steady_clock::now();
      }
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  engine.wait_idle();
  spdlog::shutdown();
  return 0;
}
