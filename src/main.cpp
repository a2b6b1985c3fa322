#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <pharbit/common/critical.hpp>
#include <pharbit/execution/engine.hpp>
#include <pharbit/schema/error_code.hpp>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

std::vector<pharbit::schema::identity_t> parse_identities(
    const po::variables_map& vm,
    const std::string& name) {
  auto identities = std::vector<pharbit::schema::identity_t>{};
  if (!vm.contains(name)) {
    return identities;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto identity = pharbit::schema::try_make_hash32(value);
    if (!identity) {
      pharbit::common::critical("genesis " + name +
                                " must be a 32-byte hex identity");
    }
    identities.push_back(*identity);
  }
  return identities;
}

/// Read the genesis INI file. Unknown keys are rejected.
pharbit::schema::genesis_t load_genesis(const std::string& path) {
  auto description = po::options_description{"Genesis"};
  description.add_options()("genesis.admin",
                            po::value<std::vector<std::string>>())(
      "genesis.registrar", po::value<std::vector<std::string>>())(
      "genesis.owner", po::value<std::vector<std::string>>())(
      "genesis.quorum", po::value<uint32_t>()->default_value(0))(
      "telemetry.min_temperature", po::value<int32_t>()->default_value(20))(
      "telemetry.max_temperature", po::value<int32_t>()->default_value(80))(
      "telemetry.max_humidity",
      po::value<uint32_t>()->default_value(
          pharbit::schema::kMaxHumidityPermille))(
      "telemetry.staleness_window",
      po::value<uint64_t>()->default_value(
          pharbit::schema::kMillisecondsPerDay))(
      "telemetry.require_sensor_binding",
      po::value<bool>()->default_value(false));

  auto file = std::ifstream{path};
  if (!file) {
    pharbit::common::critical("unable to open genesis file " + path);
  }
  auto vm = po::variables_map{};
  po::store(po::parse_config_file(file, description), vm);
  po::notify(vm);

  auto genesis = pharbit::schema::genesis_t{};
  genesis.admins = parse_identities(vm, "genesis.admin");
  genesis.registrars = parse_identities(vm, "genesis.registrar");
  genesis.owners = parse_identities(vm, "genesis.owner");
  genesis.quorum = vm["genesis.quorum"].as<uint32_t>();
  genesis.telemetry_bounds.min_temperature =
      vm["telemetry.min_temperature"].as<int32_t>();
  genesis.telemetry_bounds.max_temperature =
      vm["telemetry.max_temperature"].as<int32_t>();
  genesis.telemetry_bounds.max_humidity =
      vm["telemetry.max_humidity"].as<uint32_t>();
  genesis.parameters.telemetry_staleness_window =
      vm["telemetry.staleness_window"].as<uint64_t>();
  genesis.parameters.require_sensor_binding =
      vm["telemetry.require_sensor_binding"].as<bool>();
  return genesis;
}

void print_result(const pharbit::schema::transaction_result_t& result) {
  if (result.code == 0) {
    std::cout << "ok sequence=" << result.sequence;
    for (const auto& event : result.events) {
      std::cout << " event=" << event.type;
    }
    if (!result.data.empty()) {
      std::cout << " data=" << pharbit::schema::to_base64(result.data);
    }
    std::cout << '\n';
    return;
  }
  std::cout << "error code=" << result.code << " codespace=" << result.codespace
            << " kind=" << result.info << " log=" << result.log << '\n';
}

int submit_line(pharbit::execution::engine& engine, const std::string& line) {
  auto raw = pharbit::schema::try_from_base64(line);
  if (!raw) {
    spdlog::warn("Skipping input that is not base64");
    std::cout << "error code="
              << static_cast<uint32_t>(
                     pharbit::schema::error_code::invalid_transaction)
              << " log=input is not base64\n";
    return 1;
  }
  auto result =
      engine.execute_transaction(pharbit::schema::make_bytes_view(*raw));
  print_result(result);
  return result.code == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto db_path = std::string{};
  auto log_path = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Pharbit"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path)->default_value("pharbit.db"),
      "Ledger RocksDB directory")(
      "log", po::value<std::string>(&log_path)->default_value("pharbit.log"),
      "Log file path")("genesis,g", po::value<std::string>(),
                       "Genesis INI file used when creating a new ledger")(
      "tx,t", po::value<std::vector<std::string>>(),
      "Base64 SCALE transaction; without --tx, --query or --replay "
      "transactions are read from stdin, one per line")(
      "query,q", po::value<std::string>(), "Query path, e.g. /batch")(
      "key,k", po::value<std::string>()->default_value(""),
      "Base64 SCALE query key")("replay,r",
                                "Replay persisted history and verify it")(
      "verbose,v", "Enable verbose output");
  po::store(po::parse_command_line(argc, argv, description), vm);
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto genesis = pharbit::schema::genesis_t{};
  if (vm.contains("genesis")) {
    genesis = load_genesis(vm["genesis"].as<std::string>());
  }

  auto engine = pharbit::execution::engine{db_path, genesis};
  auto status = 0;

  if (vm.contains("replay")) {
    auto result = engine.replay_history();
    std::cout << (result.ok ? "ok" : "mismatch") << " txs=" << result.tx_count
              << " applied=" << result.applied_count
              << " root=" << pharbit::schema::to_hex(result.state_root);
    if (!result.error.empty()) {
      std::cout << " error=" << result.error;
    }
    std::cout << '\n';
    status = result.ok ? 0 : 1;
  } else if (vm.contains("query")) {
    auto key = pharbit::schema::try_from_base64(vm["key"].as<std::string>());
    if (!key) {
      pharbit::common::critical("--key must be base64");
    }
    auto result = engine.query(vm["query"].as<std::string>(),
                               pharbit::schema::make_bytes_view(*key));
    if (result.code == 0) {
      std::cout << "ok sequence=" << result.sequence
                << " value=" << pharbit::schema::to_base64(result.value)
                << '\n';
    } else {
      std::cout << "error code=" << result.code
                << " codespace=" << result.codespace << " log=" << result.log
                << '\n';
      status = 1;
    }
  } else if (vm.contains("tx")) {
    for (const auto& line : vm["tx"].as<std::vector<std::string>>()) {
      status |= submit_line(engine, line);
    }
  } else {
    auto line = std::string{};
    while (!shutdown_requested() && std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      status |= submit_line(engine, line);
    }
  }

  auto info = engine.info();
  spdlog::info("Ledger at sequence {} with state root {}", info.last_sequence,
               pharbit::schema::to_hex(info.state_root));
  spdlog::shutdown();
  return status;
}
