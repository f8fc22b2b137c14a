#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <verity/execution/engine.hpp>
#include <verity/execution/signing.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/storage/rocksdb/storage.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;

void install_logger(const std::string& log_file, const std::string& level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "verity", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

void print_result(const verity::schema::transaction_result_t& result) {
  std::cout << "code=" << result.code;
  if (!result.codespace.empty()) {
    std::cout << " codespace=" << result.codespace;
  }
  if (!result.log.empty()) {
    std::cout << " log=\"" << result.log << '"';
  }
  if (!result.info.empty()) {
    std::cout << " info=\"" << result.info << '"';
  }
  if (!result.data.empty()) {
    std::cout << " data=" << verity::schema::to_hex(result.data);
  }
  std::cout << " events=" << result.events.size() << '\n';
}

int run_init(verity::execution::engine& engine,
             const po::variables_map& vm) {
  if (!vm.contains("admin")) {
    spdlog::error("init requires --admin");
    return 1;
  }
  auto admin = verity::schema::try_make_signer_id(
      vm["admin-kind"].as<std::string>(), vm["admin"].as<std::string>());
  if (!admin) {
    spdlog::error("Malformed admin principal");
    return 1;
  }
  auto genesis = verity::schema::genesis_t{};
  genesis.chain_id = verity::execution::registry_chain_id();
  genesis.admin = *admin;
  genesis.genesis_time = vm["genesis-time"].as<uint64_t>();
  auto result = engine.init_chain(genesis);
  print_result(result);
  return result.code == 0 ? 0 : 1;
}

int run_execute_block(verity::execution::engine& engine,
                      const po::variables_map& vm) {
  if (!vm.contains("height")) {
    spdlog::error("execute-block requires --height");
    return 1;
  }
  auto txs = std::vector<verity::schema::bytes_t>{};
  if (vm.contains("tx")) {
    for (const auto& encoded : vm["tx"].as<std::vector<std::string>>()) {
      auto raw = verity::schema::try_from_base64(encoded);
      if (!raw) {
        spdlog::error("Transaction is not valid base64");
        return 1;
      }
      txs.push_back(std::move(*raw));
    }
  }
  auto block = engine.finalize_block(vm["height"].as<uint64_t>(),
                                     vm["block-time"].as<uint64_t>(), txs);
  for (const auto& result : block.tx_results) {
    print_result(result);
  }
  auto committed = engine.commit();
  std::cout << "height=" << committed.committed_height << " state_root="
            << verity::schema::to_hex(
                   verity::schema::bytes_view_t{committed.state_root})
            << '\n';
  return 0;
}

int run_query(verity::execution::engine& engine, const po::variables_map& vm) {
  if (!vm.contains("path")) {
    spdlog::error("query requires --path");
    return 1;
  }
  auto data = verity::schema::bytes_t{};
  if (vm.contains("data")) {
    auto decoded = verity::schema::try_from_base64(vm["data"].as<std::string>());
    if (!decoded) {
      spdlog::error("Query data is not valid base64");
      return 1;
    }
    data = std::move(*decoded);
  }
  auto result = engine.query(vm["path"].as<std::string>(),
                             verity::schema::bytes_view_t{data});
  if (result.code != 0) {
    std::cout << "code=" << result.code << " codespace=" << result.codespace
              << " log=\"" << result.log << "\"\n";
    return 1;
  }
  std::cout << verity::schema::to_base64(result.value) << '\n';
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto strict_crypto = true;

  auto description = po::options_description{"Verity"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "init|info|execute-block|query|export-backup|import-backup|replay")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("verity-db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also log to this file")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "admin-kind", po::value<std::string>()->default_value("ed25519"),
      "named|ed25519|secp256k1")("admin", po::value<std::string>(),
                                 "Genesis admin key hex")(
      "genesis-time", po::value<uint64_t>()->default_value(0),
      "Genesis time in seconds")("height", po::value<uint64_t>(),
                                 "Block height")(
      "block-time", po::value<uint64_t>()->default_value(0),
      "Block time in seconds")(
      "tx", po::value<std::vector<std::string>>()->multitoken(),
      "Base64 transactions")("path", po::value<std::string>(), "Query path")(
      "data", po::value<std::string>(), "Base64 query data")(
      "backup-path", po::value<std::string>(), "Backup file");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }

  install_logger(log_file, log_level);

  auto encoder = encoder_t{};
  auto storage =
      verity::storage::make_storage<verity::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = verity::execution::engine{encoder, storage, strict_crypto};

  auto status = 0;
  if (command == "init") {
    status = run_init(engine, vm);
  } else if (command == "info") {
    auto info = engine.info();
    std::cout << "app=" << info.data << " version=" << info.version
              << " height=" << info.last_block_height << " state_root="
              << verity::schema::to_hex(
                     verity::schema::bytes_view_t{info.last_block_state_root})
              << " initialized=" << std::boolalpha << info.initialized << '\n';
  } else if (command == "execute-block") {
    status = run_execute_block(engine, vm);
  } else if (command == "query") {
    status = run_query(engine, vm);
  } else if (command == "export-backup" || command == "import-backup") {
    if (!vm.contains("backup-path")) {
      spdlog::error("{} requires --backup-path", command);
      status = 1;
    } else {
      auto path = vm["backup-path"].as<std::string>();
      auto ok = command == "export-backup" ? engine.export_backup(path)
                                           : engine.load_backup(path);
      status = ok ? 0 : 1;
    }
  } else if (command == "replay") {
    auto replay = engine.replay_history();
    std::cout << "ok=" << std::boolalpha << replay.ok
              << " txs=" << replay.tx_count
              << " applied=" << replay.applied_count
              << " last_height=" << replay.last_height;
    if (!replay.error.empty()) {
      std::cout << " error=\"" << replay.error << '"';
    }
    std::cout << '\n';
    status = replay.ok ? 0 : 1;
  } else {
    spdlog::error("Unknown command '{}'", command);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
