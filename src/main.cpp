#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cosign/common/critical.hpp>
#include <cosign/execution/engine.hpp>
#include <cosign/schema/encoding/scale/encoder.hpp>
#include <cosign/storage/rocksdb/storage.hpp>
#include <cosign/tools/arguments.hpp>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace cosign::schema;

void print_help(const po::options_description& options) {
  std::cout
      << "usage: cosign <command> [options]\n"
         "commands: init info is-signer digest execute set-quorum "
         "set-signer events\n"
      << options << std::endl;
}

cosign::execution::deployment_config make_deployment_config(
    const po::variables_map& vm) {
  auto config = cosign::execution::deployment_config{};
  config.domain.name = vm["name"].as<std::string>();
  config.domain.chain_id = vm["chain-id"].as<uint64_t>();
  config.domain.verifying_module =
      cosign::tools::get_address(vm, "module-address");
  if (vm.contains("signer")) {
    for (const auto& text : vm["signer"].as<std::vector<std::string>>()) {
      auto signer = try_make_address(text);
      if (!signer) {
        cosign::common::critical("--signer must be 20 bytes of hex, got '{}'",
                                 text);
      }
      config.signers.push_back(*signer);
    }
  }
  config.quorum = vm["quorum"].as<uint64_t>();
  return config;
}

int print_result(const transaction_result_t& result) {
  if (result.ok()) {
    std::cout << "ok: " << result.info << "\n";
    for (const auto& event : result.events) {
      cosign::tools::print_event(std::cout, event);
    }
  } else {
    std::cout << "error " << result.code << " (" << result.codespace
              << "): " << result.log << ": " << result.info << "\n";
  }
  return static_cast<int>(result.code);
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("cosign.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "cosign", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};

  auto description = po::options_description{"cosign"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "init|info|is-signer|digest|execute|set-quorum|set-signer|events")(
      "db", po::value<std::string>(&db_path)->default_value("cosign.db"),
      "RocksDB directory holding the module state")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with any of these options")(
      "name", po::value<std::string>()->default_value("cosign"),
      "deployment name bound into the domain separator")(
      "chain-id", po::value<uint64_t>()->default_value(1), "chain identifier")(
      "module-address", po::value<std::string>(),
      "address of this module, bound into the domain separator")(
      "signer", po::value<std::vector<std::string>>()->composing(),
      "genesis signer address (repeatable)")(
      "quorum", po::value<uint64_t>()->default_value(1), "genesis quorum")(
      "dispatch-command", po::value<std::string>(),
      "program that performs external calls; without it every call fails")(
      "signature", po::value<std::vector<std::string>>()->composing(),
      "65-byte r||s||v hex signature (repeatable, ascending signer order)")(
      "from", po::value<uint64_t>()->default_value(1), "first event sequence")(
      "to", po::value<uint64_t>(), "last event sequence")(
      "verbose,v", "Enable verbose output");
  cosign::tools::add_action_options(description);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    if (!std::filesystem::exists(path)) {
      cosign::common::critical("config file '{}' not found", path);
    }
    po::store(po::parse_config_file(path.c_str(), description), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(description);
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (command != "init" && !std::filesystem::exists(db_path)) {
    cosign::common::critical("no module store at '{}'; run `cosign init`",
                             db_path);
  }

  auto encoder = cosign::schema::encoding::encoder<
      cosign::schema::encoding::scale_encoder_tag>{};
  auto storage =
      cosign::storage::make_storage<cosign::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = cosign::execution::engine{encoder, storage,
                                          make_deployment_config(vm)};
  if (vm.contains("dispatch-command")) {
    engine.set_call_executor(cosign::execution::make_command_executor(
        vm["dispatch-command"].as<std::string>()));
  }

  auto exit_code = 0;
  if (command == "init" || command == "info") {
    std::cout << "domain_separator: "
              << cosign::tools::to_prefixed_hex(engine.domain_separator())
              << "\n"
              << "nonce: " << engine.nonce() << "\n"
              << "quorum: " << engine.quorum() << "\n"
              << "events: " << engine.last_event_sequence() << "\n";
  } else if (command == "is-signer") {
    auto signer = cosign::tools::get_address(vm, "address");
    std::cout << (engine.is_signer(signer) ? "true" : "false") << "\n";
  } else if (command == "digest") {
    auto action = cosign::tools::make_action(vm);
    std::cout << cosign::tools::to_prefixed_hex(engine.digest(action))
              << "\n";
  } else if (auto kind = try_make_action_kind(command)) {
    exit_code = print_result(
        engine.submit(cosign::tools::make_action(vm, *kind),
                      cosign::tools::get_signatures(vm)));
  } else if (command == "events") {
    auto to = vm.contains("to") ? vm["to"].as<uint64_t>()
                                : engine.last_event_sequence();
    for (const auto& event : engine.events(vm["from"].as<uint64_t>(), to)) {
      cosign::tools::print_event(std::cout, event);
    }
  } else {
    spdlog::error("Unknown command '{}'", command);
    print_help(description);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
