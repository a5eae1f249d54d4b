#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/execution/engine.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using engine_t =
    provenance::execution::engine<provenance::storage::rocksdb_storage_tag>;

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "provenance", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

provenance::schema::account_id_t get_account(const po::variables_map& vm,
                                             const std::string& name) {
  if (!vm.contains(name)) {
    provenance::common::critical("missing required option --" + name);
  }
  auto account =
      provenance::schema::try_make_hash32(vm[name].as<std::string>());
  if (!account) {
    provenance::common::critical("--" + name +
                                 " must be a 32-byte hex account");
  }
  return *account;
}

std::string get_batch_id(const po::variables_map& vm) {
  if (!vm.contains("batch-id")) {
    provenance::common::critical("missing required option --batch-id");
  }
  return vm["batch-id"].as<std::string>();
}

uint64_t parse_role(const std::string& role) {
  if (auto label = provenance::schema::try_from_label<
          provenance::schema::role_id_t>(role)) {
    return static_cast<uint64_t>(*label);
  }
  try {
    return std::stoull(role);
  } catch (const std::exception& ex) {
    provenance::common::critical("--role must be a label or a number: " +
                                 std::string{ex.what()});
  }
}

int print_result(const provenance::schema::transaction_result_t& result) {
  if (result.code != 0) {
    std::cout << "rejected code=" << result.code << " (" << result.codespace
              << "): " << result.log << std::endl;
    return 1;
  }
  std::cout << "ok " << result.info << std::endl;
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "usage: provenance_cli <command> [options]\n\n"
            << "commands:\n"
            << "  assign-role     --sender --account --role\n"
            << "  create-batch    --sender --batch-id\n"
            << "  approve-batch   --sender --batch-id\n"
            << "  certify-batch   --sender --batch-id\n"
            << "  role            --account\n"
            << "  batch-status    --batch-id\n"
            << "  batch-asset     --batch-id\n"
            << "  certificate     --batch-id\n"
            << "  vendor-batches  --account\n"
            << "  events          --from --to\n"
            << "  info\n\n"
            << options << std::endl;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_file = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto generic = po::options_description{"generic options"};
  generic.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style configuration file")(
      "sender", po::value<std::string>(), "calling account hex")(
      "account", po::value<std::string>(), "target account hex")(
      "role", po::value<std::string>(), "VENDOR|INSPECTOR or numeric code")(
      "batch-id", po::value<std::string>(), "batch identifier")(
      "from", po::value<uint64_t>()->default_value(1), "first event id")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX), "last event id");

  auto configuration = po::options_description{"configuration"};
  configuration.add_options()(
      "db-path", po::value<std::string>(&db_path)->default_value("provenance.db"),
      "RocksDB directory")("administrator", po::value<std::string>(),
                           "administrator account hex")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "optional log file path");

  auto options = po::options_description{"provenance_cli options"};
  options.add(generic).add(configuration);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto input = std::ifstream{vm["config"].as<std::string>()};
    if (!input) {
      std::cerr << "cannot open config file "
                << vm["config"].as<std::string>() << std::endl;
      return 2;
    }
    po::store(po::parse_config_file(input, configuration), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(log_level, log_file);

  auto encoder = provenance::schema::encoding::scale_encoder_t{};
  auto storage =
      provenance::storage::make_storage<provenance::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = engine_t{encoder, storage, get_account(vm, "administrator")};

  auto exit_code = 0;
  if (command == "assign-role") {
    if (!vm.contains("role")) {
      provenance::common::critical("missing required option --role");
    }
    exit_code = print_result(engine.execute(provenance::schema::transaction_t{
        .sender = get_account(vm, "sender"),
        .payload = provenance::schema::assign_role_t{
            .account = get_account(vm, "account"),
            .role = parse_role(vm["role"].as<std::string>())}}));
  } else if (command == "create-batch") {
    exit_code = print_result(engine.execute(provenance::schema::transaction_t{
        .sender = get_account(vm, "sender"),
        .payload = provenance::schema::create_batch_t{
            .batch_id = provenance::schema::make_bytes(get_batch_id(vm))}}));
  } else if (command == "approve-batch") {
    exit_code = print_result(engine.execute(provenance::schema::transaction_t{
        .sender = get_account(vm, "sender"),
        .payload = provenance::schema::approve_batch_t{
            .batch_id = provenance::schema::make_bytes(get_batch_id(vm))}}));
  } else if (command == "certify-batch") {
    exit_code = print_result(engine.execute(provenance::schema::transaction_t{
        .sender = get_account(vm, "sender"),
        .payload = provenance::schema::certify_batch_t{
            .batch_id = provenance::schema::make_bytes(get_batch_id(vm))}}));
  } else if (command == "role") {
    std::cout << provenance::schema::to_string(
                     engine.get_role(get_account(vm, "account")))
              << std::endl;
  } else if (command == "batch-status") {
    auto batch_id = get_batch_id(vm);
    std::cout << provenance::schema::to_string(engine.get_batch_status(
                     provenance::schema::make_bytes_view(batch_id)))
              << std::endl;
  } else if (command == "batch-asset") {
    auto batch_id = get_batch_id(vm);
    std::cout << engine.get_batch_asset(
                     provenance::schema::make_bytes_view(batch_id))
              << std::endl;
  } else if (command == "certificate") {
    auto batch_id = get_batch_id(vm);
    auto asset =
        engine.get_certificate(provenance::schema::make_bytes_view(batch_id));
    if (!asset) {
      std::cout << "no certificate" << std::endl;
      exit_code = 1;
    } else {
      std::cout << "asset_id=" << asset->asset_id << " name="
                << provenance::schema::make_string(asset->asset_name)
                << " unit=" << provenance::schema::make_string(asset->unit_name)
                << " total=" << asset->total
                << " manager=" << provenance::schema::to_hex(asset->manager)
                << " created_at_call=" << asset->created_at_call << std::endl;
    }
  } else if (command == "vendor-batches") {
    auto batches = engine.get_vendor_batches(get_account(vm, "account"));
    for (const auto& batch : batches) {
      std::cout << provenance::schema::make_string(batch) << std::endl;
    }
  } else if (command == "events") {
    for (const auto& record :
         engine.events(vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>())) {
      std::cout << record.event_id << " call=" << record.call_index << " "
                << record.message << std::endl;
    }
  } else if (command == "info") {
    auto app = engine.info();
    std::cout << app.data << " " << app.app_version
              << " calls=" << app.committed_calls
              << " state_root=" << provenance::schema::to_hex(app.state_root)
              << " administrator="
              << provenance::schema::to_hex(app.administrator)
              << " application=" << provenance::schema::to_hex(app.application)
              << std::endl;
  } else {
    std::cerr << "unknown command '" << command << "'" << std::endl;
    print_help(options);
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
