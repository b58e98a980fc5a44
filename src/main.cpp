#include <atomic>
#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bootforge/common/cancellation.hpp>
#include <bootforge/common/disk_lock.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/host/static_provider.hpp>
#include <bootforge/pack/pack.hpp>
#include <bootforge/report/manager.hpp>
#include <bootforge/safety/gate.hpp>
#include <bootforge/safety/token_ledger.hpp>
#include <bootforge/schema/action_kind.hpp>
#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/workflow/engine.hpp>
#include <bootforge/workflow/loader.hpp>
#include <bootforge/workflow/registry.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr auto kExitSuccess = 0;
constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;
constexpr auto kExitCancelled = 130;

std::atomic<bool>*& cancel_flag() {
  static std::atomic<bool>* flag{};
  return flag;
}

void signal_handler(int) {
  if (auto* flag = cancel_flag()) {
    flag->store(true);
  }
}

struct usage_error final {
  std::string message;
};

struct cli_settings final {
  std::vector<std::string> arguments;
  std::string reports_dir;
  std::string state_dir;
  std::string ledger_path;
  std::string device_graph;
  std::vector<std::string> device_map;
  std::vector<std::string> force_steps;
  std::vector<std::string> confirmations;
  std::string disk;
  std::string operation;
  std::string signing_key_env;
  uint64_t chunk_size{};
  std::optional<bootforge::schema::bytes_t> signing_key;
};

/// Live host provider unless a static device graph was requested.
std::unique_ptr<bootforge::host::host_provider> make_provider(
    const cli_settings& settings) {
  if (settings.device_graph.empty()) {
    return bootforge::host::make_host_provider();
  }
  auto paths = bootforge::host::device_path_map_t{};
  for (const auto& mapping : settings.device_map) {
    auto split = mapping.find('=');
    if (split == std::string::npos || split == 0) {
      throw usage_error{"--device-map expects <disk id>=<path>, got " + mapping};
    }
    paths.emplace(mapping.substr(0, split), mapping.substr(split + 1));
  }
  return std::make_unique<bootforge::host::static_host_provider>(
      std::filesystem::path{settings.device_graph}, std::move(paths));
}

const std::string& argument(const cli_settings& settings,
                            const std::size_t index,
                            const std::string_view name) {
  if (settings.arguments.size() <= index) {
    throw usage_error{"missing " + std::string{name}};
  }
  return settings.arguments[index];
}

int report_failure(const bootforge::schema::error_t& error) {
  spdlog::error("{} ({})", error.message, bootforge::schema::to_string(error.code));
  return error.code == bootforge::schema::error_code_t::cancelled
             ? kExitCancelled
             : kExitFailure;
}

// `--force <step>` and `--confirm <step>=<token>` apply to exactly one step.
void inject_step_flags(bootforge::schema::workflow_t& workflow,
                       const cli_settings& settings) {
  auto find_step = [&](const std::string& id) -> bootforge::schema::workflow_step_t& {
    for (auto& step : workflow.steps) {
      if (step.id == id) {
        return step;
      }
    }
    throw usage_error{"workflow '" + workflow.name + "' has no step '" + id + "'"};
  };
  for (const auto& id : settings.force_steps) {
    find_step(id).params["force"] = true;
  }
  for (const auto& confirmation : settings.confirmations) {
    auto split = confirmation.find('=');
    if (split == std::string::npos || split == 0) {
      throw usage_error{"--confirm expects <step id>=<token>"};
    }
    find_step(confirmation.substr(0, split)).params["confirmation_token"] =
        confirmation.substr(split + 1);
  }
}

void print_json(const nlohmann::json& document) {
  std::cout << document.dump(2) << std::endl;
}

nlohmann::json describe_run(const bootforge::workflow::run_result& run) {
  auto document = nlohmann::json::object();
  document["run_id"] = run.run_id;
  document["status"] = bootforge::schema::to_string(run.status);
  document["steps"] = run.steps;
  if (run.report_path) {
    document["report_path"] = run.report_path->string();
  } else {
    document["report_path"] = nullptr;
  }
  if (run.error.code != bootforge::schema::error_code_t::ok) {
    document["error"] = bootforge::schema::to_string(run.error.code);
    document["message"] = run.error.message;
  }
  return document;
}

int exit_code_for(const bootforge::schema::run_status_t status) {
  switch (status) {
    case bootforge::schema::run_status_t::succeeded:
      return kExitSuccess;
    case bootforge::schema::run_status_t::cancelled:
      return kExitCancelled;
    default:
      return kExitFailure;
  }
}

/// Gate, ledger and engine wiring shared by `workflow run` and `pack run`.
class runtime final {
 public:
  explicit runtime(const cli_settings& settings)
      : provider_{make_provider(settings)},
        ledger_{settings.ledger_path},
        locks_{std::filesystem::path{settings.state_dir} / "locks"},
        gate_{*provider_, ledger_, locks_},
        registry_{bootforge::workflow::make_default_registry()},
        engine_{registry_, *provider_, gate_,
                bootforge::workflow::run_options{
                    .reports_dir = settings.reports_dir,
                    .signing_key = settings.signing_key,
                    .default_chunk_size_bytes = settings.chunk_size,
                    .progress = {}}} {}

  bootforge::workflow::workflow_engine& engine() { return engine_; }

 private:
  std::unique_ptr<bootforge::host::host_provider> provider_;
  bootforge::safety::rocksdb_token_ledger ledger_;
  bootforge::common::disk_lock_registry locks_;
  bootforge::safety::safety_gate gate_;
  bootforge::workflow::action_registry registry_;
  bootforge::workflow::workflow_engine engine_;
};

int run_devices(const cli_settings& settings) {
  auto provider = make_provider(settings);
  auto error = bootforge::schema::error_t{};
  auto graph = provider->device_graph(error);
  if (!graph) {
    return report_failure(error);
  }
  print_json(nlohmann::json(*graph));
  return kExitSuccess;
}

int run_workflow_command(const cli_settings& settings,
                         const bootforge::common::cancel_signal& cancel) {
  const auto& verb = argument(settings, 1, "workflow subcommand");
  const auto& path = argument(settings, 2, "workflow file");
  auto error = bootforge::schema::error_t{};
  auto workflow = bootforge::workflow::load_workflow(path, error);
  if (!workflow) {
    return report_failure(error);
  }

  if (verb == "validate") {
    auto registry = bootforge::workflow::make_default_registry();
    if (!bootforge::workflow::validate_workflow(*workflow, registry, error)) {
      return report_failure(error);
    }
    spdlog::info("workflow '{}' is valid ({} steps)", workflow->name,
                 workflow->steps.size());
    return kExitSuccess;
  }
  if (verb == "run") {
    inject_step_flags(*workflow, settings);
    auto context = runtime{settings};
    auto run = context.engine().run(*workflow, cancel);
    print_json(describe_run(run));
    return exit_code_for(run.status);
  }
  throw usage_error{"unknown workflow subcommand '" + verb + "'"};
}

int run_pack_command(const cli_settings& settings,
                     const bootforge::common::cancel_signal& cancel) {
  const auto& verb = argument(settings, 1, "pack subcommand");
  const auto& manifest = argument(settings, 2, "pack manifest");
  auto error = bootforge::schema::error_t{};
  auto registry = bootforge::workflow::make_default_registry();
  auto pack = bootforge::pack::load_pack(manifest, registry, error);
  if (!pack) {
    return report_failure(error);
  }

  if (verb == "validate") {
    spdlog::info("pack '{}' {} is valid", pack->manifest.name,
                 pack->manifest.version);
    return kExitSuccess;
  }
  if (verb == "run") {
    auto context = runtime{settings};
    auto result = bootforge::pack::run_pack(*pack, context.engine(), cancel);
    auto runs = nlohmann::json::array();
    for (const auto& run : result.runs) {
      runs.push_back(describe_run(run));
    }
    print_json(nlohmann::json{{"pack", pack->manifest.name},
                              {"status", bootforge::schema::to_string(result.status)},
                              {"runs", runs}});
    return exit_code_for(result.status);
  }
  if (verb == "sign" || verb == "verify") {
    if (!settings.signing_key) {
      throw usage_error{"pack " + verb + " needs a signing key in $" +
                        settings.signing_key_env};
    }
    if (verb == "sign") {
      auto path = bootforge::pack::sign_pack(*pack, *settings.signing_key, error);
      if (!path) {
        return report_failure(error);
      }
      std::cout << path->string() << std::endl;
      return kExitSuccess;
    }
    if (!bootforge::pack::verify_pack(*pack, *settings.signing_key, error)) {
      return report_failure(error);
    }
    spdlog::info("pack '{}' signature verified", pack->manifest.name);
    return kExitSuccess;
  }
  if (verb == "export") {
    const auto& output = argument(settings, 3, "output archive");
    if (!bootforge::pack::export_pack(*pack, output, error)) {
      return report_failure(error);
    }
    return kExitSuccess;
  }
  throw usage_error{"unknown pack subcommand '" + verb + "'"};
}

int run_report_command(const cli_settings& settings) {
  const auto& verb = argument(settings, 1, "report subcommand");
  const auto& path = argument(settings, 2, "report path");
  if (verb == "verify") {
    auto result = bootforge::report::verify_report(path, settings.signing_key);
    if (!result.ok) {
      spdlog::error("{}: {}", result.offending_file.value_or(path),
                    result.error.message);
      return kExitFailure;
    }
    spdlog::info("{} verified: {} files{}", path, result.files_checked,
                 result.signature_checked ? ", signature ok" : "");
    return kExitSuccess;
  }
  if (verb == "verify-tree") {
    auto result = bootforge::report::verify_tree(path, settings.signing_key);
    for (const auto& [bundle, verified] : result.reports) {
      std::cout << (verified.ok ? "ok    " : "FAIL  ") << bundle.string();
      if (!verified.ok) {
        std::cout << "  " << verified.offending_file.value_or("") << ": "
                  << verified.error.message;
      }
      std::cout << std::endl;
    }
    if (!result.ok) {
      return report_failure(result.error);
    }
    return kExitSuccess;
  }
  if (verb == "export") {
    const auto& output = argument(settings, 3, "output archive");
    auto error = bootforge::schema::error_t{};
    if (!bootforge::report::export_report(path, output, error)) {
      return report_failure(error);
    }
    return kExitSuccess;
  }
  throw usage_error{"unknown report subcommand '" + verb + "'"};
}

int run_token_command(const cli_settings& settings) {
  const auto& verb = argument(settings, 1, "token subcommand");
  if (verb != "mint") {
    throw usage_error{"unknown token subcommand '" + verb + "'"};
  }
  if (settings.disk.empty() || settings.operation.empty()) {
    throw usage_error{"token mint needs --disk and --operation"};
  }
  if (!bootforge::schema::try_from_string<bootforge::schema::action_kind_t>(
          settings.operation)) {
    throw usage_error{"unknown operation '" + settings.operation +
                      "', expected one of " +
                      bootforge::schema::join_names(
                          bootforge::schema::kActionKindMappings)};
  }
  auto ledger = bootforge::safety::rocksdb_token_ledger{settings.ledger_path};
  std::cout << bootforge::safety::mint_token(ledger, settings.disk,
                                             settings.operation)
            << std::endl;
  return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto cancel = bootforge::common::cancel_signal{};
  cancel_flag() = cancel.raw_flag();
  std::signal(SIGINT, signal_handler);

  auto settings = cli_settings{};
  auto config_file = std::string{};
  auto log_file = std::string{};

  auto general = boost::program_options::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI file with default option values")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("bootforge.log"),
      "Append the process log to this file");

  auto options = boost::program_options::options_description{"BootForge"};
  options.add_options()(
      "reports-dir",
      boost::program_options::value<std::string>(&settings.reports_dir)
          ->default_value("reports"),
      "Directory receiving evidence bundles")(
      "state-dir",
      boost::program_options::value<std::string>(&settings.state_dir)
          ->default_value(".bootforge"),
      "Directory for disk locks")(
      "ledger-path",
      boost::program_options::value<std::string>(&settings.ledger_path)
          ->default_value(".bootforge/ledger"),
      "Confirmation token ledger (RocksDB)")(
      "device-graph",
      boost::program_options::value<std::string>(&settings.device_graph),
      "Serve this device graph document instead of the live host")(
      "device-map",
      boost::program_options::value<std::vector<std::string>>(
          &settings.device_map),
      "<disk id>=<path> node for a disk of --device-graph")(
      "chunk-size",
      boost::program_options::value<uint64_t>(&settings.chunk_size)
          ->default_value(bootforge::schema::kDefaultChunkSizeBytes),
      "Default imaging chunk size in bytes")(
      "signing-key-env",
      boost::program_options::value<std::string>(&settings.signing_key_env)
          ->default_value("BOOTFORGE_SIGNING_KEY"),
      "Environment variable holding the hex signing key")(
      "force", boost::program_options::value<std::vector<std::string>>(
                   &settings.force_steps),
      "Set force on the step with this id")(
      "confirm", boost::program_options::value<std::vector<std::string>>(
                     &settings.confirmations),
      "<step id>=<token> confirmation for one step")(
      "disk", boost::program_options::value<std::string>(&settings.disk),
      "Disk id for token mint")(
      "operation",
      boost::program_options::value<std::string>(&settings.operation),
      "Action name for token mint");

  auto hidden = boost::program_options::options_description{};
  hidden.add_options()(
      "arguments",
      boost::program_options::value<std::vector<std::string>>(
          &settings.arguments),
      "Command and its arguments");
  auto positional = boost::program_options::positional_options_description{};
  positional.add("arguments", -1);

  auto all = boost::program_options::options_description{};
  all.add(general).add(options).add(hidden);
  auto visible = boost::program_options::options_description{
      "Usage: bootforge [options] <command> [args]\n\n"
      "Commands:\n"
      "  devices\n"
      "  workflow validate|run <file>\n"
      "  pack validate|run|sign|verify <manifest>\n"
      "  pack export <manifest> <out.tar.gz>\n"
      "  report verify|verify-tree <path>\n"
      "  report export <bundle> <out.tar.gz>\n"
      "  token mint --disk <id> --operation <action>\n"};
  visible.add(general).add(options);

  auto vm = boost::program_options::variables_map{};
  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .run(),
        vm);
    if (vm.contains("config")) {
      boost::program_options::store(
          boost::program_options::parse_config_file<char>(
              vm["config"].as<std::string>().c_str(), options),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n\n" << visible << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || settings.arguments.empty()) {
    std::cout << visible << std::endl;
    return vm.contains("help") ? kExitSuccess : kExitUsage;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  // Command output goes to stdout; the log stays on stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "bootforge", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_level(spdlog::get_level());
  spdlog::set_default_logger(logger);

  if (settings.chunk_size == 0) {
    spdlog::error("--chunk-size must be positive");
    spdlog::shutdown();
    return kExitUsage;
  }
  if (const auto* value = std::getenv(settings.signing_key_env.c_str());
      value != nullptr && *value != '\0') {
    settings.signing_key = bootforge::schema::try_from_hex(value);
    if (!settings.signing_key || settings.signing_key->empty()) {
      spdlog::error("${} is not a hex signing key", settings.signing_key_env);
      spdlog::shutdown();
      return kExitUsage;
    }
  }

  auto exit_code = kExitFailure;
  try {
    const auto& command = settings.arguments.front();
    if (command == "devices") {
      exit_code = run_devices(settings);
    } else if (command == "workflow") {
      exit_code = run_workflow_command(settings, cancel);
    } else if (command == "pack") {
      exit_code = run_pack_command(settings, cancel);
    } else if (command == "report") {
      exit_code = run_report_command(settings);
    } else if (command == "token") {
      exit_code = run_token_command(settings);
    } else {
      throw usage_error{"unknown command '" + command + "'"};
    }
  } catch (const usage_error& e) {
    spdlog::error("{}", e.message);
    std::cerr << visible << std::endl;
    exit_code = kExitUsage;
  }

  spdlog::shutdown();
  return exit_code;
}
