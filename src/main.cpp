#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <atomic>
#include <chrono>
#include <chronicle/demo/workflows.hpp>
#include <chronicle/execution/engine.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <string>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void report(const chronicle::execution::engine& engine,
            const std::string& workflow_id,
            const chronicle::schema::run_result_t& result) {
  auto record = engine.describe(workflow_id);
  if (const auto* completed =
          std::get_if<chronicle::schema::completed_t>(&result);
      completed != nullptr && record.has_value()) {
    spdlog::info("Workflow '{}' completed: {}", workflow_id,
                 chronicle::demo::format_output(record->workflow_type,
                                                completed->output));
    return;
  }
  spdlog::info("Workflow '{}': {}", workflow_id,
               chronicle::schema::to_string(result));
}

void print_history(const chronicle::execution::engine& engine,
                   const std::string& workflow_id) {
  auto record = engine.describe(workflow_id);
  if (!record.has_value()) {
    spdlog::warn("Workflow '{}' does not exist", workflow_id);
    return;
  }
  std::cout << workflow_id << " [" << record->workflow_type << "] "
            << chronicle::schema::to_string(record->status) << std::endl;
  for (const auto& entry : record->history) {
    std::cout << "  #" << entry.sequence << " "
              << chronicle::schema::to_string(entry.kind) << " '"
              << entry.step_name << "' "
              << chronicle::schema::to_string(entry.status);
    if (entry.output.has_value()) {
      std::cout << " -> " << chronicle::schema::to_hex(*entry.output);
    }
    if (!entry.error.empty()) {
      std::cout << " error: " << entry.error;
    }
    std::cout << std::endl;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "chronicled.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "chronicled", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto config_path = std::string{};
  auto start_id = std::string{};
  auto workflow_type = std::string{};
  auto args = std::string{};
  auto signal_id = std::string{};
  auto signal_name = std::string{};
  auto payload = std::string{};
  auto cancel_id = std::string{};
  auto history_id = std::string{};
  auto persist_attempts = uint32_t{};
  auto persist_backoff_ms = uint32_t{};
  auto idle_poll_ms = uint32_t{};

  auto vm = boost::program_options::variables_map{};
  auto generic = boost::program_options::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Path to an ini file with engine settings")(
      "verbose,v", "Enable verbose output");

  auto settings = boost::program_options::options_description{"Engine"};
  settings.add_options()(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "chronicle.db"),
      "RocksDB directory holding workflow records")(
      "persist-attempts",
      boost::program_options::value<uint32_t>(&persist_attempts)
          ->default_value(3),
      "Save attempts before a pass reports a persistence failure")(
      "persist-backoff-ms",
      boost::program_options::value<uint32_t>(&persist_backoff_ms)
          ->default_value(50),
      "Pause between save attempts")(
      "idle-poll-ms",
      boost::program_options::value<uint32_t>(&idle_poll_ms)
          ->default_value(500),
      "How often the daemon checks for remaining wakes");

  auto commands = boost::program_options::options_description{"Commands"};
  commands.add_options()(
      "start,s", boost::program_options::value<std::string>(&start_id),
      "Start a workflow with this id")(
      "workflow,w",
      boost::program_options::value<std::string>(&workflow_type),
      "Workflow type to start (notify, sum, reminder)")(
      "args,a", boost::program_options::value<std::string>(&args),
      "Workflow argument text")(
      "signal", boost::program_options::value<std::string>(&signal_id),
      "Deliver a signal to this workflow")(
      "signal-name",
      boost::program_options::value<std::string>(&signal_name)
          ->default_value(std::string{chronicle::demo::kInvoiceSignal}),
      "Signal name")(
      "payload", boost::program_options::value<std::string>(&payload),
      "Signal payload text")(
      "cancel", boost::program_options::value<std::string>(&cancel_id),
      "Cancel this workflow")(
      "history", boost::program_options::value<std::string>(&history_id),
      "Print the history log of this workflow")(
      "list,l", "List persisted workflows")(
      "exit-on-suspend",
      "Exit once the requested commands suspended instead of serving wakes");

  auto description = boost::program_options::options_description{"Chronicle"};
  description.add(generic).add(settings).add(commands);

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{config_path};
      if (!config) {
        spdlog::error("Cannot open config file {}", config_path);
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(config, settings), vm);
      boost::program_options::notify(vm);
    }
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    std::cout << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (vm.contains("start") && workflow_type.empty()) {
    spdlog::error("--start requires --workflow");
    return 1;
  }

  auto encoder = chronicle::schema::encoding::encoder<
      chronicle::schema::encoding::scale_encoder_tag>{};
  auto storage =
      chronicle::storage::make_storage<chronicle::storage::rocksdb_storage_tag>(
          db_path);

  auto activities = chronicle::execution::activity_registry{};
  auto workflows = chronicle::execution::workflow_registry{};
  chronicle::demo::register_demo(activities, workflows);

  const auto exit_on_suspend = vm.contains("exit-on-suspend");
  auto options = chronicle::execution::engine_options{};
  options.persist_attempts = persist_attempts;
  options.persist_backoff = std::chrono::milliseconds{persist_backoff_ms};
  options.start_scheduler = !exit_on_suspend;

  auto engine = chronicle::execution::engine{
      encoder, storage, std::move(activities), std::move(workflows), options};

  if (vm.contains("list")) {
    for (const auto& workflow_id : engine.list_workflows()) {
      auto record = engine.describe(workflow_id);
      if (record.has_value()) {
        std::cout << workflow_id << " [" << record->workflow_type << "] "
                  << chronicle::schema::to_string(record->status) << " ("
                  << record->history.size() << " step(s))" << std::endl;
      }
    }
  }
  if (vm.contains("history")) {
    print_history(engine, history_id);
  }
  const auto inspect_only = (vm.contains("list") || vm.contains("history")) &&
                            !vm.contains("start") && !vm.contains("signal") &&
                            !vm.contains("cancel");
  if (inspect_only) {
    spdlog::shutdown();
    return 0;
  }

  engine.recover();

  if (vm.contains("cancel")) {
    report(engine, cancel_id, engine.cancel_workflow(cancel_id));
  }
  if (vm.contains("start")) {
    report(engine, start_id,
           engine.start_workflow(start_id, workflow_type,
                                 chronicle::demo::encode_args(args)));
  }
  if (vm.contains("signal")) {
    report(engine, signal_id,
           engine.signal_workflow(signal_id, signal_name,
                                  chronicle::schema::make_bytes(payload)));
  }

  if (!exit_on_suspend) {
    auto poll = std::chrono::milliseconds{idle_poll_ms};
    while (!shutdown_requested() && !engine.scheduler().wait_idle(poll)) {
    }
    if (shutdown_requested()) {
      spdlog::info("Interrupted; pending wakes are re-armed on next start");
    } else {
      spdlog::info("No scheduled wakes remain");
    }
  }

  spdlog::shutdown();
  return 0;
}
