#include "analysis/metrics_aggregator.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/ingestion_pipeline.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/query_service.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/live/live_channel.hpp"
#include "io/store/memory_record_store.hpp"
#include "io/store/mongo_record_store.hpp"
#include "io/web/web_server.hpp"
#include "utils/json_formatter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
}

namespace {

struct CommandLine {
  std::string config_path = "config.ini";
  std::vector<std::string> batch_paths;
  std::string live_path;
};

void print_usage(const char *program) {
  std::cerr << "Usage: " << program
            << " <config.ini> [--batch FILE...] [--live FILE]\n"
            << "  SIGINT/SIGTERM drain and stop, SIGHUP reloads the "
               "configuration\n";
}

bool parse_command_line(int argc, char *argv[], CommandLine &out) {
  bool in_batch = false;
  bool have_config = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
      return false;
    if (arg == "--batch") {
      in_batch = true;
      continue;
    }
    if (arg == "--live") {
      if (i + 1 >= argc)
        return false;
      out.live_path = argv[++i];
      in_batch = false;
      continue;
    }
    if (in_batch)
      out.batch_paths.push_back(arg);
    else if (!have_config) {
      out.config_path = arg;
      have_config = true;
    } else
      return false;
  }
  return true;
}

std::shared_ptr<IRecordStore> make_store(const Config::StorageConfig &config) {
  if (config.backend == "mongodb") {
    auto manager = std::make_shared<MongoManager>(config);
    if (!manager->ping())
      LOG(LogLevel::WARN, LogComponent::IO_STORE,
          "MongoDB is not reachable yet; writes fail until it is");
    auto store = std::make_shared<MongoRecordStore>(manager);
    store->ensure_indexes();
    LOG(LogLevel::INFO, LogComponent::IO_STORE,
        "Using MongoDB store, database " << config.mongo_database);
    return store;
  }
  LOG(LogLevel::INFO, LogComponent::IO_STORE, "Using in-memory store");
  return std::make_shared<MemoryRecordStore>();
}

void log_summary(const BatchSummary &summary) {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Summary: " << JsonFormatter::dump(
          JsonFormatter::batch_summary_to_json_object(summary)));
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine command_line;
  if (!parse_command_line(argc, argv, command_line)) {
    print_usage(argv[0]);
    return 64;
  }

  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  try {
    config_manager.load_configuration_or_throw(command_line.config_path);
  } catch (const ClassifierConfigError &e) {
    std::cerr << "Configuration rejected: " << e.what() << "\n";
    for (const auto &detail : e.details())
      std::cerr << "  - " << detail << "\n";
    return 2;
  }
  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "log_sentinel starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  if (command_line.batch_paths.empty())
    command_line.batch_paths = current_config->batch_input_paths;
  if (command_line.live_path.empty())
    command_line.live_path = current_config->live_input_path;

  // --- Initialize Core Components ---
  std::shared_ptr<IRecordStore> store;
  try {
    store = make_store(current_config->storage);
  } catch (const StorageError &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_STORE,
        "Storage unavailable: " << e.what());
    return 1;
  }

  auto live_channel = std::make_shared<LiveChannel>(
      current_config->web_server.subscriber_queue_capacity);
  auto aggregator = std::make_shared<MetricsAggregator>(current_config->metrics);

  std::shared_ptr<IngestionPipeline> pipeline;
  try {
    pipeline = std::make_shared<IngestionPipeline>(current_config, store,
                                                   aggregator, live_channel);
  } catch (const ClassifierConfigError &e) {
    LOG(LogLevel::FATAL, LogComponent::CONFIG,
        "Classifier configuration rejected: " << e.what());
    return 2;
  }

  auto query_service = std::make_shared<QueryService>(
      store, aggregator, pipeline, current_config->web_server.max_page_size);

  std::unique_ptr<WebServer> web_server;
  if (current_config->web_server.enabled) {
    web_server = std::make_unique<WebServer>(
        current_config->web_server, MetricsRegistry::instance(),
        *query_service, *live_channel);
    web_server->start();
  }

  // --- Producers ---
  std::atomic<bool> batch_done{command_line.batch_paths.empty()};
  std::thread batch_thread;
  if (!command_line.batch_paths.empty())
    batch_thread = std::thread([&] {
      for (const auto &summary :
           pipeline->ingest_files(command_line.batch_paths))
        log_summary(summary);
      batch_done = true;
    });

  std::thread live_thread;
  if (!command_line.live_path.empty())
    live_thread = std::thread([&] {
      log_summary(pipeline->follow_file(command_line.live_path,
                                        g_shutdown_requested));
    });

  const bool serve_until_signal =
      web_server != nullptr || !command_line.live_path.empty();
  auto time_start = std::chrono::steady_clock::now();

  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from "
              << command_line.config_path << "...");
      if (config_manager.load_configuration(command_line.config_path)) {
        auto new_config = config_manager.get_config();
        try {
          pipeline->reconfigure(new_config);
          current_config = new_config;
          LogManager::instance().configure(current_config->logging);
          query_service->set_max_page_size(
              current_config->web_server.max_page_size);
          if (web_server)
            web_server->set_heartbeat_seconds(
                current_config->web_server.heartbeat_seconds);
          LOG(LogLevel::INFO, LogComponent::CONFIG,
              "All components reconfigured successfully.");
        } catch (const ClassifierConfigError &e) {
          LOG(LogLevel::ERROR, LogComponent::CONFIG,
              "Reloaded rules rejected, keeping old settings: " << e.what());
        }
      } else
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Failed to reload configuration. Keeping old settings.");
    }

    if (batch_done && !serve_until_signal)
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Processing finished or shutdown signal received.");
  g_shutdown_requested = true;

  // Draining first lets the producers see their queues close
  pipeline->stop();
  if (batch_thread.joinable())
    batch_thread.join();
  if (live_thread.joinable())
    live_thread.join();

  if (web_server)
    web_server->stop();
  live_channel->close();

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();
  LOG(LogLevel::INFO, LogComponent::CORE, "---Processing Summary---");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Records committed: " << pipeline->records_committed());
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Live lines dropped: " << pipeline->live_lines_dropped());
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Total processing time: " << duration_ms << " ms");
  LOG(LogLevel::INFO, LogComponent::CORE, "log_sentinel finished.");
  return 0;
}
