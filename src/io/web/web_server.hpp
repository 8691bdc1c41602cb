#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "httplib.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

class LiveChannel;
class QueryService;

// JSON query API, server-sent live events and the Prometheus scrape endpoint
class WebServer {
public:
  WebServer(const Config::WebServerConfig &config,
            MetricsRegistry &metrics_registry, QueryService &query_service,
            LiveChannel &live_channel);
  ~WebServer();

  void start();
  void stop();

  bool is_running() const { return server_ && server_->is_running(); }
  void set_heartbeat_seconds(uint64_t seconds) { heartbeat_seconds_ = seconds; }

private:
  void run();
  void register_routes();
  void register_live_route();

  // Runs `handler`, turning exceptions into the JSON error envelope
  static void respond(httplib::Response &res,
                      const std::function<std::string()> &handler);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::string host_;
  int port_;
  std::atomic<uint64_t> heartbeat_seconds_;
  uint64_t started_at_ms_;
  MetricsRegistry &metrics_registry_;
  QueryService &query_service_;
  LiveChannel &live_channel_;
};

#endif // WEB_SERVER_HPP
