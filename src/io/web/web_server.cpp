#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/query_service.hpp"
#include "io/live/live_channel.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <optional>
#include <sstream>

namespace {

constexpr uint64_t DEFAULT_RANGE_MS = 24ULL * 3600 * 1000;
constexpr auto LIVE_POLL_TIMEOUT = std::chrono::milliseconds(250);

std::optional<std::string> param(const httplib::Request &req,
                                 const char *name) {
  if (!req.has_param(name))
    return std::nullopt;
  std::string value = req.get_param_value(name);
  if (value.empty())
    return std::nullopt;
  return value;
}

// Epoch milliseconds or an ISO 8601 time
uint64_t parse_time_param(const std::string &name, const std::string &value) {
  if (auto millis = Utils::string_to_number<uint64_t>(value))
    return *millis;
  if (auto parsed = Utils::parse_log_timestamp_ms(value))
    return *parsed;
  throw QueryError("Parameter '" + name + "' is not a time: " + value);
}

template <typename T>
T parse_number_param(const std::string &name, const std::string &value) {
  auto number = Utils::string_to_number<T>(value);
  if (!number)
    throw QueryError("Parameter '" + name + "' is not a number: " + value);
  return *number;
}

TimeRange parse_range(const httplib::Request &req) {
  TimeRange range;
  auto to = param(req, "to");
  range.to_ms = to ? parse_time_param("to", *to) : Utils::get_current_time_ms();
  auto from = param(req, "from");
  if (from)
    range.from_ms = parse_time_param("from", *from);
  else
    range.from_ms = range.to_ms > DEFAULT_RANGE_MS
                        ? range.to_ms - DEFAULT_RANGE_MS
                        : 0;
  return range;
}

Granularity parse_granularity(const httplib::Request &req) {
  auto value = param(req, "granularity");
  if (!value)
    return Granularity::Hour;
  auto granularity = granularity_from_string(*value);
  if (!granularity)
    throw QueryError("Unknown granularity '" + *value +
                     "' (expected hour, day, week or month)");
  return *granularity;
}

int http_status_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidQuery:
  case ErrorKind::ParseError:
    return 400;
  case ErrorKind::StorageWriteFailure:
  case ErrorKind::CapacityExceeded:
  case ErrorKind::EnrichmentLookupFailure:
    return 503;
  case ErrorKind::SourceUnreadable:
    return 404;
  case ErrorKind::ClassifierConfigError:
    return 500;
  }
  return 500;
}

bool write_chunk(httplib::DataSink &sink, const std::string &chunk) {
  return sink.write(chunk.data(), chunk.size());
}

} // namespace

WebServer::WebServer(const Config::WebServerConfig &config,
                     MetricsRegistry &metrics_registry,
                     QueryService &query_service, LiveChannel &live_channel)
    : host_(config.host), port_(config.port),
      heartbeat_seconds_(config.heartbeat_seconds),
      started_at_ms_(Utils::get_current_time_ms()),
      metrics_registry_(metrics_registry), query_service_(query_service),
      live_channel_(live_channel) {
  server_ = std::make_unique<httplib::Server>();
  register_routes();
  register_live_route();
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::respond(httplib::Response &res,
                        const std::function<std::string()> &handler) {
  try {
    res.set_content(handler(), "application/json");
  } catch (const SentinelError &e) {
    res.status = http_status_for(e.kind());
    res.set_content(JsonFormatter::dump(JsonFormatter::error_to_json_object(e)),
                    "application/json");
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Request failed (" << error_kind_to_string(e.kind())
                           << "): " << e.what());
  } catch (const std::exception &e) {
    res.status = 500;
    res.set_content(JsonFormatter::dump(JsonFormatter::error_to_json_object(
                        "Internal", "Internal server error")),
                    "application/json");
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Unhandled error while serving request: " << e.what());
  }
}

void WebServer::register_routes() {
  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    res.set_content(metrics_registry_.serialize(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
    respond(res, [this] {
      nlohmann::json j;
      j["status"] = "ok";
      j["uptime_seconds"] =
          (Utils::get_current_time_ms() - started_at_ms_) / 1000;
      j["live_subscribers"] = live_channel_.subscriber_count();
      return JsonFormatter::dump(j);
    });
  });

  server_->Get("/api/v1/metrics", [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] {
      auto series =
          query_service_.metrics(parse_range(req), parse_granularity(req));
      nlohmann::json j = nlohmann::json::array();
      for (const auto &bucket : series)
        j.push_back(JsonFormatter::bucket_to_json_object(bucket));
      return JsonFormatter::dump(j);
    });
  });

  server_->Get("/api/v1/summary", [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] {
      return JsonFormatter::dump(JsonFormatter::summary_to_json_object(
          query_service_.summary(parse_range(req))));
    });
  });

  server_->Get("/api/v1/top", [this](const httplib::Request &req,
                                     httplib::Response &res) {
    respond(res, [&] {
      auto dimension_name = param(req, "dimension");
      if (!dimension_name)
        throw QueryError("Parameter 'dimension' is required");
      auto dimension = top_dimension_from_string(*dimension_name);
      if (!dimension)
        throw QueryError("Unknown dimension '" + *dimension_name +
                         "' (expected ip, endpoint, user_agent or status)");
      auto limit = param(req, "limit");
      size_t n = limit ? parse_number_param<size_t>("limit", *limit) : 10;

      nlohmann::json entries = nlohmann::json::array();
      for (const auto &entry :
           query_service_.top(*dimension, n, parse_range(req)))
        entries.push_back(JsonFormatter::top_entry_to_json_object(entry));
      nlohmann::json j;
      j["dimension"] = top_dimension_to_string(*dimension);
      j["entries"] = entries;
      return JsonFormatter::dump(j);
    });
  });

  server_->Get("/api/v1/alerts", [this](const httplib::Request &req,
                                        httplib::Response &res) {
    respond(res, [&] {
      AlertFilter filter;
      if (auto type = param(req, "type")) {
        filter.attack_type = attack_type_from_string(*type);
        if (!filter.attack_type)
          throw QueryError("Unknown attack type '" + *type + "'");
      }
      filter.client_ip = param(req, "ip");
      if (auto min = param(req, "min_confidence"))
        filter.min_confidence = parse_number_param<double>("min_confidence",
                                                           *min);
      auto limit = param(req, "limit");
      size_t n = limit ? parse_number_param<size_t>("limit", *limit) : 100;

      nlohmann::json j = nlohmann::json::array();
      for (const auto &alert :
           query_service_.alerts(parse_range(req), n, filter))
        j.push_back(JsonFormatter::alert_to_json_object(alert));
      return JsonFormatter::dump(j);
    });
  });

  server_->Get("/api/v1/records", [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] {
      RecordFilter filter;
      filter.client_ip = param(req, "ip");
      if (auto status = param(req, "status"))
        filter.status_code = parse_number_param<int>("status", *status);
      filter.endpoint_contains = param(req, "endpoint");
      filter.method = param(req, "method");

      PageRequest page;
      if (auto number = param(req, "page"))
        page.page = parse_number_param<size_t>("page", *number);
      if (auto size = param(req, "page_size"))
        page.page_size = parse_number_param<size_t>("page_size", *size);

      return JsonFormatter::dump(JsonFormatter::record_page_to_json_object(
          query_service_.records(parse_range(req), filter, page)));
    });
  });

  server_->Get("/api/v1/ingest/summaries", [this](const httplib::Request &,
                                                  httplib::Response &res) {
    respond(res, [this] {
      nlohmann::json j = nlohmann::json::array();
      for (const auto &summary : query_service_.batch_summaries())
        j.push_back(JsonFormatter::batch_summary_to_json_object(summary));
      return JsonFormatter::dump(j);
    });
  });

  server_->Get("/api/v1/integrity", [this](const httplib::Request &,
                                           httplib::Response &res) {
    respond(res, [this] {
      nlohmann::json j = nlohmann::json::array();
      for (const auto &stamp : query_service_.integrity_stamps())
        j.push_back(JsonFormatter::stamp_to_json_object(stamp));
      return JsonFormatter::dump(j);
    });
  });
}

void WebServer::register_live_route() {
  server_->Get("/api/v1/live", [this](const httplib::Request &req,
                                      httplib::Response &res) {
    auto subscription = live_channel_.subscribe();
    LOG(LogLevel::INFO, LogComponent::IO_WEB,
        "Live subscriber " << subscription->id() << " connected from "
                           << req.remote_addr);
    auto last_write = std::make_shared<std::chrono::steady_clock::time_point>(
        std::chrono::steady_clock::now());

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, last_write](size_t, httplib::DataSink &sink) {
          if (shutdown_flag_) {
            sink.done();
            return true;
          }

          auto event = subscription->next(LIVE_POLL_TIMEOUT);
          auto now = std::chrono::steady_clock::now();
          if (event) {
            std::ostringstream chunk;
            chunk << "id: " << event->sequence << "\n"
                  << "event: " << live_event_type_to_string(event->type)
                  << "\n"
                  << "data: "
                  << JsonFormatter::dump(
                         JsonFormatter::live_event_to_json_object(*event))
                  << "\n\n";
            *last_write = now;
            return write_chunk(sink, chunk.str());
          }

          if (subscription->is_closed()) {
            nlohmann::json reason = {
                {"reason", disconnect_reason_to_string(
                               subscription->disconnect_reason())}};
            write_chunk(sink, "event: disconnect\ndata: " +
                                  JsonFormatter::dump(reason) + "\n\n");
            sink.done();
            return true;
          }

          auto heartbeat = std::chrono::seconds(heartbeat_seconds_.load());
          if (now - *last_write >= heartbeat) {
            *last_write = now;
            return write_chunk(sink, ": heartbeat\n\n");
          }
          return true;
        },
        [this, subscription](bool) {
          live_channel_.unsubscribe(subscription);
          LOG(LogLevel::INFO, LogComponent::IO_WEB,
              "Live subscriber " << subscription->id() << " left ("
                                 << disconnect_reason_to_string(
                                        subscription->disconnect_reason())
                                 << ")");
        });
  });
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running
  shutdown_flag_ = false;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped");
  }
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_))
    if (!shutdown_flag_)
      LOG(LogLevel::FATAL, LogComponent::IO_WEB,
          "Web server failed to listen on " << host_ << ":" << port_);
}
