#include "ingestion_pipeline.hpp"
#include "alert_emitter.hpp"
#include "analysis/metrics_aggregator.hpp"
#include "detection/behavioral_classifier.hpp"
#include "detection/signature_classifier.hpp"
#include "enrichment/enricher.hpp"
#include "errors.hpp"
#include "io/live/live_channel.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "io/store/record_store.hpp"
#include "logger.hpp"
#include "metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <variant>

namespace {

constexpr auto SHARD_IDLE_SWEEP_AFTER = std::chrono::seconds(1);

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return c == '\r' || c == ' ' || c == '\t';
  });
}

} // namespace

void IngestionPipeline::SourceTracker::line_finished() {
  std::lock_guard<std::mutex> lock(mutex);
  finished++;
  if (finished == accepted)
    drained_cv.notify_all();
}

void IngestionPipeline::SourceTracker::wait_until_drained() {
  std::unique_lock<std::mutex> lock(mutex);
  drained_cv.wait(lock, [this] { return finished == accepted; });
}

void IngestionPipeline::SourceTracker::alert_not_persisted(
    uint64_t line_offset) {
  std::lock_guard<std::mutex> lock(mutex);
  summary.alert_storage_failures++;
  auto &first = summary.first_unacknowledged_offset;
  if (!first || line_offset < *first)
    first = line_offset;
}

IngestionPipeline::Shard::Shard(size_t queue_capacity,
                                const Config::BehaviorConfig &config)
    : queue(queue_capacity),
      classifier(std::make_unique<BehavioralClassifier>(config)) {}

IngestionPipeline::Shard::~Shard() = default;

IngestionPipeline::IngestionPipeline(
    std::shared_ptr<const Config::AppConfig> config,
    std::shared_ptr<IRecordStore> store,
    std::shared_ptr<MetricsAggregator> aggregator,
    std::shared_ptr<LiveChannel> live_channel,
    std::shared_ptr<Enricher> enricher)
    : config_(std::move(config)), enricher_injected_(enricher != nullptr),
      store_(std::move(store)), aggregator_(std::move(aggregator)),
      live_channel_(std::move(live_channel)),
      lines_ingested_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_lines_ingested_total",
          "Raw lines accepted into the pipeline")),
      records_committed_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_records_committed_total",
          "Records acknowledged by the store")),
      storage_failures_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_storage_failures_total",
          "Records or alerts the store rejected")),
      live_dropped_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_live_lines_dropped_total",
          "Live lines dropped because the ingestion queue was full")),
      parse_stage_timer_(MetricsRegistry::instance().create_histogram(
          "log_sentinel_parse_stage_seconds",
          "Parse, enrich and signature latency per line")),
      shard_stage_timer_(MetricsRegistry::instance().create_histogram(
          "log_sentinel_shard_stage_seconds",
          "Behavior, commit, metrics and alert latency per record")) {
  stages_ = build_stages(*config_, std::move(enricher));

  auto &parse_errors = MetricsRegistry::instance().create_counter_family(
      "log_sentinel_parse_errors_total", "Rejected lines, by error kind");
  for (ParseErrorKind kind :
       {ParseErrorKind::UnmatchedFormat, ParseErrorKind::InvalidTimestamp,
        ParseErrorKind::InvalidStatusCode, ParseErrorKind::TruncatedLine,
        ParseErrorKind::MissingField, ParseErrorKind::InvalidFieldValue})
    parse_error_counters_[kind] =
        &parse_errors.Add({{"kind", parse_error_kind_to_string(kind)}});

  emitter_ = std::make_shared<AlertEmitter>(config_->alerting, store_,
                                            live_channel_);

  const auto &ingestion = config_->ingestion;
  for (size_t i = 0; i < ingestion.shard_count; ++i)
    shards_.push_back(std::make_unique<Shard>(ingestion.shard_queue_capacity,
                                              config_->behavior));
  for (size_t i = 0; i < ingestion.parse_workers; ++i)
    parse_queues_.push_back(
        std::make_unique<BoundedQueue<ParseTask>>(ingestion.queue_capacity));

  running_ = true;
  for (size_t i = 0; i < shards_.size(); ++i)
    shards_[i]->worker =
        std::thread(&IngestionPipeline::shard_worker_loop, this, i);
  for (size_t i = 0; i < parse_queues_.size(); ++i)
    parse_workers_.emplace_back(&IngestionPipeline::parse_worker_loop, this,
                                i);

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Ingestion pipeline started with " << parse_queues_.size()
                                         << " parse workers and "
                                         << shards_.size() << " shards");
}

IngestionPipeline::~IngestionPipeline() { stop(); }

std::shared_ptr<const IngestionPipeline::Stages>
IngestionPipeline::build_stages(const Config::AppConfig &config,
                                std::shared_ptr<const Enricher> enricher) {
  auto stages = std::make_shared<Stages>();
  stages->parser = std::make_shared<const LogParser>(LogParser::from_config(
      config.formats, config.ingestion.max_line_length));
  stages->signatures =
      std::make_shared<const SignatureClassifier>(config.signatures);
  if (enricher)
    stages->enricher = std::move(enricher);
  else
    stages->enricher = Enricher::from_config(config.enrichment);
  return stages;
}

std::shared_ptr<const IngestionPipeline::Stages>
IngestionPipeline::current_stages() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return stages_;
}

std::shared_ptr<const Config::AppConfig>
IngestionPipeline::current_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

size_t IngestionPipeline::parse_queue_for(
    const std::string &source_file_id) const {
  return Utils::fnv1a_64(source_file_id) % parse_queues_.size();
}

size_t IngestionPipeline::shard_for(const std::string &key) const {
  return Utils::fnv1a_64(key) % shards_.size();
}

bool IngestionPipeline::accept_line(
    const std::shared_ptr<SourceTracker> &tracker, const std::string &text,
    const std::string &terminator, uint64_t line_offset, bool blocking) {
  if (is_blank(text)) {
    tracker->hasher.update(text);
    tracker->hasher.update(terminator);
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->summary.lines_total++;
    tracker->summary.blank_lines++;
    return true;
  }

  {
    // Counted before the push so a fast worker cannot finish the line first
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->accepted++;
  }

  ParseTask task{tracker, text, line_offset};
  auto &queue = *parse_queues_[parse_queue_for(tracker->source_file_id)];
  bool pushed = blocking ? queue.push(std::move(task))
                         : queue.try_push(std::move(task));
  if (!pushed) {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->accepted--;
    if (tracker->finished == tracker->accepted)
      tracker->drained_cv.notify_all();
    return false;
  }

  tracker->hasher.update(text);
  tracker->hasher.update(terminator);
  lines_ingested_counter_.Increment();
  std::lock_guard<std::mutex> lock(tracker->mutex);
  tracker->summary.lines_total++;
  return true;
}

BatchSummary IngestionPipeline::ingest_file(const std::string &path) {
  std::unique_ptr<FileLogReader> reader;
  try {
    reader = std::make_unique<FileLogReader>(path);
  } catch (const SourceUnreadableError &e) {
    BatchSummary summary;
    summary.source_file_id = path;
    summary.error = StructuredError{e.kind(), e.what()};
    LOG(LogLevel::ERROR, LogComponent::PIPELINE,
        "Skipping " << path << ": " << e.what());
    remember_summary(summary);
    return summary;
  }
  return ingest_batch(path, *reader);
}

std::vector<BatchSummary>
IngestionPipeline::ingest_files(const std::vector<std::string> &paths) {
  std::vector<BatchSummary> summaries(paths.size());
  size_t concurrency = std::max<size_t>(1, parse_queues_.size());

  for (size_t begin = 0; begin < paths.size(); begin += concurrency) {
    size_t end = std::min(paths.size(), begin + concurrency);
    std::vector<std::thread> producers;
    for (size_t i = begin; i < end; ++i)
      producers.emplace_back(
          [this, &paths, &summaries, i] { summaries[i] = ingest_file(paths[i]); });
    for (auto &producer : producers)
      producer.join();
  }
  return summaries;
}

BatchSummary IngestionPipeline::ingest_batch(const std::string &source_file_id,
                                             ILineSource &source) {
  auto tracker = std::make_shared<SourceTracker>(source_file_id, false);
  tracker->summary.source_file_id = source_file_id;

  if (!running_) {
    LOG(LogLevel::WARN, LogComponent::PIPELINE,
        "Pipeline stopped, refusing " << source_file_id);
    return finish_source(
        tracker, false,
        StructuredError{ErrorKind::CapacityExceeded,
                        "Ingestion pipeline is not accepting input"});
  }

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Batch ingestion of " << source_file_id << " started");

  bool complete = true;
  std::optional<StructuredError> error;
  try {
    RawLine line;
    while (source.next_line(line)) {
      if (!accept_line(tracker, line.text, line.terminator, line.line_number,
                       true)) {
        complete = false;
        LOG(LogLevel::WARN, LogComponent::PIPELINE,
            "Shutdown interrupted " << source_file_id << " at line "
                                    << line.line_number);
        break;
      }
    }
  } catch (const SourceUnreadableError &e) {
    complete = false;
    error = StructuredError{e.kind(), e.what()};
    LOG(LogLevel::ERROR, LogComponent::PIPELINE,
        "Source " << source_file_id << " became unreadable: " << e.what());
  }

  return finish_source(tracker, complete, std::move(error));
}

BatchSummary
IngestionPipeline::finish_source(const std::shared_ptr<SourceTracker> &tracker,
                                 bool complete,
                                 std::optional<StructuredError> error) {
  tracker->wait_until_drained();

  BatchSummary summary;
  uint64_t committed;
  {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    summary = tracker->summary;
    committed = tracker->committed;
    if (tracker->dropped > 0)
      complete = false;
  }
  summary.content_hash = tracker->hasher.hex_digest();
  summary.complete = complete && !error;
  summary.error = std::move(error);

  if (tracker->hasher.bytes_hashed() > 0 || summary.lines_total > 0) {
    IntegrityStamp stamp;
    stamp.source_file_id = summary.source_file_id;
    stamp.sha256 = summary.content_hash;
    stamp.bytes_hashed = tracker->hasher.bytes_hashed();
    stamp.lines_committed = committed;
    stamp.complete = summary.complete;
    stamp.stamped_at_ms = Utils::get_current_time_ms();
    try {
      store_->put_integrity_stamp(stamp);
      LOG(LogLevel::INFO, LogComponent::INTEGRITY,
          "Stamped " << stamp.source_file_id << " sha256=" << stamp.sha256
                     << " bytes=" << stamp.bytes_hashed
                     << " complete=" << (stamp.complete ? "true" : "false"));
    } catch (const StorageError &e) {
      storage_failures_counter_.Increment();
      LOG(LogLevel::ERROR, LogComponent::INTEGRITY,
          "Could not persist integrity stamp for " << stamp.source_file_id
                                                   << ": " << e.what());
      if (!summary.error)
        summary.error = StructuredError{e.kind(), e.what()};
    }
  }

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Finished " << summary.source_file_id << ": lines=" << summary.lines_total
                  << " parsed=" << summary.parsed_ok
                  << " parse_errors=" << summary.parse_errors
                  << " storage_failures=" << summary.storage_failures);
  remember_summary(summary);
  return summary;
}

void IngestionPipeline::remember_summary(const BatchSummary &summary) {
  std::lock_guard<std::mutex> lock(summaries_mutex_);
  summaries_.push_back(summary);
  if (summaries_.size() > MAX_REMEMBERED_SUMMARIES)
    summaries_.pop_front();
}

std::vector<BatchSummary> IngestionPipeline::batch_summaries() const {
  std::lock_guard<std::mutex> lock(summaries_mutex_);
  return std::vector<BatchSummary>(summaries_.begin(), summaries_.end());
}

bool IngestionPipeline::submit_live(const std::string &source_file_id,
                                    const std::string &line,
                                    uint64_t line_offset) {
  std::shared_ptr<SourceTracker> tracker;
  {
    std::lock_guard<std::mutex> lock(live_mutex_);
    auto &slot = live_sources_[source_file_id];
    if (!slot) {
      slot = std::make_shared<SourceTracker>(source_file_id, true);
      slot->summary.source_file_id = source_file_id;
    }
    tracker = slot;
  }

  if (accept_line(tracker, line, "\n", line_offset, false))
    return true;

  live_lines_dropped_++;
  live_dropped_counter_.Increment();
  {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->dropped++;
    tracker->summary.lines_total++;
  }
  LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
      "Dropped live line " << source_file_id << ":" << line_offset
                           << " (queue full)");
  return false;
}

BatchSummary
IngestionPipeline::close_live_source(const std::string &source_file_id) {
  std::shared_ptr<SourceTracker> tracker;
  {
    std::lock_guard<std::mutex> lock(live_mutex_);
    auto it = live_sources_.find(source_file_id);
    if (it != live_sources_.end()) {
      tracker = it->second;
      live_sources_.erase(it);
    }
  }
  if (!tracker) {
    tracker = std::make_shared<SourceTracker>(source_file_id, true);
    tracker->summary.source_file_id = source_file_id;
  }
  return finish_source(tracker, true, std::nullopt);
}

BatchSummary
IngestionPipeline::follow_file(const std::string &path,
                               const std::atomic<bool> &stop_requested) {
  std::optional<StructuredError> error;
  try {
    TailLogReader reader(path);
    std::vector<RawLine> lines;
    while (!stop_requested && running_) {
      lines.clear();
      reader.poll(lines);
      for (const auto &line : lines)
        submit_live(path, line.text, line.line_number);
      if (lines.empty())
        std::this_thread::sleep_for(std::chrono::milliseconds(
            current_config()->ingestion.live_poll_interval_ms));
    }
  } catch (const SourceUnreadableError &e) {
    error = StructuredError{e.kind(), e.what()};
    LOG(LogLevel::ERROR, LogComponent::PIPELINE,
        "Live source " << path << " failed: " << e.what());
  }

  BatchSummary summary = close_live_source(path);
  if (error) {
    summary.error = error;
    summary.complete = false;
  }
  return summary;
}

void IngestionPipeline::parse_worker_loop(size_t index) {
  auto &queue = *parse_queues_[index];
  ParseTask task;
  while (queue.wait_and_pop(task)) {
    auto stages = current_stages();
    process_line(*stages, task);
    task = ParseTask{};
  }
  LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
      "Parse worker " << index << " drained");
}

void IngestionPipeline::process_line(const Stages &stages, ParseTask &task) {
  ScopedTimer timer(parse_stage_timer_);
  auto &tracker = task.tracker;

  ParseResult result = stages.parser->parse(
      task.line, tracker->source_file_id, task.line_offset);

  if (auto *error = std::get_if<ParseError>(&result)) {
    parse_error_counters_[error->kind]->Increment();
    LOG(LogLevel::DEBUG, LogComponent::PARSER,
        tracker->source_file_id << ":" << task.line_offset << " rejected ("
                                << parse_error_kind_to_string(error->kind)
                                << "): " << error->detail);
    {
      std::lock_guard<std::mutex> lock(tracker->mutex);
      tracker->summary.parse_errors++;
      tracker->summary.parse_errors_by_kind[error->kind]++;
    }
    tracker->line_finished();
    return;
  }

  LogRecord record = std::move(std::get<LogRecord>(result));
  if (stages.enricher)
    record = stages.enricher->enrich(std::move(record));
  {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->summary.parsed_ok++;
  }

  ShardTask client_task;
  client_task.kind = ShardTaskKind::Client;
  client_task.signature_hits = stages.signatures->classify(record);
  client_task.tracker = tracker;
  client_task.record = std::make_shared<const LogRecord>(std::move(record));

  ShardTask endpoint_task;
  endpoint_task.kind = ShardTaskKind::Endpoint;
  endpoint_task.record = client_task.record;
  endpoint_task.tracker = tracker;
  {
    // The client half has not finished yet, so the source cannot drain early
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->accepted++;
  }

  const LogRecord &shared = *client_task.record;
  // Shard queues close only after every parse worker has exited
  shards_[shard_for(shared.endpoint())]->queue.push(std::move(endpoint_task));
  shards_[shard_for(shared.client_ip)]->queue.push(std::move(client_task));
}

void IngestionPipeline::shard_worker_loop(size_t index) {
  Shard &shard = *shards_[index];
  while (true) {
    auto task = shard.queue.wait_and_pop_for(SHARD_IDLE_SWEEP_AFTER);
    if (!task) {
      if (shard.queue.is_closed() && shard.queue.empty())
        break;
      sweep(shard);
      continue;
    }

    adopt_config(shard);
    {
      ScopedTimer timer(shard_stage_timer_);
      if (task->kind == ShardTaskKind::Client)
        handle_client_task(shard, *task);
      else
        handle_endpoint_task(shard, *task);
    }

    uint64_t sweep_interval =
        current_config()->ingestion.sweep_interval_events;
    if (sweep_interval > 0 && ++shard.events_since_sweep >= sweep_interval)
      sweep(shard);
  }
  sweep(shard);
  LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
      "Shard " << index << " drained");
}

void IngestionPipeline::handle_client_task(Shard &shard, ShardTask &task) {
  const LogRecord &record = *task.record;
  auto &tracker = task.tracker;

  std::vector<BehaviorHit> behavior_hits =
      shard.classifier->observe_client(record);
  shard.latest_event_ms = shard.classifier->latest_event_ms();

  try {
    store_->append_record(record);
  } catch (const StorageError &e) {
    storage_failures_counter_.Increment();
    LOG(LogLevel::ERROR, LogComponent::IO_STORE,
        "Record " << record.record_id() << " not committed: " << e.what());
    {
      std::lock_guard<std::mutex> lock(tracker->mutex);
      tracker->summary.storage_failures++;
      auto &first = tracker->summary.first_unacknowledged_offset;
      if (!first || record.line_offset < *first)
        first = record.line_offset;
    }
    tracker->line_finished();
    return;
  }

  records_committed_++;
  records_committed_counter_.Increment();
  {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->committed++;
  }

  aggregator_->update(record);

  try {
    emitter_->emit(task.signature_hits, behavior_hits, record);
  } catch (const StorageError &e) {
    storage_failures_counter_.Increment();
    tracker->alert_not_persisted(record.line_offset);
    LOG(LogLevel::ERROR, LogComponent::ALERTING,
        "Alert for record " << record.record_id()
                            << " not persisted: " << e.what());
  }

  if (live_channel_)
    live_channel_->publish_record(record);
  tracker->line_finished();
}

void IngestionPipeline::handle_endpoint_task(Shard &shard, ShardTask &task) {
  const LogRecord &record = *task.record;
  std::vector<BehaviorHit> hits = shard.classifier->observe_endpoint(record);
  shard.latest_event_ms = shard.classifier->latest_event_ms();

  if (!hits.empty()) {
    try {
      emitter_->emit({}, hits, record);
    } catch (const StorageError &e) {
      storage_failures_counter_.Increment();
      task.tracker->alert_not_persisted(record.line_offset);
      LOG(LogLevel::ERROR, LogComponent::ALERTING,
          "Endpoint alert for " << record.endpoint()
                                << " not persisted: " << e.what());
    }
  }
  task.tracker->line_finished();
}

void IngestionPipeline::adopt_config(Shard &shard) {
  uint64_t version = config_version_.load();
  if (version == shard.applied_config_version)
    return;
  shard.classifier->reconfigure(current_config()->behavior);
  shard.applied_config_version = version;
}

void IngestionPipeline::sweep(Shard &shard) {
  shard.events_since_sweep = 0;
  uint64_t now = shard.classifier->latest_event_ms();
  if (now == 0)
    return;
  size_t evicted = shard.classifier->sweep(now);

  // Coalescing groups are shared; close them by the slowest shard's clock
  uint64_t oldest_clock = std::numeric_limits<uint64_t>::max();
  for (const auto &other : shards_) {
    uint64_t clock = other->latest_event_ms.load();
    if (clock > 0)
      oldest_clock = std::min(oldest_clock, clock);
  }
  if (oldest_clock != std::numeric_limits<uint64_t>::max())
    emitter_->purge_stale(oldest_clock);

  if (evicted > 0)
    LOG(LogLevel::DEBUG, LogComponent::BEHAVIOR,
        "Sweep evicted " << evicted << " idle keys, "
                         << shard.classifier->tracked_keys() << " remain");
}

void IngestionPipeline::reconfigure(
    std::shared_ptr<const Config::AppConfig> config) {
  std::shared_ptr<const Enricher> enricher;
  if (enricher_injected_)
    enricher = current_stages()->enricher;
  // Throws before anything is swapped
  auto stages = build_stages(*config, std::move(enricher));

  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    stages_ = std::move(stages);
  }
  config_version_++;
  emitter_->reconfigure(config->alerting);
  aggregator_->reconfigure(config->metrics);
  if (live_channel_)
    live_channel_->set_subscriber_queue_capacity(
        config->web_server.subscriber_queue_capacity);

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Pipeline adopted new configuration");
}

void IngestionPipeline::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false))
    return;

  LOG(LogLevel::INFO, LogComponent::PIPELINE, "Draining ingestion pipeline");
  for (auto &queue : parse_queues_)
    queue->close();
  for (auto &worker : parse_workers_)
    if (worker.joinable())
      worker.join();

  for (auto &shard : shards_)
    shard->queue.close();
  for (auto &shard : shards_)
    if (shard->worker.joinable())
      shard->worker.join();

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Ingestion pipeline stopped, " << records_committed_.load()
                                     << " records committed");
}
