#ifndef INGESTION_PIPELINE_HPP
#define INGESTION_PIPELINE_HPP

#include "alert.hpp"
#include "config.hpp"
#include "ingest_types.hpp"
#include "log_parser.hpp"
#include "log_record.hpp"
#include "utils/bounded_queue.hpp"
#include "utils/integrity_hasher.hpp"

#include <prometheus/counter.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class AlertEmitter;
class BehavioralClassifier;
class Enricher;
class ILineSource;
class IRecordStore;
class LiveChannel;
class MetricsAggregator;
class SignatureClassifier;

// Producer/consumer pipeline: raw lines go to a parse worker chosen by
// source, records go on to shard workers chosen by client IP (commit, metrics,
// alerts) and by path (endpoint behavior). One source is parsed by one
// worker and every queue is FIFO, so a key sees a file's lines in order.
class IngestionPipeline {
public:
  // Starts the workers. Throws ClassifierConfigError when the formats or
  // rules in `config` do not compile.
  IngestionPipeline(std::shared_ptr<const Config::AppConfig> config,
                    std::shared_ptr<IRecordStore> store,
                    std::shared_ptr<MetricsAggregator> aggregator,
                    std::shared_ptr<LiveChannel> live_channel,
                    std::shared_ptr<Enricher> enricher = nullptr);
  ~IngestionPipeline();

  IngestionPipeline(const IngestionPipeline &) = delete;
  IngestionPipeline &operator=(const IngestionPipeline &) = delete;

  // Blocks while the queues are full. A file that cannot be read is reported
  // in its summary; it never throws for per-line or per-file failures.
  BatchSummary ingest_file(const std::string &path);
  std::vector<BatchSummary> ingest_files(const std::vector<std::string> &paths);
  BatchSummary ingest_batch(const std::string &source_file_id,
                            ILineSource &source);

  // Never blocks: a full queue drops the line and counts it. Returns whether
  // the line was accepted.
  bool submit_live(const std::string &source_file_id, const std::string &line,
                   uint64_t line_offset);

  // Waits for the source's accepted lines and returns its summary
  BatchSummary close_live_source(const std::string &source_file_id);

  // Follows `path` until `stop_requested` is set, then closes the source
  BatchSummary follow_file(const std::string &path,
                           const std::atomic<bool> &stop_requested);

  // Compiles the new formats and rules first; on ClassifierConfigError the
  // running configuration stays. Windows and queues are kept.
  void reconfigure(std::shared_ptr<const Config::AppConfig> config);

  // Drains everything accepted so far, then joins the workers
  void stop();
  bool is_running() const { return running_.load(); }

  std::vector<BatchSummary> batch_summaries() const;
  uint64_t live_lines_dropped() const { return live_lines_dropped_.load(); }
  uint64_t records_committed() const { return records_committed_.load(); }
  std::shared_ptr<AlertEmitter> alert_emitter() const { return emitter_; }

private:
  // Per-source bookkeeping shared by the producer and the workers
  struct SourceTracker {
    explicit SourceTracker(std::string id, bool is_live)
        : source_file_id(std::move(id)), live(is_live) {}

    void line_finished();
    void wait_until_drained();
    // Counts a rejected alert and marks `line_offset` for retry
    void alert_not_persisted(uint64_t line_offset);

    const std::string source_file_id;
    const bool live;

    std::mutex mutex;
    std::condition_variable drained_cv;
    // Pending units of work: one per accepted line, plus one for the
    // endpoint half of each parsed record
    uint64_t accepted = 0;
    uint64_t finished = 0;
    uint64_t committed = 0;
    uint64_t dropped = 0;
    BatchSummary summary;

    // Touched only by the producer
    IntegrityHasher hasher;
  };

  struct ParseTask {
    std::shared_ptr<SourceTracker> tracker;
    std::string line;
    uint64_t line_offset = 0;
  };

  enum class ShardTaskKind { Client, Endpoint };

  struct ShardTask {
    ShardTaskKind kind = ShardTaskKind::Client;
    std::shared_ptr<const LogRecord> record;
    std::vector<SignatureHit> signature_hits;
    std::shared_ptr<SourceTracker> tracker;
  };

  // Compiled per-record stages, swapped as a unit on reload
  struct Stages {
    std::shared_ptr<const LogParser> parser;
    std::shared_ptr<const SignatureClassifier> signatures;
    std::shared_ptr<const Enricher> enricher;
  };

  struct Shard {
    Shard(size_t queue_capacity, const Config::BehaviorConfig &config);
    ~Shard();

    BoundedQueue<ShardTask> queue;
    std::unique_ptr<BehavioralClassifier> classifier;
    std::atomic<uint64_t> latest_event_ms{0};
    uint64_t applied_config_version = 0;
    uint64_t events_since_sweep = 0;
    std::thread worker;
  };

  static std::shared_ptr<const Stages>
  build_stages(const Config::AppConfig &config,
               std::shared_ptr<const Enricher> enricher);

  void parse_worker_loop(size_t index);
  void shard_worker_loop(size_t index);
  void process_line(const Stages &stages, ParseTask &task);
  void handle_client_task(Shard &shard, ShardTask &task);
  void handle_endpoint_task(Shard &shard, ShardTask &task);
  void adopt_config(Shard &shard);
  void sweep(Shard &shard);

  std::shared_ptr<const Stages> current_stages() const;
  std::shared_ptr<const Config::AppConfig> current_config() const;

  // Accepts one line into the pipeline; false once the pipeline is closed
  bool accept_line(const std::shared_ptr<SourceTracker> &tracker,
                   const std::string &text, const std::string &terminator,
                   uint64_t line_offset, bool blocking);

  BatchSummary finish_source(const std::shared_ptr<SourceTracker> &tracker,
                             bool complete,
                             std::optional<StructuredError> error);
  void remember_summary(const BatchSummary &summary);

  size_t parse_queue_for(const std::string &source_file_id) const;
  size_t shard_for(const std::string &key) const;

  mutable std::mutex config_mutex_;
  std::shared_ptr<const Config::AppConfig> config_;
  std::shared_ptr<const Stages> stages_;
  std::atomic<uint64_t> config_version_{1};
  // An enricher handed to the constructor is kept across reloads
  bool enricher_injected_;

  std::shared_ptr<IRecordStore> store_;
  std::shared_ptr<MetricsAggregator> aggregator_;
  std::shared_ptr<LiveChannel> live_channel_;
  std::shared_ptr<AlertEmitter> emitter_;

  std::vector<std::unique_ptr<BoundedQueue<ParseTask>>> parse_queues_;
  std::vector<std::thread> parse_workers_;
  std::vector<std::unique_ptr<Shard>> shards_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};

  mutable std::mutex live_mutex_;
  std::map<std::string, std::shared_ptr<SourceTracker>> live_sources_;

  mutable std::mutex summaries_mutex_;
  std::deque<BatchSummary> summaries_;
  static constexpr size_t MAX_REMEMBERED_SUMMARIES = 1000;

  std::atomic<uint64_t> live_lines_dropped_{0};
  std::atomic<uint64_t> records_committed_{0};

  prometheus::Counter &lines_ingested_counter_;
  prometheus::Counter &records_committed_counter_;
  prometheus::Counter &storage_failures_counter_;
  prometheus::Counter &live_dropped_counter_;
  prometheus::Histogram &parse_stage_timer_;
  prometheus::Histogram &shard_stage_timer_;
  std::map<ParseErrorKind, prometheus::Counter *> parse_error_counters_;
};

#endif // INGESTION_PIPELINE_HPP
