#include "file_log_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"

#include <filesystem>
#include <system_error>

FileLogReader::FileLogReader(const std::string &filepath)
    : filepath_(filepath), chunk_(CHUNK_SIZE) {
  log_file_stream_.open(filepath, std::ios::in | std::ios::binary);
  if (!log_file_stream_.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open log source file: " << filepath);
    throw SourceUnreadableError("Failed to open log source file: " +
                                filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened log file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileLogReader closed " << filepath_ << ". Total lines read: "
                              << line_number_);
}

bool FileLogReader::fill_buffer() {
  static prometheus::Histogram &chunk_read_timer =
      MetricsRegistry::instance().create_histogram(
          "log_sentinel_reader_chunk_read_seconds",
          "Latency of reading one chunk from a file source");
  ScopedTimer timer(chunk_read_timer);

  if (eof_)
    return false;

  log_file_stream_.read(chunk_.data(), static_cast<std::streamsize>(CHUNK_SIZE));
  std::streamsize got = log_file_stream_.gcount();
  if (log_file_stream_.bad())
    throw SourceUnreadableError("Read error on " + filepath_ + " after " +
                                std::to_string(bytes_read_) + " bytes");
  if (log_file_stream_.eof())
    eof_ = true;
  if (got <= 0)
    return false;

  buffer_.erase(0, buffer_position_);
  buffer_position_ = 0;
  buffer_.append(chunk_.data(), static_cast<size_t>(got));
  bytes_read_ += static_cast<uint64_t>(got);
  return true;
}

bool FileLogReader::next_line(RawLine &line) {
  while (true) {
    size_t newline = buffer_.find('\n', buffer_position_);
    if (newline != std::string::npos) {
      line.text.assign(buffer_, buffer_position_, newline - buffer_position_);
      line.terminator = "\n";
      line.line_number = ++line_number_;
      buffer_position_ = newline + 1;
      return true;
    }
    if (!fill_buffer())
      break;
  }

  // Last line without a terminator
  if (buffer_position_ < buffer_.size()) {
    line.text.assign(buffer_, buffer_position_, std::string::npos);
    line.terminator.clear();
    line.line_number = ++line_number_;
    buffer_position_ = buffer_.size();
    return true;
  }
  return false;
}

TailLogReader::TailLogReader(const std::string &filepath, bool start_at_end)
    : filepath_(filepath) {
  reopen();
  if (start_at_end) {
    std::error_code ec;
    auto size = std::filesystem::file_size(filepath_, ec);
    if (!ec) {
      position_ = static_cast<uint64_t>(size);
      stream_.seekg(static_cast<std::streamoff>(position_));
    }
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Tailing " << filepath_ << " from byte " << position_);
}

void TailLogReader::reopen() {
  if (stream_.is_open())
    stream_.close();
  stream_.clear();
  stream_.open(filepath_, std::ios::in | std::ios::binary);
  if (!stream_.is_open())
    throw SourceUnreadableError("Failed to open live source: " + filepath_);
  position_ = 0;
  partial_line_.clear();
}

size_t TailLogReader::poll(std::vector<RawLine> &out, size_t max_lines) {
  std::error_code ec;
  auto size = std::filesystem::file_size(filepath_, ec);
  if (ec)
    throw SourceUnreadableError("Live source disappeared: " + filepath_ +
                                " (" + ec.message() + ")");
  if (static_cast<uint64_t>(size) < position_) {
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Live source " << filepath_ << " shrank, reading from the start");
    reopen();
  }

  size_t added = 0;
  std::string line;
  while (added < max_lines && std::getline(stream_, line)) {
    if (stream_.eof()) {
      // No terminator yet
      partial_line_ += line;
      position_ += line.size();
      break;
    }
    position_ += line.size() + 1;
    RawLine raw;
    raw.text = partial_line_ + line;
    raw.terminator = "\n";
    raw.line_number = ++line_number_;
    partial_line_.clear();
    out.push_back(std::move(raw));
    ++added;
  }

  // Clear the eof state so the next poll sees appended data
  if (stream_.eof())
    stream_.clear();
  return added;
}
