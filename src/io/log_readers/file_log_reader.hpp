#ifndef FILE_LOG_READER_HPP
#define FILE_LOG_READER_HPP

#include "line_source.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Reads a file in fixed-size chunks and hands out its lines in order
class FileLogReader : public ILineSource {
public:
  // Throws SourceUnreadableError if the file cannot be opened
  explicit FileLogReader(const std::string &filepath);
  ~FileLogReader() override;

  bool next_line(RawLine &line) override;

  const std::string &path() const { return filepath_; }
  uint64_t bytes_read() const { return bytes_read_; }

private:
  // False at end of file
  bool fill_buffer();

  std::string filepath_;
  std::ifstream log_file_stream_;
  std::vector<char> chunk_;
  std::string buffer_;
  size_t buffer_position_ = 0;
  uint64_t line_number_ = 0;
  uint64_t bytes_read_ = 0;
  bool eof_ = false;
  static constexpr size_t CHUNK_SIZE = 64 * 1024;
};

// Follows a growing file for live ingestion. Only complete lines are
// returned; a trailing partial line waits for its terminator. A file that
// shrinks is treated as rotated and read again from the start.
class TailLogReader {
public:
  // Throws SourceUnreadableError if the file cannot be opened
  TailLogReader(const std::string &filepath, bool start_at_end = false);

  // Appends at most `max_lines` new complete lines to `out`. Returns how
  // many were added.
  size_t poll(std::vector<RawLine> &out, size_t max_lines = 1000);

  const std::string &path() const { return filepath_; }
  uint64_t lines_read() const { return line_number_; }

private:
  void reopen();

  std::string filepath_;
  std::ifstream stream_;
  std::string partial_line_;
  uint64_t position_ = 0;
  uint64_t line_number_ = 0;
};

#endif // FILE_LOG_READER_HPP
