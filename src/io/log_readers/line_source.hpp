#ifndef LINE_SOURCE_HPP
#define LINE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// One physical line of a source. `text` excludes the '\n' terminator but
// keeps any '\r'; text + terminator are the exact bytes read.
struct RawLine {
  std::string text;
  std::string terminator;
  uint64_t line_number = 0; // 1-based
};

// A finite, ordered sequence of raw lines
class ILineSource {
public:
  virtual ~ILineSource() = default;

  // False at the end of the source. Throws SourceUnreadableError.
  virtual bool next_line(RawLine &line) = 0;
};

// Lines held in memory, split the same way a file would be
class StringLineSource : public ILineSource {
public:
  explicit StringLineSource(std::string content);
  explicit StringLineSource(const std::vector<std::string> &lines);

  bool next_line(RawLine &line) override;

private:
  std::string content_;
  size_t position_ = 0;
  uint64_t line_number_ = 0;
};

#endif // LINE_SOURCE_HPP
