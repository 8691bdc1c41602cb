#include "line_source.hpp"

StringLineSource::StringLineSource(std::string content)
    : content_(std::move(content)) {}

StringLineSource::StringLineSource(const std::vector<std::string> &lines) {
  for (const auto &line : lines) {
    content_ += line;
    content_.push_back('\n');
  }
}

bool StringLineSource::next_line(RawLine &line) {
  if (position_ >= content_.size())
    return false;

  size_t newline = content_.find('\n', position_);
  if (newline == std::string::npos) {
    line.text = content_.substr(position_);
    line.terminator.clear();
    position_ = content_.size();
  } else {
    line.text = content_.substr(position_, newline - position_);
    line.terminator = "\n";
    position_ = newline + 1;
  }
  line.line_number = ++line_number_;
  return true;
}
