#ifndef LOG_PARSER_HPP
#define LOG_PARSER_HPP

#include "config.hpp"
#include "log_record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

enum class FormatKind { Regex, Json };

// A compiled candidate format. Regex formats carry their named groups mapped
// onto ECMAScript capture indices.
struct FormatDefinition {
  std::string name;
  FormatKind kind = FormatKind::Regex;
  bool strict = true;
  std::string pattern;
  std::regex compiled;
  std::map<std::string, size_t> group_index;
};

struct TranslatedPattern {
  std::string ecmascript;
  std::map<std::string, size_t> groups;
};

// Rewrites (?P<name>...) and (?<name>...) groups into plain capture groups
// and records their indices. Throws ClassifierConfigError on bad syntax.
TranslatedPattern translate_named_groups(const std::string &pattern);

FormatDefinition compile_format_definition(const Config::FormatSpec &spec);
FormatDefinition make_json_format();

// json, extended, combined, common
std::vector<std::string> builtin_format_names();
std::optional<Config::FormatSpec> builtin_format_spec(const std::string &name);

// Formats in the configured priority order. Throws ClassifierConfigError.
std::vector<FormatDefinition>
resolve_formats(const Config::FormatsConfig &config);

using JsonFieldKeys = std::map<std::string, std::vector<std::string>>;

JsonFieldKeys default_json_field_keys();

class LogParser {
public:
  LogParser(std::vector<FormatDefinition> formats,
            JsonFieldKeys json_field_keys = default_json_field_keys(),
            size_t max_line_length = 16384);

  static LogParser from_config(const Config::FormatsConfig &formats,
                               size_t max_line_length);

  // Pure: the same line and origin always give the same result
  ParseResult parse(std::string_view line, const std::string &source_file_id,
                    uint64_t line_offset) const;

  // Name of the format the parser would commit to, if any
  std::optional<std::string> detect_format(std::string_view line) const;

  const std::vector<FormatDefinition> &formats() const { return formats_; }

private:
  struct RawFields {
    std::optional<std::string> client_ip;
    std::optional<std::string> timestamp;
    bool timestamp_is_epoch = false;
    std::optional<std::string> request;
    std::optional<std::string> method;
    std::optional<std::string> path;
    std::optional<std::string> protocol;
    std::optional<std::string> status;
    std::optional<std::string> bytes;
    std::optional<std::string> referrer;
    std::optional<std::string> user_agent;
    std::optional<std::string> request_time;
    std::map<std::string, std::string> extras;
  };

  enum class MatchOutcome { Matched, NoMatch, MalformedJson };

  MatchOutcome match_format(const FormatDefinition &format,
                            std::string_view line, RawFields &fields) const;
  MatchOutcome match_json(std::string_view line, RawFields &fields) const;

  static ParseResult build_record(RawFields &&fields,
                                  const std::string &format_name,
                                  const std::string &source_file_id,
                                  uint64_t line_offset);

  static void split_request_line(std::string_view request,
                                 std::string &out_method,
                                 std::string &out_target,
                                 std::string &out_protocol);

  ParseError classify_unmatched(std::string_view line, bool saw_bad_json) const;

  std::vector<FormatDefinition> formats_;
  JsonFieldKeys json_field_keys_;
  size_t max_line_length_;
};

#endif // LOG_PARSER_HPP
