#include "log_parser.hpp"
#include "errors.hpp"
#include "utils/utils.hpp"

#include "nlohmann/json.hpp"

#include <cctype>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// Fields every regex format must capture to yield a valid record
const char *const REQUIRED_GROUPS[] = {"client_ip", "timestamp", "status"};

constexpr const char *COMMON_PATTERN =
    R"re((?<client_ip>\S+) \S+ (?<remote_user>\S+) \[(?<timestamp>[^\]]*)\] )re"
    R"re("(?<request>[^"]*)" (?<status>\S+) (?<bytes>\S+))re";

constexpr const char *COMBINED_SUFFIX =
    R"re( "(?<referrer>[^"]*)" "(?<user_agent>[^"]*)")re";

constexpr const char *EXTENDED_SUFFIX =
    R"re( "(?<host>[^"]*)"(?: (?<request_time>\S+))?)re";

bool is_valid_group_name(std::string_view name) {
  if (name.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_')
    return false;
  for (char c : name)
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
      return false;
  return true;
}

std::string json_value_to_string(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_unsigned())
    return std::to_string(value.get<uint64_t>());
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  return value.dump();
}

std::string_view trim_line_ending(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.remove_suffix(1);
  return line;
}

ParseError make_error(ParseErrorKind kind, std::string detail,
                      const std::string &format_name) {
  ParseError error;
  error.kind = kind;
  error.detail = std::move(detail);
  error.format_name = format_name;
  return error;
}

} // namespace

TranslatedPattern translate_named_groups(const std::string &pattern) {
  TranslatedPattern out;
  out.ecmascript.reserve(pattern.size());
  size_t group_count = 0;
  bool in_class = false;

  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];

    if (c == '\\') {
      out.ecmascript.push_back(c);
      if (i + 1 < pattern.size())
        out.ecmascript.push_back(pattern[++i]);
      continue;
    }

    if (in_class) {
      if (c == ']')
        in_class = false;
      out.ecmascript.push_back(c);
      continue;
    }

    if (c == '[') {
      in_class = true;
      out.ecmascript.push_back(c);
      // A leading ']' (after an optional '^') is a literal
      if (i + 1 < pattern.size() && pattern[i + 1] == '^')
        out.ecmascript.push_back(pattern[++i]);
      if (i + 1 < pattern.size() && pattern[i + 1] == ']')
        out.ecmascript.push_back(pattern[++i]);
      continue;
    }

    if (c == '(') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '?') {
        size_t name_start = std::string::npos;
        if (i + 3 < pattern.size() && pattern[i + 2] == 'P' &&
            pattern[i + 3] == '<')
          name_start = i + 4;
        else if (i + 3 < pattern.size() && pattern[i + 2] == '<' &&
                 pattern[i + 3] != '=' && pattern[i + 3] != '!')
          name_start = i + 3;

        if (name_start != std::string::npos) {
          size_t close = pattern.find('>', name_start);
          if (close == std::string::npos)
            throw ClassifierConfigError("Unterminated group name in pattern: " +
                                        pattern);
          std::string name = pattern.substr(name_start, close - name_start);
          if (!is_valid_group_name(name))
            throw ClassifierConfigError("Invalid group name '" + name +
                                        "' in pattern: " + pattern);
          ++group_count;
          if (!out.groups.emplace(name, group_count).second)
            throw ClassifierConfigError("Duplicate group name '" + name +
                                        "' in pattern: " + pattern);
          out.ecmascript.push_back('(');
          i = close;
          continue;
        }
        // Non-capturing group or lookahead; not counted
        out.ecmascript.push_back(c);
        continue;
      }
      ++group_count;
    }
    out.ecmascript.push_back(c);
  }
  return out;
}

FormatDefinition compile_format_definition(const Config::FormatSpec &spec) {
  FormatDefinition def;
  def.name = spec.name;
  def.kind = FormatKind::Regex;
  def.strict = spec.strict;
  def.pattern = spec.pattern;

  TranslatedPattern translated = translate_named_groups(spec.pattern);
  try {
    def.compiled = std::regex(translated.ecmascript,
                              std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error &e) {
    throw ClassifierConfigError("Format '" + spec.name +
                                "' pattern does not compile: " + e.what());
  }
  def.group_index = std::move(translated.groups);

  for (const char *required : REQUIRED_GROUPS)
    if (def.group_index.count(required) == 0)
      throw ClassifierConfigError("Format '" + spec.name +
                                  "' must capture a '" + required + "' group");
  if (def.group_index.count("request") == 0 &&
      def.group_index.count("path") == 0)
    throw ClassifierConfigError("Format '" + spec.name +
                                "' must capture a 'request' or 'path' group");
  return def;
}

FormatDefinition make_json_format() {
  FormatDefinition def;
  def.name = "json";
  def.kind = FormatKind::Json;
  def.strict = true;
  return def;
}

std::vector<std::string> builtin_format_names() {
  return {"json", "extended", "combined", "common"};
}

std::optional<Config::FormatSpec> builtin_format_spec(const std::string &name) {
  Config::FormatSpec spec;
  spec.name = name;
  spec.strict = true;
  if (name == "common")
    spec.pattern = COMMON_PATTERN;
  else if (name == "combined")
    spec.pattern = std::string(COMMON_PATTERN) + COMBINED_SUFFIX;
  else if (name == "extended")
    spec.pattern =
        std::string(COMMON_PATTERN) + COMBINED_SUFFIX + EXTENDED_SUFFIX;
  else
    return std::nullopt;
  return spec;
}

std::vector<FormatDefinition>
resolve_formats(const Config::FormatsConfig &config) {
  std::vector<FormatDefinition> formats;
  std::set<std::string> seen;

  auto add_format = [&](const std::string &name) {
    if (!seen.insert(name).second)
      return;
    auto custom = config.custom_formats.find(name);
    if (custom != config.custom_formats.end()) {
      formats.push_back(compile_format_definition(custom->second));
    } else if (name == "json") {
      formats.push_back(make_json_format());
    } else if (auto spec = builtin_format_spec(name)) {
      formats.push_back(compile_format_definition(*spec));
    } else {
      throw ClassifierConfigError("Unknown log format '" + name +
                                  "' in format priority");
    }
  };

  for (const auto &name : config.priority)
    add_format(name);
  // Declared but unlisted formats are tried last
  for (const auto &[name, spec] : config.custom_formats)
    add_format(name);

  return formats;
}

JsonFieldKeys default_json_field_keys() {
  return {
      {"timestamp",
       {"time_iso8601", "time_local", "timestamp", "@timestamp", "time",
        "msec"}},
      {"client_ip", {"remote_addr", "client_ip", "ip"}},
      {"request", {"request"}},
      {"method", {"request_method", "method"}},
      {"path", {"request_uri", "uri", "path"}},
      {"protocol", {"server_protocol", "protocol"}},
      {"status", {"status", "status_code"}},
      {"bytes", {"body_bytes_sent", "bytes_sent", "bytes"}},
      {"referrer", {"http_referer", "referrer", "referer"}},
      {"user_agent", {"http_user_agent", "user_agent"}},
      {"request_time", {"request_time"}},
  };
}

LogParser::LogParser(std::vector<FormatDefinition> formats,
                     JsonFieldKeys json_field_keys, size_t max_line_length)
    : formats_(std::move(formats)), json_field_keys_(std::move(json_field_keys)),
      max_line_length_(max_line_length) {}

LogParser LogParser::from_config(const Config::FormatsConfig &formats,
                                 size_t max_line_length) {
  JsonFieldKeys keys = default_json_field_keys();
  for (const auto &[field, overrides] : formats.json_field_keys)
    if (!overrides.empty())
      keys[field] = overrides;
  return LogParser(resolve_formats(formats), std::move(keys), max_line_length);
}

ParseResult LogParser::parse(std::string_view line,
                             const std::string &source_file_id,
                             uint64_t line_offset) const {
  line = trim_line_ending(line);
  if (line.size() > max_line_length_)
    return make_error(ParseErrorKind::TruncatedLine,
                      "line exceeds " + std::to_string(max_line_length_) +
                          " bytes",
                      "");

  bool saw_bad_json = false;
  for (const auto &format : formats_) {
    RawFields fields;
    MatchOutcome outcome = match_format(format, line, fields);
    if (outcome == MatchOutcome::Matched)
      return build_record(std::move(fields), format.name, source_file_id,
                          line_offset);
    if (outcome == MatchOutcome::MalformedJson)
      saw_bad_json = true;
  }
  return classify_unmatched(line, saw_bad_json);
}

std::optional<std::string>
LogParser::detect_format(std::string_view line) const {
  line = trim_line_ending(line);
  if (line.size() > max_line_length_)
    return std::nullopt;
  for (const auto &format : formats_) {
    RawFields fields;
    if (match_format(format, line, fields) == MatchOutcome::Matched)
      return format.name;
  }
  return std::nullopt;
}

LogParser::MatchOutcome LogParser::match_format(const FormatDefinition &format,
                                                std::string_view line,
                                                RawFields &fields) const {
  if (format.kind == FormatKind::Json)
    return match_json(line, fields);

  std::match_results<std::string_view::const_iterator> match;
  bool matched =
      format.strict
          ? std::regex_match(line.begin(), line.end(), match, format.compiled)
          : std::regex_search(line.begin(), line.end(), match, format.compiled,
                              std::regex_constants::match_continuous);
  if (!matched)
    return MatchOutcome::NoMatch;

  for (const auto &[name, index] : format.group_index) {
    if (index >= match.size() || !match[index].matched)
      continue;
    std::string value = match[index].str();

    if (name == "client_ip")
      fields.client_ip = std::move(value);
    else if (name == "timestamp")
      fields.timestamp = std::move(value);
    else if (name == "request")
      fields.request = std::move(value);
    else if (name == "method")
      fields.method = std::move(value);
    else if (name == "path")
      fields.path = std::move(value);
    else if (name == "protocol")
      fields.protocol = std::move(value);
    else if (name == "status")
      fields.status = std::move(value);
    else if (name == "bytes")
      fields.bytes = std::move(value);
    else if (name == "referrer")
      fields.referrer = std::move(value);
    else if (name == "user_agent")
      fields.user_agent = std::move(value);
    else if (name == "request_time")
      fields.request_time = std::move(value);
    else if (!value.empty() && value != "-")
      fields.extras[name] = std::move(value);
  }
  return MatchOutcome::Matched;
}

LogParser::MatchOutcome LogParser::match_json(std::string_view line,
                                              RawFields &fields) const {
  if (line.empty() || line.front() != '{')
    return MatchOutcome::NoMatch;

  nlohmann::json doc =
      nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
  if (doc.is_discarded())
    return MatchOutcome::MalformedJson;
  if (!doc.is_object())
    return MatchOutcome::NoMatch;

  std::set<std::string> consumed;
  auto take = [&](const std::string &field,
                  std::optional<std::string> &out) -> std::string {
    auto keys_it = json_field_keys_.find(field);
    if (keys_it == json_field_keys_.end())
      return "";
    for (const auto &key : keys_it->second) {
      auto it = doc.find(key);
      if (it == doc.end() || it->is_null())
        continue;
      out = json_value_to_string(*it);
      consumed.insert(key);
      return key;
    }
    return "";
  };

  std::string timestamp_key = take("timestamp", fields.timestamp);
  if (!timestamp_key.empty())
    fields.timestamp_is_epoch =
        doc[timestamp_key].is_number() || timestamp_key == "msec";

  take("client_ip", fields.client_ip);
  take("request", fields.request);
  take("method", fields.method);
  take("path", fields.path);
  take("protocol", fields.protocol);
  take("status", fields.status);
  take("bytes", fields.bytes);
  take("referrer", fields.referrer);
  take("user_agent", fields.user_agent);
  take("request_time", fields.request_time);

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (consumed.count(it.key()) || it->is_null())
      continue;
    fields.extras[it.key()] = json_value_to_string(*it);
  }
  return MatchOutcome::Matched;
}

void LogParser::split_request_line(std::string_view request,
                                   std::string &out_method,
                                   std::string &out_target,
                                   std::string &out_protocol) {
  out_method.clear();
  out_target.clear();
  out_protocol.clear();
  if (request.empty() || request == "-")
    return;

  size_t method_end = request.find(' ');
  if (method_end == std::string_view::npos) {
    out_method = std::string(request);
    return;
  }
  out_method = std::string(request.substr(0, method_end));

  size_t protocol_start = request.rfind(' ');
  if (protocol_start == method_end) {
    // HTTP/0.9 style request line without a protocol
    out_target = std::string(request.substr(method_end + 1));
    return;
  }
  out_protocol = std::string(request.substr(protocol_start + 1));
  out_target = std::string(
      request.substr(method_end + 1, protocol_start - (method_end + 1)));
}

ParseResult LogParser::build_record(RawFields &&fields,
                                    const std::string &format_name,
                                    const std::string &source_file_id,
                                    uint64_t line_offset) {
  LogRecord record;
  record.format_name = format_name;
  record.source_file_id = source_file_id;
  record.line_offset = line_offset;

  // Mandatory: client address
  if (!fields.client_ip || fields.client_ip->empty() ||
      *fields.client_ip == "-")
    return make_error(ParseErrorKind::MissingField, "client_ip is missing",
                      format_name);
  if (!Utils::is_valid_ip_address(*fields.client_ip))
    return make_error(ParseErrorKind::InvalidFieldValue,
                      "client_ip '" + *fields.client_ip +
                          "' is not an IP address",
                      format_name);
  record.client_ip = std::move(*fields.client_ip);

  // Mandatory: timestamp
  if (!fields.timestamp || fields.timestamp->empty() ||
      *fields.timestamp == "-")
    return make_error(ParseErrorKind::MissingField, "timestamp is missing",
                      format_name);
  auto timestamp = fields.timestamp_is_epoch
                       ? Utils::parse_epoch_seconds_ms(*fields.timestamp)
                       : Utils::parse_log_timestamp_ms(*fields.timestamp);
  if (!timestamp)
    return make_error(ParseErrorKind::InvalidTimestamp,
                      "cannot parse timestamp '" + *fields.timestamp + "'",
                      format_name);
  record.timestamp_ms = *timestamp;

  // Mandatory: status code
  if (!fields.status || fields.status->empty())
    return make_error(ParseErrorKind::MissingField, "status is missing",
                      format_name);
  auto status = Utils::string_to_number<int>(*fields.status);
  if (!status || *status < 100 || *status > 599)
    return make_error(ParseErrorKind::InvalidStatusCode,
                      "status '" + *fields.status + "' is not in 100-599",
                      format_name);
  record.status_code = *status;

  // Request line or its separate parts
  std::string target;
  if (fields.request) {
    split_request_line(*fields.request, record.method, target,
                       record.protocol_version);
  } else {
    record.method = fields.method.value_or("");
    target = fields.path.value_or("");
    record.protocol_version = fields.protocol.value_or("");
  }

  size_t query_pos = target.find('?');
  std::string_view target_view(target);
  std::string_view raw_path = target_view.substr(0, query_pos);
  size_t fragment_pos = raw_path.find('#');
  if (fragment_pos != std::string_view::npos)
    raw_path = raw_path.substr(0, fragment_pos);
  record.path = Utils::url_decode(raw_path);
  if (query_pos != std::string::npos) {
    std::string_view query = target_view.substr(query_pos + 1);
    record.query = std::string(query.substr(0, query.find('#')));
  }

  // "-" is the CLF spelling of zero bytes
  if (fields.bytes && !fields.bytes->empty() && *fields.bytes != "-") {
    auto bytes = Utils::string_to_number<uint64_t>(*fields.bytes);
    if (!bytes)
      return make_error(ParseErrorKind::InvalidFieldValue,
                        "bytes '" + *fields.bytes +
                            "' is not a non-negative integer",
                        format_name);
    record.bytes_sent = *bytes;
  }

  if (fields.request_time && !fields.request_time->empty() &&
      *fields.request_time != "-") {
    auto seconds = Utils::string_to_number<double>(*fields.request_time);
    if (!seconds || *seconds < 0.0)
      return make_error(ParseErrorKind::InvalidFieldValue,
                        "request_time '" + *fields.request_time +
                            "' is not a non-negative number",
                        format_name);
    record.response_time_ms = *seconds * 1000.0;
  }

  record.referrer = fields.referrer.value_or("");
  record.user_agent = fields.user_agent.value_or("");
  record.extra_fields = std::move(fields.extras);
  return record;
}

ParseError LogParser::classify_unmatched(std::string_view line,
                                         bool saw_bad_json) const {
  if (line.empty())
    return make_error(ParseErrorKind::UnmatchedFormat, "empty line", "");

  if (saw_bad_json || line.front() == '{') {
    if (line.back() != '}')
      return make_error(ParseErrorKind::TruncatedLine,
                        "JSON object is not closed", "");
    return make_error(ParseErrorKind::UnmatchedFormat,
                      "line is not a valid JSON object", "");
  }

  size_t quotes = 0;
  for (size_t i = 0; i < line.size(); ++i)
    if (line[i] == '"' && (i == 0 || line[i - 1] != '\\'))
      ++quotes;
  if (quotes % 2 != 0)
    return make_error(ParseErrorKind::TruncatedLine,
                      "unbalanced quotes suggest a cut line", "");

  size_t open_bracket = line.find('[');
  if (open_bracket != std::string_view::npos &&
      line.find(']', open_bracket) == std::string_view::npos)
    return make_error(ParseErrorKind::TruncatedLine,
                      "timestamp bracket is not closed", "");

  return make_error(ParseErrorKind::UnmatchedFormat,
                    "no configured format matches", "");
}
