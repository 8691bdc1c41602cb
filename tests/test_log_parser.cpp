#include "core/log_parser.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

LogParser default_parser() {
  return LogParser::from_config(Config::FormatsConfig{}, 16384);
}

const LogRecord &as_record(const ParseResult &result) {
  EXPECT_TRUE(std::holds_alternative<LogRecord>(result))
      << "parse failed: "
      << (std::holds_alternative<ParseError>(result)
              ? std::get<ParseError>(result).detail
              : "");
  return std::get<LogRecord>(result);
}

} // namespace

TEST(LogParserTest, ParsesCombinedLine) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(203.0.113.5 - alice [01/Jan/2023:12:00:01 +0000] "GET /index.html?x=1 HTTP/1.1" 200 512 "https://example.com/" "Mozilla/5.0 (X11; Linux x86_64) Firefox/115.0")",
      "access.log", 1);
  ASSERT_TRUE(std::holds_alternative<LogRecord>(result));
  const LogRecord &record = as_record(result);

  EXPECT_EQ(record.format_name, "combined");
  EXPECT_EQ(record.client_ip, "203.0.113.5");
  EXPECT_EQ(record.timestamp_ms, 1672574401000u);
  EXPECT_EQ(record.method, "GET");
  EXPECT_EQ(record.path, "/index.html");
  EXPECT_EQ(record.query, "x=1");
  EXPECT_EQ(record.protocol_version, "HTTP/1.1");
  EXPECT_EQ(record.status_code, 200);
  EXPECT_EQ(record.bytes_sent, 512u);
  EXPECT_EQ(record.referrer, "https://example.com/");
  EXPECT_EQ(record.user_agent,
            "Mozilla/5.0 (X11; Linux x86_64) Firefox/115.0");
  EXPECT_EQ(record.record_id(), "access.log:1");
  EXPECT_FALSE(record.enrichment.has_value());
}

TEST(LogParserTest, ParsesCommonLineWithDashBytes) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(198.51.100.7 - - [01/Jan/2023:12:00:01 +0000] "HEAD / HTTP/1.0" 304 -)",
      "access.log", 2);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.format_name, "common");
  EXPECT_EQ(record.bytes_sent, 0u);
  EXPECT_EQ(record.status_code, 304);
  EXPECT_EQ(record.endpoint(), "/");
}

TEST(LogParserTest, ParsesExtendedLineWithRequestTime) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(10.0.0.1 - - [01/Jan/2023:12:00:01 +0000] "POST /api/login HTTP/1.1" 401 64 "-" "curl/8.0" "api.example.com" 0.125)",
      "access.log", 3);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.format_name, "extended");
  ASSERT_TRUE(record.response_time_ms.has_value());
  EXPECT_DOUBLE_EQ(*record.response_time_ms, 125.0);
  ASSERT_EQ(record.extra_fields.count("host"), 1u);
  EXPECT_EQ(record.extra_fields.at("host"), "api.example.com");
}

TEST(LogParserTest, ParsesJsonLineWithExtras) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"({"time_iso8601":"2023-01-01T12:00:01+00:00","remote_addr":"2001:db8::1","request":"GET /search?q=a+b HTTP/2.0","status":200,"body_bytes_sent":1024,"http_user_agent":"Googlebot/2.1","request_id":"abc123"})",
      "nginx.json", 10);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.format_name, "json");
  EXPECT_EQ(record.client_ip, "2001:db8::1");
  EXPECT_EQ(record.path, "/search");
  EXPECT_EQ(record.query, "q=a+b");
  EXPECT_EQ(record.bytes_sent, 1024u);
  EXPECT_EQ(record.user_agent, "Googlebot/2.1");
  ASSERT_EQ(record.extra_fields.count("request_id"), 1u);
  EXPECT_EQ(record.extra_fields.at("request_id"), "abc123");
}

TEST(LogParserTest, JsonEpochTimestamp) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"({"msec":"1672574401.250","remote_addr":"10.1.1.1","uri":"/a","status":"404"})",
      "nginx.json", 1);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.timestamp_ms, 1672574401250u);
  EXPECT_EQ(record.status_code, 404);
  EXPECT_EQ(record.path, "/a");
}

TEST(LogParserTest, KeepsQueryUndecoded) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(203.0.113.9 - - [01/Jan/2023:12:00:01 +0000] "GET /items?id=1%27%20OR%20%271%27=%271 HTTP/1.1" 200 10 "-" "sqlmap/1.7")",
      "access.log", 4);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.query, "id=1%27%20OR%20%271%27=%271");
}

TEST(LogParserTest, DecodesPath) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(203.0.113.9 - - [01/Jan/2023:12:00:01 +0000] "GET /a%20b/..%2Fetc HTTP/1.1" 200 10)",
      "access.log", 5);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.path, "/a b/../etc");
}

TEST(LogParserTest, ReportsInvalidStatusCode) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(203.0.113.5 - - [01/Jan/2023:12:00:01 +0000] "GET / HTTP/1.1" 999 10)",
      "access.log", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind,
            ParseErrorKind::InvalidStatusCode);
  EXPECT_EQ(std::get<ParseError>(result).format_name, "common");
}

TEST(LogParserTest, ReportsInvalidTimestamp) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(203.0.113.5 - - [99/Jan/2023:12:00:01 +0000] "GET / HTTP/1.1" 200 10)",
      "access.log", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind,
            ParseErrorKind::InvalidTimestamp);
}

TEST(LogParserTest, ReportsInvalidClientAddress) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      R"(not-an-ip - - [01/Jan/2023:12:00:01 +0000] "GET / HTTP/1.1" 200 10)",
      "access.log", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind,
            ParseErrorKind::InvalidFieldValue);
}

TEST(LogParserTest, ReportsMissingJsonField) {
  LogParser parser = default_parser();
  auto result = parser.parse(R"({"remote_addr":"10.0.0.1","status":200})",
                             "nginx.json", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind, ParseErrorKind::MissingField);
}

TEST(LogParserTest, ReportsTruncatedLines) {
  LogParser parser = default_parser();
  auto cut_json = parser.parse(R"({"remote_addr":"10.0.0.1","sta)", "x", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(cut_json));
  EXPECT_EQ(std::get<ParseError>(cut_json).kind, ParseErrorKind::TruncatedLine);

  auto cut_clf = parser.parse(
      R"(203.0.113.5 - - [01/Jan/2023:12:00:01 +0000] "GET /very/long/pa)", "x",
      2);
  ASSERT_TRUE(std::holds_alternative<ParseError>(cut_clf));
  EXPECT_EQ(std::get<ParseError>(cut_clf).kind, ParseErrorKind::TruncatedLine);
}

TEST(LogParserTest, ReportsUnmatchedFormat) {
  LogParser parser = default_parser();
  auto result = parser.parse("this is not an access log line", "x", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind,
            ParseErrorKind::UnmatchedFormat);
}

TEST(LogParserTest, RejectsOverlongLine) {
  LogParser parser = LogParser::from_config(Config::FormatsConfig{}, 64);
  std::string line(200, 'a');
  auto result = parser.parse(line, "x", 1);
  ASSERT_TRUE(std::holds_alternative<ParseError>(result));
  EXPECT_EQ(std::get<ParseError>(result).kind, ParseErrorKind::TruncatedLine);
}

TEST(LogParserTest, StripsLineEndings) {
  LogParser parser = default_parser();
  auto result = parser.parse(
      "198.51.100.7 - - [01/Jan/2023:12:00:01 +0000] \"GET / HTTP/1.0\" 200 1\r\n",
      "x", 1);
  EXPECT_EQ(as_record(result).bytes_sent, 1u);
}

TEST(LogParserTest, ParseIsDeterministic) {
  LogParser parser = default_parser();
  const char *line =
      R"(198.51.100.7 - - [01/Jan/2023:12:00:01 +0000] "GET /x HTTP/1.0" 200 1)";
  auto first = parser.parse(line, "x", 7);
  auto second = parser.parse(line, "x", 7);
  EXPECT_TRUE(as_record(first) == as_record(second));
}

TEST(LogParserTest, CustomFormatPriority) {
  Config::FormatsConfig formats;
  formats.priority = {"pipe"};
  Config::FormatSpec spec;
  spec.name = "pipe";
  spec.strict = true;
  spec.pattern =
      R"((?P<timestamp>[^|]+)\|(?P<client_ip>[^|]+)\|(?P<method>[A-Z]+)\|(?P<path>[^|]+)\|(?P<status>\d+)\|(?P<tenant>[^|]*))";
  formats.custom_formats["pipe"] = spec;

  LogParser parser = LogParser::from_config(formats, 16384);
  auto result = parser.parse(
      "2023-01-01T12:00:01Z|192.0.2.44|DELETE|/api/item/7|204|acme", "pipe.log",
      1);
  const LogRecord &record = as_record(result);
  EXPECT_EQ(record.format_name, "pipe");
  EXPECT_EQ(record.method, "DELETE");
  EXPECT_EQ(record.status_code, 204);
  EXPECT_EQ(record.extra_fields.at("tenant"), "acme");
  EXPECT_EQ(parser.detect_format("2023-01-01T12:00:01Z|192.0.2.44|GET|/|200|"),
            std::optional<std::string>("pipe"));
}

TEST(LogParserTest, TranslatesNamedGroups) {
  TranslatedPattern translated =
      translate_named_groups(R"((?:x)(?P<a>\d)([(])(?<b>.))");
  EXPECT_EQ(translated.ecmascript, R"((?:x)(\d)([(])(.))");
  EXPECT_EQ(translated.groups.at("a"), 1u);
  EXPECT_EQ(translated.groups.at("b"), 3u);
  EXPECT_THROW(translate_named_groups("(?P<bad name>x)"),
               ClassifierConfigError);
  EXPECT_THROW(translate_named_groups("(?P<a>x)(?P<a>y)"),
               ClassifierConfigError);
}
