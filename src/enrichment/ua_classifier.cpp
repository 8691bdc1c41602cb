#include "ua_classifier.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <utility>

namespace UAParser {
std::optional<int> get_major_version(std::string_view ua,
                                     std::string_view browser_token) {
  size_t pos = ua.find(browser_token);
  if (pos == std::string_view::npos)
    return std::nullopt;

  size_t version_start = pos + browser_token.length();
  if (version_start >= ua.length())
    return std::nullopt;

  size_t version_end = ua.find_first_not_of("0123456789", version_start);
  if (version_end == std::string_view::npos)
    version_end = ua.length();
  return Utils::string_to_number<int>(
      ua.substr(version_start, version_end - version_start));
}
} // namespace UAParser

namespace {

std::vector<std::string> lowered(std::vector<std::string> values) {
  for (auto &value : values)
    value = Utils::to_lower_copy(value);
  return values;
}

} // namespace

HeuristicUaClassifier::HeuristicUaClassifier(
    std::vector<std::string> bot_substrings)
    : bot_matcher_(lowered(std::move(bot_substrings))) {}

UaClassification
HeuristicUaClassifier::classify(std::string_view user_agent) const {
  UaClassification result;
  std::string ua = Utils::trim_copy(user_agent);
  if (ua.empty() || ua == "-")
    return result;

  if (bot_matcher_.contains_any(Utils::to_lower_copy(ua))) {
    result.ua_class = UaClass::Bot;
    return result;
  }

  // Order matters: Edge and Chrome also claim Safari, Edge also claims Chrome
  static const std::pair<const char *, const char *> browser_tokens[] = {
      {"Edge", "Edg/"},
      {"Edge", "Edge/"},
      {"Firefox", "Firefox/"},
      {"Chrome", "Chrome/"},
      {"Chrome", "CriOS/"},
  };
  for (const auto &[family, token] : browser_tokens) {
    if (auto version = UAParser::get_major_version(ua, token)) {
      result.ua_class = UaClass::Browser;
      result.browser_family = family;
      result.browser_major_version = version;
      return result;
    }
  }

  if (ua.find("Safari/") != std::string::npos) {
    result.ua_class = UaClass::Browser;
    result.browser_family = "Safari";
    result.browser_major_version = UAParser::get_major_version(ua, "Version/");
    return result;
  }

  if (ua.rfind("Mozilla/", 0) == 0 || ua.rfind("Opera/", 0) == 0)
    result.ua_class = UaClass::Browser;
  return result;
}
