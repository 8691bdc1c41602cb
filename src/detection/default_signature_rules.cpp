#include "default_signature_rules.hpp"

// Patterns run against lower-cased, whitespace-collapsed text
const std::vector<DefaultSignatureRule> &default_signature_rules() {
  static const std::vector<DefaultSignatureRule> rules = {
      // --- SQL injection ---
      {"sqli.tautology",
       AttackType::SQLInjection,
       0.85,
       false,
       R"('\s*(or|and)\s*'[^']*'\s*=\s*'|\b(or|and)\s+(\d+)\s*=\s*\d+)",
       {"or", "and"}},
      {"sqli.union_select",
       AttackType::SQLInjection,
       0.9,
       false,
       R"(\bunion(\s|/\*.*?\*/)+((all|distinct)(\s|/\*.*?\*/)+)?select\b)",
       {"union"}},
      {"sqli.comment",
       AttackType::SQLInjection,
       0.4,
       false,
       R"(('|\d)\s*(--|#|/\*))",
       {"--", "#", "/*"}},
      {"sqli.stacked_query",
       AttackType::SQLInjection,
       0.8,
       false,
       R"(;\s*(drop|delete|insert|update|create|alter|truncate|exec|shutdown)\b)",
       {";"}},
      {"sqli.time_based",
       AttackType::SQLInjection,
       0.8,
       false,
       R"(\b(sleep|benchmark|pg_sleep)\s*\(|\bwaitfor\s+delay\b)",
       {"sleep", "benchmark", "waitfor"}},
      {"sqli.quote_break",
       AttackType::SQLInjection,
       0.35,
       false,
       R"('\s*(\)|;|--|#|\bor\b|\band\b|\bunion\b))",
       {"'"}},
      {"sqli.select_from",
       AttackType::SQLInjection,
       0.6,
       false,
       R"(\bselect\b[^;]{0,100}?\bfrom\b|\binformation_schema\b)",
       {"select", "information_schema"}},

      // --- Cross-site scripting ---
      {"xss.script_tag",
       AttackType::XSS,
       0.9,
       false,
       R"(<\s*/?\s*script\b)",
       {"script"}},
      {"xss.event_handler",
       AttackType::XSS,
       0.7,
       false,
       R"(\bon(error|load|click|dblclick|mouseover|mouseout|mouseenter|focus|blur|submit|change|input|keydown|keyup|keypress|animationstart|toggle|pointerover|begin)\s*=)",
       {"on"}},
      {"xss.js_uri",
       AttackType::XSS,
       0.75,
       false,
       R"(\b(javascript|vbscript)\s*:)",
       {"script"}},
      {"xss.encoded_tag",
       AttackType::XSS,
       0.8,
       true,
       R"(%3c\s*/?\s*(script|img|svg|iframe|body|object|embed)|&lt;\s*/?\s*(script|img|svg|iframe)|\\x3c|\\u003c)",
       {"%3c", "&lt;", "\\x3c", "\\u003c"}},
      {"xss.dom_sink",
       AttackType::XSS,
       0.6,
       false,
       R"(\bdocument\.(cookie|write|domain)|\bwindow\.location|\b(eval|alert|prompt|confirm)\s*\()",
       {"document.", "window.", "eval", "alert", "prompt", "confirm"}},
      {"xss.tag_injection",
       AttackType::XSS,
       0.5,
       false,
       R"(<\s*(img|svg|iframe|body|object|embed|math|details|video|audio|marquee)\b)",
       {"<"}},

      // --- Path traversal ---
      {"traversal.dotdot",
       AttackType::PathTraversal,
       0.8,
       false,
       R"(\.\.[/\\]|[/\\]\.\.$)",
       {".."}},
      {"traversal.encoded",
       AttackType::PathTraversal,
       0.85,
       true,
       R"(%2e%2e|\.\.%2f|\.\.%5c|%2e\.|\.%2e|%c0%ae|%c0%af|%c1%9c|%252e)",
       {"%2e", "%2f", "%5c", "%c0", "%c1", "%25"}},
      {"traversal.sensitive_file",
       AttackType::PathTraversal,
       0.7,
       false,
       R"(/etc/(passwd|shadow|hosts|group)\b|/proc/self/|\bwin\.ini\b|\bboot\.ini\b|\bsystem32\b|\.ht(access|passwd)\b|/\.env\b|/\.git/|\bweb\.config\b|\bid_rsa\b)",
       {"etc/", "proc/", "win.ini", "boot.ini", "system32", ".ht", "/.env",
        "/.git", "web.config", "id_rsa"}},
  };
  return rules;
}
