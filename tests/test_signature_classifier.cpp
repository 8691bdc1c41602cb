#include "detection/signature_classifier.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace {

LogRecord make_request(const std::string &path, const std::string &query = "",
                       const std::string &user_agent = "Mozilla/5.0") {
  LogRecord record;
  record.timestamp_ms = 1672574401000;
  record.client_ip = "203.0.113.9";
  record.method = "GET";
  record.path = path;
  record.query = query;
  record.status_code = 200;
  record.user_agent = user_agent;
  record.source_file_id = "access.log";
  record.line_offset = 1;
  return record;
}

bool has_rule(const SignatureHit &hit, const std::string &id) {
  return std::find(hit.rule_ids.begin(), hit.rule_ids.end(), id) !=
         hit.rule_ids.end();
}

} // namespace

TEST(SignatureClassifierTest, DetectsEncodedTautology) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  auto hits = classifier.classify(
      make_request("/items", "id=1%27%20OR%20%271%27%3D%271"));

  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].attack_type, AttackType::SQLInjection);
  EXPECT_TRUE(has_rule(hits[0], "sqli.tautology"));
  EXPECT_GE(hits[0].confidence, 0.85);
  EXPECT_LE(hits[0].confidence, 0.99);
  EXPECT_NE(hits[0].evidence.find("query"), std::string::npos);
}

TEST(SignatureClassifierTest, DetectsDoubleEncodedUnionSelect) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  auto hits = classifier.classify(
      make_request("/search", "q=1%2520UNION%2520SELECT%2520password"));
  ASSERT_FALSE(hits.empty());
  EXPECT_EQ(hits[0].attack_type, AttackType::SQLInjection);
  EXPECT_TRUE(has_rule(hits[0], "sqli.union_select"));
}

TEST(SignatureClassifierTest, DetectsScriptTag) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  auto hits = classifier.classify(
      make_request("/comment", "text=%3Cscript%3Ealert(1)%3C/script%3E"));
  ASSERT_FALSE(hits.empty());
  auto xss = std::find_if(hits.begin(), hits.end(), [](const SignatureHit &h) {
    return h.attack_type == AttackType::XSS;
  });
  ASSERT_NE(xss, hits.end());
  EXPECT_TRUE(has_rule(*xss, "xss.script_tag"));
  EXPECT_TRUE(has_rule(*xss, "xss.encoded_tag"));
}

TEST(SignatureClassifierTest, DetectsTraversalInPath) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  auto hits = classifier.classify(make_request("/static/../../etc/passwd"));
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].attack_type, AttackType::PathTraversal);
  EXPECT_TRUE(has_rule(hits[0], "traversal.dotdot"));
  EXPECT_TRUE(has_rule(hits[0], "traversal.sensitive_file"));
  // Two rules combine above either one alone
  EXPECT_GT(hits[0].confidence, 0.8);
}

TEST(SignatureClassifierTest, ScansUserAgent) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  auto hits = classifier.classify(
      make_request("/", "", "<script>document.cookie</script>"));
  ASSERT_FALSE(hits.empty());
  EXPECT_EQ(hits[0].attack_type, AttackType::XSS);
}

TEST(SignatureClassifierTest, BenignTrafficHasNoHits) {
  SignatureClassifier classifier{Config::SignatureConfig{}};
  EXPECT_TRUE(classifier.classify(make_request("/index.html")).empty());
  EXPECT_TRUE(
      classifier.classify(make_request("/products", "category=shoes&page=2"))
          .empty());
  EXPECT_TRUE(classifier.classify(make_request("/blog/online-ordering"))
                  .empty());
}

TEST(SignatureClassifierTest, DisabledClassifierReturnsNothing) {
  Config::SignatureConfig config;
  config.enabled = false;
  SignatureClassifier classifier(config);
  EXPECT_TRUE(classifier.classify(make_request("/../../etc/passwd")).empty());
}

TEST(SignatureClassifierTest, DisabledRuleIsSkipped) {
  Config::SignatureConfig config;
  config.disabled_rules = {"traversal.sensitive_file"};
  SignatureClassifier classifier(config);
  auto hits = classifier.classify(make_request("/static/../../etc/passwd"));
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_FALSE(has_rule(hits[0], "traversal.sensitive_file"));
  EXPECT_TRUE(std::none_of(classifier.rules().begin(), classifier.rules().end(),
                           [](const SignatureRule &r) {
                             return r.id == "traversal.sensitive_file";
                           }));
}

TEST(SignatureClassifierTest, CustomRuleMatches) {
  Config::SignatureConfig config;
  Config::SignatureRuleSpec rule;
  rule.id = "custom.wp_config";
  rule.attack_type = "PathTraversal";
  rule.confidence = 0.6;
  rule.pattern = R"(wp-config\.php)";
  config.custom_rules.push_back(rule);

  SignatureClassifier classifier(config);
  auto hits = classifier.classify(make_request("/wp-config.php"));
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].rule_ids, std::vector<std::string>{"custom.wp_config"});
  EXPECT_DOUBLE_EQ(hits[0].confidence, 0.6);
}

TEST(SignatureClassifierTest, CustomRuleOverridesBuiltin) {
  Config::SignatureConfig config;
  Config::SignatureRuleSpec rule;
  rule.id = "xss.script_tag";
  rule.attack_type = "XSS";
  rule.confidence = 0.3;
  rule.pattern = "<script";
  config.custom_rules.push_back(rule);

  SignatureClassifier classifier(config);
  size_t count = std::count_if(
      classifier.rules().begin(), classifier.rules().end(),
      [](const SignatureRule &r) { return r.id == "xss.script_tag"; });
  EXPECT_EQ(count, 1u);
}

TEST(SignatureClassifierTest, InvalidCustomRuleThrows) {
  Config::SignatureConfig config;
  Config::SignatureRuleSpec rule;
  rule.id = "custom.broken";
  rule.attack_type = "SQLInjection";
  rule.confidence = 0.5;
  rule.pattern = "(unclosed";
  config.custom_rules.push_back(rule);
  EXPECT_THROW(SignatureClassifier{config}, ClassifierConfigError);

  config.custom_rules[0].pattern = "ok";
  config.custom_rules[0].attack_type = "DoS";
  EXPECT_THROW(SignatureClassifier{config}, ClassifierConfigError);
}

TEST(SignatureClassifierTest, NormalizeDecodesRepeatedly) {
  EXPECT_EQ(SignatureClassifier::normalize("%2527%2520OR", 2), "' or");
  EXPECT_EQ(SignatureClassifier::normalize("%2527", 1), "%27");
  EXPECT_EQ(SignatureClassifier::normalize("a+b", 2, true), "a b");
  EXPECT_EQ(SignatureClassifier::normalize("A \t  B", 0), "a b");
}

TEST(SignatureClassifierTest, CombineConfidences) {
  EXPECT_DOUBLE_EQ(SignatureClassifier::combine_confidences({}), 0.0);
  EXPECT_DOUBLE_EQ(SignatureClassifier::combine_confidences({0.5}), 0.5);
  EXPECT_DOUBLE_EQ(SignatureClassifier::combine_confidences({0.5, 0.5}), 0.75);
  EXPECT_DOUBLE_EQ(SignatureClassifier::combine_confidences({0.9, 0.9, 0.9}),
                   0.99);
}
