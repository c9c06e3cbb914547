#include <gtest/gtest.h>

#include "ObscuraExceptions.h"
#include "RuleModel.h"

namespace {
const char* kRuleText = R"(# customer export
handle_nulls: true
null_replacement: "N/A"
preserve_data_types: false
case_sensitive: yes
seed: 42

rule.email.strategy: hash
rule.email.algorithm: sha512
rule.email.salt: "pepper:2024"

rule.phone.strategy: redact_partial
rule.phone.visible_chars: 4
rule.phone.mask_char: *

rule.age.strategy: generalize
rule.age.bin_size: 5
rule.age.min_value: 18
rule.age.max_value: 90

rule.signup_date.strategy: generalize
rule.signup_date.granularity: quarter

column.contact_email: email
column.mobile: phone
type.Zip: location
)";
} // namespace

TEST(RuleModelTest, ParsesGlobalOptionsRulesAndMappings) {
    const RuleSet rules = RuleModel::parseRuleText(kRuleText);

    EXPECT_TRUE(rules.global.handleNulls);
    ASSERT_TRUE(rules.global.nullReplacement.has_value());
    EXPECT_EQ(*rules.global.nullReplacement, "N/A");
    EXPECT_FALSE(rules.global.preserveDataTypes);
    EXPECT_TRUE(rules.global.caseSensitive);
    EXPECT_EQ(rules.global.seed, 42u);

    ASSERT_EQ(rules.rules.size(), 4u);
    const RuleConfig& email = rules.rules.at("email");
    EXPECT_EQ(email.strategy(), StrategyKind::HASH);
    EXPECT_EQ(std::get<HashParams>(email.params).algorithm, HashAlgorithm::SHA512);
    EXPECT_EQ(std::get<HashParams>(email.params).salt, "pepper:2024");

    const auto& phone = std::get<RedactPartialParams>(rules.rules.at("phone").params);
    EXPECT_EQ(phone.visibleChars, 4u);
    EXPECT_EQ(phone.maskChar, '*');
    EXPECT_TRUE(phone.visibleFromEnd);

    const auto& age = std::get<NumericBinParams>(std::get<GeneralizeSpec>(rules.rules.at("age").params).params);
    EXPECT_DOUBLE_EQ(age.binSize, 5.0);
    EXPECT_DOUBLE_EQ(age.minValue, 18.0);
    EXPECT_DOUBLE_EQ(age.maxValue, 90.0);

    const auto& date = std::get<DateParams>(std::get<GeneralizeSpec>(rules.rules.at("signup_date").params).params);
    EXPECT_EQ(date.granularity, DateUtils::Granularity::QUARTER);

    EXPECT_EQ(rules.columnMapping.at("contact_email"), "email");
    EXPECT_EQ(rules.typeOverrides.at("zip"), SemanticType::LOCATION);
}

TEST(RuleModelTest, RuleForColumnPrefersMappingThenName) {
    const RuleSet rules = RuleModel::parseRuleText(kRuleText);
    ASSERT_NE(rules.ruleForColumn("contact_email"), nullptr);
    EXPECT_EQ(rules.ruleForColumn("contact_email")->piiType, "email");
    ASSERT_NE(rules.ruleForColumn("age"), nullptr);
    EXPECT_EQ(rules.ruleForColumn("age")->strategy(), StrategyKind::GENERALIZE);
    EXPECT_EQ(rules.ruleForColumn("customer_name"), nullptr);
}

TEST(RuleModelTest, DefaultsApplyWhenOptionsAreOmitted) {
    const RuleSet rules = RuleModel::parseRuleText("rule.ssn.strategy: redact_full\n");
    EXPECT_TRUE(rules.global.handleNulls);
    EXPECT_FALSE(rules.global.nullReplacement.has_value());
    EXPECT_TRUE(rules.global.preserveDataTypes);
    EXPECT_FALSE(rules.global.caseSensitive);
    EXPECT_EQ(std::get<RedactFullParams>(rules.rules.at("ssn").params).replacement, "[REDACTED]");

    const RuleConfig bins = RuleModel::buildRule("income", "generalize", {{"bin_size", "10"}});
    const auto& p = std::get<NumericBinParams>(std::get<GeneralizeSpec>(bins.params).params);
    EXPECT_DOUBLE_EQ(p.minValue, 0.0);
    EXPECT_DOUBLE_EQ(p.maxValue, 100.0);
}

TEST(RuleModelTest, RejectsInvalidRules) {
    using Obscura::ConfigurationException;
    EXPECT_THROW(RuleModel::buildRule("email", "encrypt", {}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("email", "hash", {{"algorithm", "sha1"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("email", "hash", {{"bin_size", "5"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "4"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "4"}, {"mask_char", "**"}}),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "-1"}, {"mask_char", "*"}}),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("age", "generalize", {}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("age", "generalize", {{"bin_size", "5"}, {"precision", "3"}}),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("age", "generalize", {{"bin_size", "0"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("age", "generalize", {{"bin_size", "5"}, {"min_value", "90"}, {"max_value", "18"}}),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("amount", "generalize", {{"bin_size", "1e-300"}, {"min_value", "0"}, {"max_value", "1"}}),
                 ConfigurationException);
    EXPECT_NO_THROW(RuleModel::buildRule("amount", "generalize", {{"bin_size", "1"}, {"min_value", "0"}, {"max_value", "1000000"}}));
    EXPECT_THROW(RuleModel::buildRule("amount", "generalize", {{"bin_size", "1"}, {"min_value", "0"}, {"max_value", "1000001"}}),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("ip", "generalize", {{"octets", "5"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("zip", "generalize", {{"precision", "0"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("dob", "generalize", {{"granularity", "decade"}}), ConfigurationException);
    EXPECT_THROW(RuleModel::buildRule("home", "generalize", {{"level", "planet"}}), ConfigurationException);
}

TEST(RuleModelTest, RejectsMalformedRuleText) {
    using Obscura::ConfigurationException;
    EXPECT_THROW(RuleModel::parseRuleText("rule.email.strategy: hash\ncolumn.mail: phone\n"), ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("rule.email.salt: x\n"), ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("rule.email.strategy: hash\nrule.email.salt: a\nrule.email.salt: b\n"),
                 ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("retention_days: 30\n"), ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("handle_nulls: maybe\n"), ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("type.zip: postcode\n"), ConfigurationException);
    EXPECT_THROW(RuleModel::parseRuleText("this line has no separator\n"), ConfigurationException);
}

TEST(RuleModelTest, ErrorsNameSourceAndLine) {
    try {
        RuleModel::parseRuleText("seed: 1\nhandle_nulls: maybe\n", "rules.conf");
        FAIL() << "expected ConfigurationException";
    } catch (const Obscura::ConfigurationException& ex) {
        EXPECT_NE(std::string(ex.what()).find("rules.conf:2"), std::string::npos) << ex.what();
    }
}

TEST(RuleModelTest, ValidateParametersRejectsHandBuiltRules) {
    RuleConfig rule;
    rule.piiType = "age";
    rule.params = GeneralizeSpec{NumericBinParams{0.0, 0.0, 100.0}};
    EXPECT_THROW(RuleModel::validateParameters(rule), Obscura::InvalidParameterError);

    rule.params = GeneralizeSpec{NumericBinParams{1e-300, 0.0, 1.0}};
    EXPECT_THROW(RuleModel::validateParameters(rule), Obscura::InvalidParameterError);

    rule.params = GeneralizeSpec{IpParams{0}};
    EXPECT_THROW(RuleModel::validateParameters(rule), Obscura::InvalidParameterError);

    rule.params = GeneralizeSpec{NumericBinParams{5.0, 0.0, 100.0}};
    EXPECT_NO_THROW(RuleModel::validateParameters(rule));
}

TEST(RuleModelTest, MissingRuleFileIsAnIoError) {
    EXPECT_THROW(RuleModel::loadRuleFile("/nonexistent/obscura/rules.conf"), Obscura::IOException);
}

TEST(RuleModelTest, DescribeRuleSummarizesParameters) {
    const RuleSet rules = RuleModel::parseRuleText(kRuleText);
    EXPECT_EQ(RuleModel::describeRule(rules.rules.at("email")), "hash(sha512)");
    EXPECT_EQ(RuleModel::describeRule(rules.rules.at("phone")), "redact_partial(4 visible, mask '*')");
    EXPECT_EQ(RuleModel::describeRule(rules.rules.at("age")), "generalize(bins of 5 over [18, 90])");
    EXPECT_EQ(RuleModel::describeRule(rules.rules.at("signup_date")), "generalize(quarter)");
    EXPECT_EQ(RuleModel::describeRule(RuleModel::buildRule("home", "generalize", {{"level", "state"}})),
              "generalize(state)");
}
