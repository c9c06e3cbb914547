#include <gtest/gtest.h>

#include "DigestUtils.h"
#include "ObscuraExceptions.h"
#include "StrategyEngine.h"

#include <cctype>
#include <set>

namespace {
// Empty strings become null cells.
DataColumn makeColumn(const std::string& name, SemanticType type, const std::vector<std::string>& values) {
    DataColumn col;
    col.name = name;
    col.type = type;
    col.values = values;
    col.missing.assign(values.size(), static_cast<uint8_t>(0));
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i].empty()) col.missing[i] = 1;
    }
    return col;
}

bool isLowerHex(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isdigit(c) && (c < 'a' || c > 'f')) return false;
    }
    return true;
}

class StrategyEngineTest : public ::testing::Test {
protected:
    GlobalConfig global;
    PseudonymContext context;
};
} // namespace

TEST(DigestUtilsTest, MatchesKnownDigests) {
    EXPECT_EQ(DigestUtils::hexDigest("abc", HashAlgorithm::SHA256),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(DigestUtils::hexDigest("abc", HashAlgorithm::MD5), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(DigestUtils::hexDigest("abc", HashAlgorithm::SHA512).size(), 128u);
    EXPECT_EQ(DigestUtils::digest64("abc"), 0xba7816bf8f01cfeaULL);
}

TEST_F(StrategyEngineTest, HashIsDeterministicSaltedAndFixedLength) {
    const DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"alice@example.com", "bob@example.com"});
    const RuleConfig rule = RuleModel::buildRule("email", "hash", {{"salt", "pepper"}});

    const auto first = StrategyEngine::apply(col, rule, global, context);
    const auto second = StrategyEngine::apply(col, rule, global, context);
    EXPECT_EQ(first.column.values, second.column.values);
    EXPECT_NE(first.column.values[0], first.column.values[1]);
    for (const auto& v : first.column.values) {
        EXPECT_EQ(v.size(), 64u);
        EXPECT_TRUE(isLowerHex(v));
    }
    EXPECT_EQ(first.column.values[0], DigestUtils::hexDigest("pepper:alice@example.com", HashAlgorithm::SHA256));
}

TEST_F(StrategyEngineTest, HashAlgorithmsProduceTheirDigestLengths) {
    const DataColumn col = makeColumn("ssn", SemanticType::CATEGORICAL, {"123-45-6789"});
    EXPECT_EQ(StrategyEngine::apply(col, RuleModel::buildRule("ssn", "hash", {{"algorithm", "sha512"}}), global, context)
                  .column.values[0].size(),
              128u);
    EXPECT_EQ(StrategyEngine::apply(col, RuleModel::buildRule("ssn", "hash", {{"algorithm", "md5"}}), global, context)
                  .column.values[0].size(),
              32u);
}

TEST_F(StrategyEngineTest, CaseSensitivityControlsHashInput) {
    const DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"Alice@Example.com", "alice@example.com"});
    const RuleConfig rule = RuleModel::buildRule("email", "hash", {});

    global.caseSensitive = false;
    const auto folded = StrategyEngine::apply(col, rule, global, context);
    EXPECT_EQ(folded.column.values[0], folded.column.values[1]);

    global.caseSensitive = true;
    const auto exact = StrategyEngine::apply(col, rule, global, context);
    EXPECT_NE(exact.column.values[0], exact.column.values[1]);
}

TEST_F(StrategyEngineTest, RedactPartialKeepsVisibleCharacters) {
    const DataColumn col = makeColumn("phone", SemanticType::CATEGORICAL, {"555-0100"});
    const auto fromEnd = StrategyEngine::apply(
        col, RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "4"}, {"mask_char", "*"}}), global, context);
    EXPECT_EQ(fromEnd.column.values[0], "****0100");

    const auto fromStart = StrategyEngine::apply(
        col,
        RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "3"}, {"mask_char", "#"}, {"visible_from", "start"}}),
        global,
        context);
    EXPECT_EQ(fromStart.column.values[0], "555#####");
}

TEST_F(StrategyEngineTest, RedactPartialRejectsValuesShorterThanVisibleChars) {
    const DataColumn col = makeColumn("phone", SemanticType::CATEGORICAL, {"555-0100", "12"});
    const RuleConfig rule = RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "4"}, {"mask_char", "*"}});
    EXPECT_THROW(StrategyEngine::apply(col, rule, global, context), Obscura::InvalidParameterError);
}

TEST_F(StrategyEngineTest, RedactPartialCountsCodePointsNotBytes) {
    const DataColumn col = makeColumn("first_name", SemanticType::CATEGORICAL, {"Zo\xC3\xAB", "J\xC3\xBCrgen"});
    const auto fromEnd = StrategyEngine::apply(
        col, RuleModel::buildRule("first_name", "redact_partial", {{"visible_chars", "1"}, {"mask_char", "*"}}), global,
        context);
    EXPECT_EQ(fromEnd.column.values[0], "**\xC3\xAB");
    EXPECT_EQ(fromEnd.column.values[1], "*****n");

    const auto fromStart = StrategyEngine::apply(
        col,
        RuleModel::buildRule("first_name", "redact_partial",
                             {{"visible_chars", "2"}, {"mask_char", "#"}, {"visible_from", "start"}}),
        global,
        context);
    EXPECT_EQ(fromStart.column.values[0], "Zo#");
    EXPECT_EQ(fromStart.column.values[1], "J\xC3\xBC####");

    // "Zoë" is three characters even though it is four bytes.
    const DataColumn shortName = makeColumn("first_name", SemanticType::CATEGORICAL, {"Zo\xC3\xAB"});
    EXPECT_NO_THROW(StrategyEngine::apply(
        shortName, RuleModel::buildRule("first_name", "redact_partial", {{"visible_chars", "3"}, {"mask_char", "*"}}),
        global, context));
    EXPECT_THROW(StrategyEngine::apply(
                     shortName,
                     RuleModel::buildRule("first_name", "redact_partial", {{"visible_chars", "4"}, {"mask_char", "*"}}),
                     global, context),
                 Obscura::InvalidParameterError);
}

TEST_F(StrategyEngineTest, RedactFullUsesReplacement) {
    const DataColumn col = makeColumn("notes", SemanticType::FREE_TEXT, {"called on monday", "vip"});
    const auto out = StrategyEngine::apply(col, RuleModel::buildRule("notes", "redact_full", {}), global, context);
    EXPECT_EQ(out.column.values[0], "[REDACTED]");
    EXPECT_EQ(out.column.values[1], "[REDACTED]");
    EXPECT_EQ(out.column.type, SemanticType::CATEGORICAL);
}

TEST_F(StrategyEngineTest, NullsPassThroughWhenHandlingIsOff) {
    global.handleNulls = false;
    const DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"a@example.com", ""});
    const auto out = StrategyEngine::apply(col, RuleModel::buildRule("email", "hash", {}), global, context);
    EXPECT_FALSE(out.column.isNull(0));
    EXPECT_TRUE(out.column.isNull(1));
    EXPECT_EQ(out.records.size(), 1u);
}

TEST_F(StrategyEngineTest, UnhandledNullsKeepTheirSourceToken) {
    global.handleNulls = false;
    DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"a@example.com", "N/A"});
    col.missing[1] = 1;
    const auto out = StrategyEngine::apply(col, RuleModel::buildRule("email", "hash", {}), global, context);
    EXPECT_TRUE(out.column.isNull(1));
    EXPECT_EQ(out.column.values[1], "N/A");
}

TEST_F(StrategyEngineTest, NullsBecomeStrategySentinels) {
    const DataColumn text = makeColumn("email", SemanticType::CATEGORICAL, {"", "a@example.com"});
    const DataColumn ages = makeColumn("age", SemanticType::NUMERIC, {"", "47"});

    const auto hashed = StrategyEngine::apply(text, RuleModel::buildRule("email", "hash", {}), global, context);
    EXPECT_EQ(hashed.column.values[0], "HASH_NULL");
    EXPECT_FALSE(hashed.column.isNull(0));
    EXPECT_EQ(hashed.records[0].flag, TransformFlag::NULL_SUBSTITUTED);

    const auto binned = StrategyEngine::apply(
        ages, RuleModel::buildRule("age", "generalize", {{"bin_size", "5"}, {"min_value", "0"}, {"max_value", "100"}}),
        global, context);
    EXPECT_EQ(binned.column.values[0], "UNKNOWN");
    EXPECT_EQ(binned.column.values[1], "45-49");

    const auto pseudo = StrategyEngine::apply(text, RuleModel::buildRule("email", "pseudonymize", {}), global, context);
    EXPECT_EQ(pseudo.column.values[0], "ANON_NULL");
}

TEST_F(StrategyEngineTest, NullReplacementOverridesSentinelAndSkipsStrategy) {
    global.nullReplacement = "N/A";
    const DataColumn col = makeColumn("phone", SemanticType::CATEGORICAL, {"", "555-0100"});
    // A null never reaches redact_partial, so visible_chars cannot fail on it.
    const auto out = StrategyEngine::apply(
        col, RuleModel::buildRule("phone", "redact_partial", {{"visible_chars", "4"}, {"mask_char", "*"}}), global, context);
    EXPECT_EQ(out.column.values[0], "N/A");
    EXPECT_EQ(out.column.values[1], "****0100");
}

TEST_F(StrategyEngineTest, GeneralizeFlagsClampedCells) {
    const DataColumn col = makeColumn("age", SemanticType::NUMERIC, {"47", "120", "-2"});
    const auto out = StrategyEngine::apply(
        col, RuleModel::buildRule("age", "generalize", {{"bin_size", "5"}, {"min_value", "0"}, {"max_value", "100"}}),
        global, context);
    EXPECT_EQ(out.column.values, (std::vector<std::string>{"45-49", "95-100", "0-4"}));
    EXPECT_EQ(out.records[0].flag, TransformFlag::NONE);
    EXPECT_EQ(out.records[1].flag, TransformFlag::CLAMPED);
    EXPECT_EQ(out.records[2].flag, TransformFlag::CLAMPED);
    EXPECT_EQ(out.column.type, SemanticType::CATEGORICAL);
}

TEST_F(StrategyEngineTest, GeneralizeOnCategoricalColumnIsUnsupported) {
    const DataColumn col = makeColumn("name", SemanticType::CATEGORICAL, {"Ada"});
    EXPECT_THROW(StrategyEngine::apply(col, RuleModel::buildRule("name", "generalize", {{"bin_size", "5"}}), global, context),
                 Obscura::UnsupportedStrategyError);
}

TEST_F(StrategyEngineTest, PseudonymsAreStableAcrossContexts) {
    const DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"ada@example.com", "bob@example.com", "ada@example.com"});
    const RuleConfig rule = RuleModel::buildRule("email", "pseudonymize", {});

    const auto first = StrategyEngine::apply(col, rule, global, context);
    PseudonymContext other;
    const auto second = StrategyEngine::apply(col, rule, global, other);

    EXPECT_EQ(first.column.values, second.column.values);
    EXPECT_EQ(first.column.values[0], first.column.values[2]);
    EXPECT_NE(first.column.values[0], first.column.values[1]);
    for (const auto& v : first.column.values) {
        EXPECT_NE(v.find('@'), std::string::npos);
        EXPECT_NE(v, "ada@example.com");
    }
    EXPECT_EQ(context.cacheSize(), 2u);
}

TEST_F(StrategyEngineTest, PseudonymSeedChangesOutput) {
    const DataColumn col = makeColumn("email", SemanticType::CATEGORICAL, {"ada@example.com"});
    const auto a = StrategyEngine::apply(col, RuleModel::buildRule("email", "pseudonymize", {{"seed", "1"}}), global, context);
    const auto b = StrategyEngine::apply(col, RuleModel::buildRule("email", "pseudonymize", {{"seed", "2"}}), global, context);
    EXPECT_NE(a.column.values[0], b.column.values[0]);
}

TEST_F(StrategyEngineTest, PhoneAndNumericPseudonymsKeepLayout) {
    const DataColumn phones = makeColumn("phone", SemanticType::CATEGORICAL, {"555-0100"});
    const std::string phone =
        StrategyEngine::apply(phones, RuleModel::buildRule("phone", "pseudonymize", {}), global, context).column.values[0];
    ASSERT_EQ(phone.size(), 8u);
    EXPECT_EQ(phone[3], '-');
    for (size_t i = 0; i < phone.size(); ++i) {
        if (i != 3) EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(phone[i]))) << phone;
    }

    const DataColumn ids = makeColumn("customer_number", SemanticType::NUMERIC, {"48213"});
    const auto numeric = StrategyEngine::apply(ids, RuleModel::buildRule("customer_number", "pseudonymize", {}), global, context);
    const std::string& v = numeric.column.values[0];
    ASSERT_EQ(v.size(), 5u);
    EXPECT_NE(v[0], '0');
    for (unsigned char c : v) EXPECT_TRUE(std::isdigit(c)) << v;
    EXPECT_EQ(numeric.column.type, SemanticType::NUMERIC);
}

TEST(PseudonymContextTest, DistinctNamesGetDistinctPseudonyms) {
    PseudonymContext context;
    std::set<std::string> pseudonyms;
    for (int i = 0; i < 300; ++i) {
        pseudonyms.insert(context.pseudonym(1337, "full_name", "customer " + std::to_string(i), PseudonymShape::NAME));
    }
    EXPECT_EQ(pseudonyms.size(), 300u);
    EXPECT_EQ(context.cacheSize(), 300u);
}

TEST(PseudonymShapeTest, AutoResolvesByPiiTypeThenColumnType) {
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "work_email", SemanticType::CATEGORICAL, true),
              PseudonymShape::EMAIL);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "phone", SemanticType::CATEGORICAL, true),
              PseudonymShape::PHONE);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "account_id", SemanticType::NUMERIC, true),
              PseudonymShape::NUMERIC);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "account_id", SemanticType::NUMERIC, false),
              PseudonymShape::TOKEN);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "account_id", SemanticType::CATEGORICAL, true),
              PseudonymShape::TOKEN);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::AUTO, "full_name", SemanticType::CATEGORICAL, true),
              PseudonymShape::NAME);
    EXPECT_EQ(PseudonymContext::resolveShape(PseudonymShape::SSN, "full_name", SemanticType::CATEGORICAL, true),
              PseudonymShape::SSN);
}

TEST(StrategyEngineDatasetTest, FailingColumnIsWithheldWhileOthersComplete) {
    TabularDataset data;
    data.addColumn(makeColumn("phone", SemanticType::CATEGORICAL, {"555-0100", "12", ""}));
    data.addColumn(makeColumn("email", SemanticType::CATEGORICAL, {"a@example.com", "b@example.com", "c@example.com"}));
    data.addColumn(makeColumn("city", SemanticType::CATEGORICAL, {"Oslo", "Lima", "Pune"}));

    const RuleSet rules = RuleModel::parseRuleText(
        "rule.phone.strategy: redact_partial\n"
        "rule.phone.visible_chars: 4\n"
        "rule.phone.mask_char: *\n"
        "rule.email.strategy: hash\n");

    PseudonymContext context;
    const AnonymizationResult result = StrategyEngine::anonymize(data, rules, context);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].column, "phone");
    EXPECT_EQ(result.errors[0].kind, "InvalidParameterError");
    EXPECT_EQ(result.stats.columnsFailed, 1u);
    EXPECT_EQ(result.stats.columnsAnonymized, 1u);
    EXPECT_EQ(result.stats.columnsProcessed, 3u);

    ASSERT_EQ(result.dataset.colCount(), 3u);
    ASSERT_EQ(result.dataset.rowCount(), 3u);
    const DataColumn& phone = result.dataset.columns()[0];
    EXPECT_EQ(phone.values[0], StrategyEngine::kWithheldValue);
    EXPECT_EQ(phone.values[1], StrategyEngine::kWithheldValue);
    EXPECT_TRUE(phone.isNull(2));

    EXPECT_EQ(result.dataset.columns()[1].values[0].size(), 64u);
    EXPECT_EQ(result.dataset.columns()[2].values, data.columns()[2].values);
}

TEST(StrategyEngineDatasetTest, ColumnMappingSharesPseudonymsAndRunsAreRepeatable) {
    TabularDataset data;
    data.addColumn(makeColumn("sender", SemanticType::CATEGORICAL, {"Ada Lovelace", "Alan Turing"}));
    data.addColumn(makeColumn("recipient", SemanticType::CATEGORICAL, {"Alan Turing", "Grace Hopper"}));

    const RuleSet rules = RuleModel::parseRuleText(
        "seed: 42\n"
        "rule.person_name.strategy: pseudonymize\n"
        "column.sender: person_name\n"
        "column.recipient: person_name\n");

    PseudonymContext first;
    const AnonymizationResult a = StrategyEngine::anonymize(data, rules, first);
    PseudonymContext second;
    const AnonymizationResult b = StrategyEngine::anonymize(data, rules, second);

    EXPECT_EQ(a.dataset.columns()[0].values[1], a.dataset.columns()[1].values[0]);
    for (size_t c = 0; c < 2; ++c) EXPECT_EQ(a.dataset.columns()[c].values, b.dataset.columns()[c].values);
    EXPECT_EQ(a.log.size(), 4u);

    std::set<std::string> distinct(a.dataset.columns()[0].values.begin(), a.dataset.columns()[0].values.end());
    distinct.insert(a.dataset.columns()[1].values.begin(), a.dataset.columns()[1].values.end());
    EXPECT_EQ(distinct.size(), 3u);
}
