#include <gtest/gtest.h>
#include "cogmem/extraction/rule_extractor.hpp"
#include "test_helpers.hpp"

using namespace cogmem;
using cogmem::testutil::kDay0;

class RuleExtractorTest : public ::testing::Test {
protected:
    RuleExtractor extractor;
};

// ==========================================
// Extraction Tests
// ==========================================

TEST_F(RuleExtractorTest, QuantifiedStatement) {
    auto candidates = extractor.extract("我今天早上吃了3个苹果", kDay0);
    ASSERT_EQ(candidates.size(), 1u);

    const auto& c = candidates[0];
    EXPECT_EQ(c.action, "吃");
    EXPECT_EQ(c.target, "苹果");
    ASSERT_TRUE(c.quantity.has_value());
    EXPECT_DOUBLE_EQ(*c.quantity, 3.0);
    ASSERT_TRUE(c.unit.has_value());
    EXPECT_EQ(*c.unit, "个");
    EXPECT_GE(c.confidence, 0.8);
    EXPECT_EQ(c.extractor, "rule");
    EXPECT_EQ(c.timestamp_hint, to_iso8601(start_of_day(kDay0) + hours(9)));
}

TEST_F(RuleExtractorTest, ChineseNumeralsAndUnits) {
    auto candidates = extractor.extract("喝了两杯咖啡", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].action, "喝");
    EXPECT_EQ(candidates[0].target, "咖啡");
    EXPECT_DOUBLE_EQ(*candidates[0].quantity, 2.0);
    EXPECT_EQ(*candidates[0].unit, "杯");
    EXPECT_DOUBLE_EQ(candidates[0].confidence, RuleExtractor::kQuantifiedConfidence);
}

TEST_F(RuleExtractorTest, PlainVerbTargetHasLowerConfidence) {
    auto candidates = extractor.extract("我每天都喝咖啡", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].target, "咖啡");
    EXPECT_FALSE(candidates[0].quantity.has_value());
    EXPECT_DOUBLE_EQ(candidates[0].confidence, RuleExtractor::kPlainConfidence);
    EXPECT_TRUE(candidates[0].timestamp_hint.empty());
}

TEST_F(RuleExtractorTest, SurfaceFormsAreNormalized) {
    auto candidates = extractor.extract("昨天买了一本书", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].action, "购买");
    EXPECT_EQ(candidates[0].target, "书");
    EXPECT_EQ(*candidates[0].unit, "本");
}

TEST_F(RuleExtractorTest, NegationFoldsIntoAction) {
    auto candidates = extractor.extract("今天没有喝咖啡", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].action, "没喝");
    EXPECT_EQ(candidates[0].target, "咖啡");
}

TEST_F(RuleExtractorTest, NegationReachesThroughModalWords) {
    auto dislike = extractor.extract("我不喜欢喝咖啡", kDay0);
    ASSERT_EQ(dislike.size(), 1u);
    EXPECT_EQ(dislike[0].action, "不喝");
    EXPECT_EQ(dislike[0].target, "咖啡");

    auto never_again = extractor.extract("我再也不想喝咖啡了", kDay0);
    ASSERT_EQ(never_again.size(), 1u);
    EXPECT_EQ(never_again[0].action, "不喝");
    EXPECT_EQ(never_again[0].target, "咖啡");

    auto habit = extractor.extract("我每天都喝咖啡", kDay0);
    ASSERT_EQ(habit.size(), 1u);
    EXPECT_EQ(habit[0].action, "喝");

    // A negation in an earlier clause does not carry over
    auto later = extractor.extract("不累，想喝咖啡", kDay0);
    ASSERT_EQ(later.size(), 1u);
    EXPECT_EQ(later[0].action, "喝");
}

TEST_F(RuleExtractorTest, IntransitiveVerbUsesItselfAsTarget) {
    auto candidates = extractor.extract("我跑步了", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].action, "跑步");
    EXPECT_EQ(candidates[0].target, "跑步");
}

TEST_F(RuleExtractorTest, SeveralClauses) {
    auto candidates = extractor.extract("早上喝了咖啡，中午吃了面条", kDay0);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].target, "咖啡");
    EXPECT_EQ(candidates[1].action, "吃");
    EXPECT_EQ(candidates[1].target, "面条");
}

TEST_F(RuleExtractorTest, NothingToExtract) {
    EXPECT_TRUE(extractor.extract("天气不错", kDay0).empty());
    EXPECT_TRUE(extractor.extract("", kDay0).empty());
}

TEST_F(RuleExtractorTest, CustomVerb) {
    extractor.add_verb("品尝", "品尝");
    auto candidates = extractor.extract("品尝了红酒", kDay0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].action, "品尝");
    EXPECT_EQ(candidates[0].target, "红酒");
}

// ==========================================
// Number Parsing Tests
// ==========================================

TEST(RuleNumberTest, ParsesArabicAndChineseNumerals) {
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("3"), 3.0);
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("十二"), 12.0);
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("三十"), 30.0);
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("两"), 2.0);
    EXPECT_DOUBLE_EQ(*RuleExtractor::parse_number("半"), 0.5);
    EXPECT_FALSE(RuleExtractor::parse_number("abc").has_value());
    EXPECT_FALSE(RuleExtractor::parse_number("").has_value());
}

// ==========================================
// Time Hint Tests
// ==========================================

TEST(TimeHintParserTest, RelativeDaysAndClockTimes) {
    Timestamp midnight = start_of_day(kDay0);

    EXPECT_EQ(*TimeHintParser::resolve("昨天晚上8点", kDay0), midnight - days(1) + hours(20));
    EXPECT_EQ(*TimeHintParser::resolve("下午3点半", kDay0), midnight + hours(15) + 30 * 60);
    EXPECT_EQ(*TimeHintParser::resolve("前天", kDay0), kDay0 - days(2));
    EXPECT_EQ(*TimeHintParser::resolve("三天前", kDay0), kDay0 - days(3));
    EXPECT_EQ(*TimeHintParser::resolve("今天中午", kDay0), midnight + hours(12));
}

TEST(TimeHintParserTest, NoTimeExpression) {
    EXPECT_FALSE(TimeHintParser::resolve("我吃了一点东西", kDay0).has_value());
    EXPECT_FALSE(TimeHintParser::resolve("喝咖啡", kDay0).has_value());
}
