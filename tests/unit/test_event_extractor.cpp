#include <gtest/gtest.h>
#include "cogmem/extraction/event_extractor.hpp"
#include "test_helpers.hpp"

using namespace cogmem;
using cogmem::testutil::FakeInferenceProvider;
using cogmem::testutil::kDay0;

// ==========================================
// Extractor Selection Tests
// ==========================================

TEST(EventExtractorTest, RuleOnlyWithoutProvider) {
    EventExtractor extractor(nullptr);
    auto outcome = extractor.extract("alice", "我今天早上吃了3个苹果", "", "raw_1", kDay0);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.events.size(), 1u);
    EXPECT_EQ(outcome.extractor_used, "rule");
    EXPECT_FALSE(outcome.used_fallback);

    const Event& e = outcome.events[0];
    EXPECT_EQ(e.user_id, "alice");
    EXPECT_EQ(e.source_reference, "raw_1");
    EXPECT_EQ(e.timestamp, start_of_day(kDay0) + hours(9));
    EXPECT_NO_THROW(e.validate());
}

TEST(EventExtractorTest, InferenceResultsAreClampedAndTagged) {
    FakeInferenceProvider provider(
        R"(```json
{"events": [{"action": "喝", "target": "咖啡", "quantity": 2, "unit": "杯", "confidence": 1.7}]}
```)");
    EventExtractor extractor(&provider);
    auto outcome = extractor.extract("alice", "今天喝了两杯咖啡", "", "raw_1", kDay0);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.events.size(), 1u);
    EXPECT_EQ(outcome.extractor_used, "llm:fake");
    EXPECT_FALSE(outcome.used_fallback);
    EXPECT_DOUBLE_EQ(outcome.events[0].confidence, 1.0);
    EXPECT_EQ(outcome.events[0].extractor, "llm:fake");
    EXPECT_EQ(provider.calls, 1);
}

TEST(EventExtractorTest, FallsBackToRulesWhenInferenceIsDown) {
    FakeInferenceProvider provider("", false);
    EventExtractor extractor(&provider);
    auto outcome = extractor.extract("alice", "我喝了咖啡", "", "raw_1", kDay0);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.used_fallback);
    EXPECT_EQ(outcome.extractor_used, "rule");
    EXPECT_FALSE(outcome.error_message.empty());
    ASSERT_EQ(outcome.events.size(), 1u);
    EXPECT_EQ(outcome.events[0].target, "咖啡");
}

TEST(EventExtractorTest, FallsBackOnUnparseableOutput) {
    FakeInferenceProvider provider("Sorry, I can't help with that.");
    EventExtractor extractor(&provider);
    auto outcome = extractor.extract("alice", "我喝了咖啡", "", "raw_1", kDay0);

    EXPECT_TRUE(outcome.used_fallback);
    EXPECT_EQ(outcome.extractor_used, "rule");
    EXPECT_EQ(outcome.events.size(), 1u);
}

TEST(EventExtractorTest, BlankCandidatesAreDropped) {
    FakeInferenceProvider provider(R"({"events": [{"action": "喝", "target": "  "}]})");
    EventExtractor extractor(&provider);
    auto outcome = extractor.extract("alice", "我喝了咖啡", "", "raw_1", kDay0);

    EXPECT_EQ(outcome.dropped_candidates, 1);
    EXPECT_TRUE(outcome.used_fallback);
    EXPECT_EQ(outcome.events.size(), 1u);
}

TEST(EventExtractorTest, NothingExtractedIsNotAnError) {
    FakeInferenceProvider provider(R"({"events": []})");
    EventExtractor extractor(&provider);
    auto outcome = extractor.extract("alice", "天气不错", "", "raw_1", kDay0);

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.events.empty());
    EXPECT_EQ(outcome.extractor_used, "none");
    EXPECT_TRUE(outcome.error_message.empty());
}

// ==========================================
// Sanitizing Tests
// ==========================================

TEST(EventExtractorTest, NonPositiveQuantityIsDroppedWithItsUnit) {
    CandidateEvent candidate;
    candidate.action = "吃";
    candidate.target = "苹果";
    candidate.quantity = -2.0;
    candidate.unit = "个";
    candidate.confidence = -0.3;

    auto event = EventExtractor::to_event(candidate, "alice", "raw_1", kDay0);
    ASSERT_TRUE(event.has_value());
    EXPECT_FALSE(event->quantity.has_value());
    EXPECT_FALSE(event->unit.has_value());
    EXPECT_DOUBLE_EQ(event->confidence, 0.0);
    EXPECT_EQ(event->extractor, "rule");
    EXPECT_NO_THROW(event->validate());
}

TEST(EventExtractorTest, TimestampHints) {
    EXPECT_EQ(EventExtractor::resolve_timestamp("", kDay0), kDay0);
    EXPECT_EQ(EventExtractor::resolve_timestamp("2023-12-30T10:00:00Z", kDay0),
              from_iso8601("2023-12-30T10:00:00Z"));
    // Far-future hints fall back to now
    EXPECT_EQ(EventExtractor::resolve_timestamp("2030-01-01T00:00:00Z", kDay0), kDay0);
    EXPECT_EQ(EventExtractor::resolve_timestamp("昨天", kDay0), kDay0 - days(1));
    EXPECT_EQ(EventExtractor::resolve_timestamp("some time", kDay0), kDay0);
}

TEST(CandidateJsonTest, AcceptsBareArraysAndSingleObjects) {
    auto from_array = parse_candidate_events_json(R"([{"action": "看", "target": "电影"}])");
    ASSERT_EQ(from_array.size(), 1u);
    EXPECT_EQ(from_array[0].target, "电影");

    auto from_object = parse_candidate_events_json(R"(Here: {"action": "读", "target": "小说", "quantity": "2"})");
    ASSERT_EQ(from_object.size(), 1u);
    EXPECT_DOUBLE_EQ(*from_object[0].quantity, 2.0);

    EXPECT_THROW(parse_candidate_events_json("no json here"), ExtractionFailure);
    EXPECT_THROW(parse_candidate_events_json("{\"foo\": 1}"), ExtractionFailure);
}
