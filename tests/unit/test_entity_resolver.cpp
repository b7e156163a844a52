#include <gtest/gtest.h>
#include "cogmem/entity/entity_resolver.hpp"
#include "cogmem/entity/relation_tracker.hpp"
#include "cogmem/storage/sqlite_store.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace cogmem;
using cogmem::testutil::kDay0;

class EntityResolverTest : public ::testing::Test {
protected:
    SqliteStore store{":memory:"};
    EntityResolver resolver{store};
};

// ==========================================
// Resolution Tests
// ==========================================

TEST_F(EntityResolverTest, SameMentionResolvesToSameEntity) {
    Entity first = resolver.resolve("alice", "苹果", "我今天吃了一个苹果", kDay0);
    Entity second = resolver.resolve("alice", "苹果", "我今天吃了一个苹果", kDay0 + days(1));

    EXPECT_EQ(first.entity_id, second.entity_id);
    EXPECT_EQ(second.mention_count, 2);
    EXPECT_EQ(second.last_seen, kDay0 + days(1));
    EXPECT_EQ(second.first_seen, kDay0);
    EXPECT_EQ(store.list_entities("alice").size(), 1u);
}

TEST_F(EntityResolverTest, ClashingTypesCreateDisjointEntities) {
    Entity fruit = resolver.resolve("alice", "苹果", "我今天吃了一个苹果", kDay0);
    Entity company = resolver.resolve("alice", "苹果", "我在考虑投资苹果的股票", kDay0);

    EXPECT_NE(fruit.entity_id, company.entity_id);
    EXPECT_EQ(fruit.canonical_name, "苹果");
    EXPECT_EQ(fruit.entity_type, entity_types::Food);
    EXPECT_EQ(company.canonical_name, "苹果#2");
    EXPECT_EQ(company.entity_type, entity_types::Organization);
}

TEST_F(EntityResolverTest, ContextPicksAmongCandidates) {
    Entity fruit = resolver.resolve("alice", "苹果", "我今天吃了一个苹果", kDay0);
    resolver.resolve("alice", "苹果", "我在考虑投资苹果的股票", kDay0);

    Entity again = resolver.resolve("alice", "苹果", "今天又吃了苹果", kDay0 + days(2));
    EXPECT_EQ(again.entity_id, fruit.entity_id);
    EXPECT_EQ(again.mention_count, 2);
    EXPECT_EQ(store.list_entities("alice").size(), 2u);
}

TEST_F(EntityResolverTest, EntitiesArePerUser) {
    Entity a = resolver.resolve("alice", "咖啡", "喝咖啡", kDay0);
    Entity b = resolver.resolve("bob", "咖啡", "喝咖啡", kDay0);
    EXPECT_NE(a.entity_id, b.entity_id);
    EXPECT_EQ(b.mention_count, 1);
}

TEST_F(EntityResolverTest, FuzzyNameMatch) {
    Entity first = resolver.resolve("alice", "Microsoft", "", kDay0);
    Entity typo = resolver.resolve("alice", "Microsft", "", kDay0);
    EXPECT_EQ(first.entity_id, typo.entity_id);
    EXPECT_EQ(typo.canonical_name, "Microsoft");
}

TEST_F(EntityResolverTest, NormalizationAndAliases) {
    EXPECT_EQ(resolver.normalize_mention("  new   york "), "New York");
    EXPECT_EQ(resolver.normalize_mention("Apple Inc"), "Apple");
    EXPECT_EQ(resolver.normalize_mention("苹果公司"), "Apple");
    EXPECT_EQ(resolver.normalize_mention("谷歌"), "Google");
    EXPECT_EQ(resolver.normalize_mention("咖啡"), "咖啡");
}

TEST_F(EntityResolverTest, EmptyMentionIsRejected) {
    EXPECT_THROW(resolver.resolve("alice", "   ", "", kDay0), ValidationError);
}

TEST_F(EntityResolverTest, AttributesGrowFromContext) {
    Entity apple = resolver.resolve("alice", "苹果", "红色的苹果很甜", kDay0);
    ASSERT_TRUE(apple.attributes.count("color"));
    EXPECT_EQ(apple.attributes.at("color").value, "红色");
    ASSERT_TRUE(apple.attributes.count("taste"));
    EXPECT_EQ(apple.attributes.at("taste").value, "甜");

    auto stored = store.find_entity("alice", "苹果");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->attributes.at("color").value, "红色");
}

TEST(EntityProfileTest, ContextProfileIsBounded) {
    SqliteStore store(":memory:");
    ResolverConfig config;
    config.context_profile_limit = 3;
    EntityResolver resolver(store, config);

    Entity e = resolver.resolve("alice", "咖啡", "早上在公司楼下的咖啡店喝了一杯拿铁咖啡", kDay0);
    EXPECT_LE(e.context_profile.size(), 3u);
    EXPECT_FALSE(e.context_profile.count("咖啡"));
}

// ==========================================
// Attribute Merge Tests
// ==========================================

class AttributeMergeTest : public ::testing::Test {
protected:
    Entity entity;

    void SetUp() override {
        for (int i = 0; i < 3; ++i) {
            EntityResolver::merge_attribute(entity, {"color", "红色", 0.8}, kDay0, 90.0);
        }
    }
};

TEST_F(AttributeMergeTest, RepeatedValueAccumulates) {
    const auto& attr = entity.attributes.at("color");
    EXPECT_EQ(attr.count, 3);
    EXPECT_EQ(attr.observations, 3);
    EXPECT_NEAR(attr.confidence, 0.8 * (1.0 - std::exp(-1.5)), 1e-9);
}

TEST_F(AttributeMergeTest, WeakChallengerIsDiscarded) {
    bool accepted = EntityResolver::merge_attribute(entity, {"color", "绿色", 0.8}, kDay0 + days(1), 90.0);
    EXPECT_FALSE(accepted);
    EXPECT_EQ(entity.attributes.at("color").value, "红色");
    EXPECT_EQ(entity.attributes.at("color").observations, 4);
}

TEST_F(AttributeMergeTest, StaleValueLosesToFreshObservation) {
    bool accepted = EntityResolver::merge_attribute(entity, {"color", "绿色", 0.8}, kDay0 + days(365), 90.0);
    EXPECT_TRUE(accepted);
    EXPECT_EQ(entity.attributes.at("color").value, "绿色");
    EXPECT_EQ(entity.attributes.at("color").count, 1);
}

TEST(AttributeConfidenceTest, Formula) {
    AttributeValue attr;
    attr.extraction_confidence = 0.8;
    attr.count = 2;
    attr.observations = 4;
    attr.last_seen = kDay0;

    double expected = 0.8 * (1.0 - std::exp(-1.0)) * 0.5 * std::exp(-10.0 / 90.0);
    EXPECT_NEAR(EntityResolver::attribute_confidence(attr, kDay0 + days(10), 90.0), expected, 1e-9);

    attr.count = 0;
    EXPECT_DOUBLE_EQ(EntityResolver::attribute_confidence(attr, kDay0, 90.0), 0.0);
}

// ==========================================
// Relation Tests
// ==========================================

class RelationTrackerTest : public ::testing::Test {
protected:
    SqliteStore store{":memory:"};
    EntityResolver resolver{store};
    RelationTracker tracker{store};
};

TEST_F(RelationTrackerTest, CoOccurrenceLinksEveryPair) {
    auto a = resolver.resolve("alice", "咖啡", "喝咖啡", kDay0).entity_id;
    auto b = resolver.resolve("alice", "面包", "吃面包", kDay0).entity_id;
    auto c = resolver.resolve("alice", "牛奶", "喝牛奶", kDay0).entity_id;

    EXPECT_EQ(tracker.observe("alice", {a, b, c, a}, kDay0), 3u);
    EXPECT_EQ(store.list_relations("alice").size(), 3u);
    EXPECT_EQ(tracker.relations_for("alice", a).size(), 2u);
}

TEST_F(RelationTrackerTest, RepeatedCoOccurrenceStrengthens) {
    auto a = resolver.resolve("alice", "咖啡", "喝咖啡", kDay0).entity_id;
    auto b = resolver.resolve("alice", "面包", "吃面包", kDay0).entity_id;

    tracker.observe("alice", {a, b}, kDay0);
    double first = tracker.relations_for("alice", a).at(0).strength;

    tracker.observe("alice", {b, a}, kDay0);
    auto rels = tracker.relations_for("alice", a);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].co_occurrence_count, 2);
    EXPECT_NEAR(rels[0].weighted_count, 2.0, 1e-9);
    EXPECT_GT(rels[0].strength, first);
    EXPECT_NEAR(rels[0].strength, RelationTracker::strength_from_weight(2.0), 1e-9);
}

TEST_F(RelationTrackerTest, OldCoOccurrencesDecay) {
    auto a = resolver.resolve("alice", "咖啡", "喝咖啡", kDay0).entity_id;
    auto b = resolver.resolve("alice", "面包", "吃面包", kDay0).entity_id;

    tracker.observe("alice", {a, b}, kDay0);
    tracker.observe("alice", {a, b}, kDay0 + days(90));

    auto rels = tracker.relations_for("alice", a);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_NEAR(rels[0].weighted_count, std::exp(-1.0) + 1.0, 1e-9);
}

TEST_F(RelationTrackerTest, SingleEntityIsNoOp) {
    auto a = resolver.resolve("alice", "咖啡", "喝咖啡", kDay0).entity_id;
    EXPECT_EQ(tracker.observe("alice", {a}, kDay0), 0u);
    EXPECT_EQ(tracker.observe("alice", {}, kDay0), 0u);
    EXPECT_TRUE(tracker.strongest("alice", 10).empty());
    EXPECT_DOUBLE_EQ(RelationTracker::strength_from_weight(0.0), 0.0);
}
