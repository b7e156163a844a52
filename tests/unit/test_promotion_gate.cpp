#include <gtest/gtest.h>
#include "cogmem/cognitive/evidence_feed.hpp"
#include "cogmem/cognitive/promotion_gate.hpp"
#include "cogmem/extraction/rule_extractor.hpp"
#include "cogmem/storage/sqlite_store.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace cogmem;
using cogmem::testutil::kDay0;
using cogmem::testutil::make_event;

namespace {

std::vector<std::string> ids(const std::string& prefix, int n) {
    std::vector<std::string> result;
    for (int i = 0; i < n; ++i) result.push_back(prefix + std::to_string(i));
    return result;
}

DerivedView coffee_view(int support, int counter, double confidence) {
    DerivedView view = DerivedView::create("alice", "用户倾向于在8点左右喝咖啡", view_types::Habit,
                                           "咖啡", "喝", ids("evt_s", support), confidence, kDay0);
    view.counter_evidence = ids("evt_c", counter);
    return view;
}

} // anonymous namespace

class PromotionGateTest : public ::testing::Test {
protected:
    PromotionGate gate;
};

// ==========================================
// Rejection Tests
// ==========================================

TEST_F(PromotionGateTest, RatioAtThresholdIsNotRejected) {
    auto decision = gate.evaluate(coffee_view(10, 3, 0.42), kDay0 + days(1));
    EXPECT_EQ(decision.action, GateAction::KeepActive);

    decision = gate.evaluate(coffee_view(100, 30, 0.42), kDay0 + days(1));
    EXPECT_EQ(decision.action, GateAction::KeepActive);
}

TEST_F(PromotionGateTest, RatioAboveThresholdRejects) {
    auto decision = gate.evaluate(coffee_view(100, 31, 0.42), kDay0 + days(1));
    EXPECT_EQ(decision.action, GateAction::Reject);
    EXPECT_EQ(decision.resulting_status, ViewStatus::Rejected);

    decision = gate.evaluate(coffee_view(10, 4, 0.9), kDay0 + days(40));
    EXPECT_EQ(decision.action, GateAction::Reject);
}

// ==========================================
// Promotion Tests
// ==========================================

TEST_F(PromotionGateTest, PromotesOnlyOnceOldEnough) {
    DerivedView view = coffee_view(25, 0, 0.95);

    EXPECT_EQ(gate.evaluate(view, kDay0).action, GateAction::KeepActive);
    EXPECT_EQ(gate.evaluate(view, kDay0 + days(29)).action, GateAction::KeepActive);

    auto decision = gate.evaluate(view, kDay0 + days(30));
    EXPECT_EQ(decision.action, GateAction::Promote);
    EXPECT_EQ(decision.resulting_status, ViewStatus::Promoted);
    EXPECT_FALSE(decision.conflict_detected);
}

TEST_F(PromotionGateTest, ConfidenceMustBeStrictlyAboveThreshold) {
    EXPECT_NE(gate.evaluate(coffee_view(25, 0, 0.85), kDay0 + days(20)).action, GateAction::Promote);
    EXPECT_EQ(gate.evaluate(coffee_view(25, 0, 0.86), kDay0 + days(30)).action, GateAction::Promote);
}

TEST_F(PromotionGateTest, NeedsThreeValidations) {
    EXPECT_NE(gate.evaluate(coffee_view(2, 0, 0.95), kDay0 + days(30)).action, GateAction::Promote);
    EXPECT_EQ(gate.evaluate(coffee_view(3, 0, 0.95), kDay0 + days(30)).action, GateAction::Promote);
}

TEST_F(PromotionGateTest, PromotionRatioBoundary) {
    EXPECT_EQ(gate.evaluate(coffee_view(20, 3, 0.95), kDay0 + days(30)).action, GateAction::Promote);
    EXPECT_EQ(gate.evaluate(coffee_view(20, 4, 0.95), kDay0 + days(20)).action, GateAction::KeepActive);
}

// ==========================================
// Expiry and Conflict Tests
// ==========================================

TEST_F(PromotionGateTest, UnpromotableViewsExpire) {
    DerivedView view = coffee_view(20, 0, 0.42);
    EXPECT_EQ(gate.evaluate(view, view.expires_at - 1).action, GateAction::KeepActive);

    auto decision = gate.evaluate(view, view.expires_at);
    EXPECT_EQ(decision.action, GateAction::Expire);
    EXPECT_EQ(decision.resulting_status, ViewStatus::Expired);
}

TEST_F(PromotionGateTest, ConflictBlocksPromotionWithoutExpiring) {
    DerivedView view = coffee_view(25, 0, 0.95);
    std::vector<std::string> others = {"view_other"};

    auto decision = gate.evaluate(view, kDay0 + days(30), others);
    EXPECT_EQ(decision.action, GateAction::KeepActive);
    EXPECT_TRUE(decision.conflict_detected);
    EXPECT_EQ(decision.conflicting_view_ids, others);

    decision = gate.evaluate(view, kDay0 + days(45), others);
    EXPECT_EQ(decision.action, GateAction::KeepActive);
    EXPECT_EQ(decision.reason, "promotion blocked by conflict");
}

TEST_F(PromotionGateTest, ConflictDoesNotSaveUnpromotableViews) {
    DerivedView view = coffee_view(20, 0, 0.42);
    EXPECT_EQ(gate.evaluate(view, view.expires_at, {"view_other"}).action, GateAction::Expire);
}

TEST_F(PromotionGateTest, TerminalViewsAreLeftAlone) {
    DerivedView view = coffee_view(25, 0, 0.95);
    view.status = ViewStatus::Expired;
    auto decision = gate.evaluate(view, kDay0 + days(30));
    EXPECT_EQ(decision.action, GateAction::NoChange);
    EXPECT_EQ(decision.resulting_status, ViewStatus::Expired);
}

TEST_F(PromotionGateTest, DecisionJson) {
    auto j = gate.evaluate(coffee_view(25, 0, 0.95), kDay0 + days(30)).to_json();
    EXPECT_EQ(j["action"].get<std::string>(), "promote");
    EXPECT_EQ(j["resulting_status"].get<std::string>(), "promoted");
}

// ==========================================
// Transition Tests
// ==========================================

TEST_F(PromotionGateTest, ApplyDecisionMovesForwardOnly) {
    DerivedView view = coffee_view(25, 0, 0.95);
    Timestamp now = kDay0 + days(30);

    EXPECT_TRUE(gate.apply_decision(view, gate.evaluate(view, now), now));
    EXPECT_EQ(view.status, ViewStatus::Promoted);
    EXPECT_EQ(view.updated_at, now);

    GateDecision expire;
    expire.action = GateAction::Expire;
    expire.resulting_status = ViewStatus::Expired;
    EXPECT_THROW(gate.apply_decision(view, expire, now), std::logic_error);
    EXPECT_EQ(view.status, ViewStatus::Promoted);

    EXPECT_FALSE(gate.apply_decision(view, gate.evaluate(view, now), now));
}

TEST(ViewTransitionTest, CheckTransition) {
    EXPECT_NO_THROW(PromotionGate::check_transition(ViewStatus::Active, ViewStatus::Rejected));
    EXPECT_NO_THROW(PromotionGate::check_transition(ViewStatus::Rejected, ViewStatus::Rejected));
    EXPECT_THROW(PromotionGate::check_transition(ViewStatus::Expired, ViewStatus::Active), std::logic_error);
    EXPECT_THROW(PromotionGate::check_transition(ViewStatus::Promoted, ViewStatus::Rejected), std::logic_error);
}

TEST(ViewTransitionTest, StoreRefusesBackwardMoves) {
    SqliteStore store(":memory:");
    DerivedView view = coffee_view(5, 0, 0.5);
    store.insert_view(view);

    DerivedView promoted = view;
    promoted.status = ViewStatus::Promoted;
    ASSERT_TRUE(store.update_view(promoted, 0));
    EXPECT_EQ(store.get_view(view.view_id)->revision, 1);

    DerivedView revived = promoted;
    revived.status = ViewStatus::Active;
    EXPECT_THROW(store.update_view(revived, 1), std::logic_error);
    EXPECT_EQ(store.get_view(view.view_id)->status, ViewStatus::Promoted);
}

TEST(ViewTransitionTest, StaleRevisionLosesTheRace) {
    SqliteStore store(":memory:");
    DerivedView view = coffee_view(5, 0, 0.5);
    store.insert_view(view);

    DerivedView first = view;
    first.confidence = 0.6;
    DerivedView second = view;
    second.confidence = 0.7;

    EXPECT_TRUE(store.update_view(first, 0));
    EXPECT_FALSE(store.update_view(second, 0));
    EXPECT_DOUBLE_EQ(store.get_view(view.view_id)->confidence, 0.6);
}

// ==========================================
// Confidence Tests
// ==========================================

TEST_F(PromotionGateTest, RecalculatedConfidence) {
    EXPECT_NEAR(gate.recalculate_confidence(coffee_view(1, 0, 0.1)), 0.5, 1e-9);
    EXPECT_NEAR(gate.recalculate_confidence(coffee_view(10, 0, 0.1)), 1.0, 1e-9);
    EXPECT_NEAR(gate.recalculate_confidence(coffee_view(10, 2, 0.1)), 0.8, 1e-9);
    EXPECT_NEAR(gate.recalculate_confidence(coffee_view(2, 0, 0.1)), 0.5 + 0.5 * std::log10(2.0), 1e-9);
    EXPECT_DOUBLE_EQ(gate.recalculate_confidence(coffee_view(1, 9, 0.1)), 0.0);
}

// ==========================================
// Evidence Feed Tests
// ==========================================

class EvidenceFeedTest : public ::testing::Test {
protected:
    PromotionGate gate;
    EvidenceFeed feed{gate};

    Event event(const std::string& id, const std::string& action, const std::string& target) {
        Event e = make_event("alice", action, target, kDay0 + days(1));
        e.event_id = id;
        return e;
    }
};

TEST_F(EvidenceFeedTest, MatchingEventSupports) {
    DerivedView view = coffee_view(20, 0, 0.42);
    EXPECT_EQ(feed.apply(view, event("evt_new", "喝", "咖啡"), kDay0 + days(1)), EvidenceKind::Supporting);
    EXPECT_EQ(view.validation_count, 21);
    EXPECT_NEAR(view.confidence, gate.recalculate_confidence(view), 1e-12);
    EXPECT_EQ(view.updated_at, kDay0 + days(1));
}

TEST_F(EvidenceFeedTest, OpposingActionsCountAgainst) {
    DerivedView view = coffee_view(20, 0, 0.42);
    EXPECT_EQ(feed.apply(view, event("evt_a", "没喝", "咖啡"), kDay0), EvidenceKind::Counter);
    EXPECT_EQ(feed.apply(view, event("evt_b", "戒", "咖啡"), kDay0), EvidenceKind::Counter);
    EXPECT_EQ(view.counter_evidence.size(), 2u);
    EXPECT_EQ(view.validation_count, 20);
}

TEST_F(EvidenceFeedTest, DislikedActionCountsAgainst) {
    DerivedView view = coffee_view(20, 0, 0.42);
    RuleExtractor extractor;
    auto candidates = extractor.extract("我不喜欢喝咖啡", kDay0);
    ASSERT_EQ(candidates.size(), 1u);

    Event dislike = event("evt_dislike", candidates[0].action, candidates[0].target);
    EXPECT_EQ(feed.apply(view, dislike, kDay0 + days(1)), EvidenceKind::Counter);
    EXPECT_EQ(view.counter_evidence, std::vector<std::string>{"evt_dislike"});
    EXPECT_EQ(view.validation_count, 20);
}

TEST_F(EvidenceFeedTest, UnrelatedEventsAreIgnored) {
    DerivedView view = coffee_view(20, 0, 0.42);
    EXPECT_EQ(feed.classify(event("e1", "吃", "面包"), view), EvidenceKind::None);
    EXPECT_EQ(feed.classify(event("e2", "喝", "茶"), view), EvidenceKind::None);
    EXPECT_EQ(feed.classify(event("e3", "喝", "咖啡豆"), view), EvidenceKind::None);

    Event other_user = event("e4", "喝", "咖啡");
    other_user.user_id = "bob";
    EXPECT_EQ(feed.classify(other_user, view), EvidenceKind::None);
}

TEST_F(EvidenceFeedTest, EvidenceIsRecordedOnce) {
    DerivedView view = coffee_view(20, 0, 0.42);
    Event e = event("evt_once", "喝", "咖啡");
    EXPECT_EQ(feed.apply(view, e, kDay0), EvidenceKind::Supporting);
    EXPECT_EQ(feed.apply(view, e, kDay0), EvidenceKind::None);
    EXPECT_EQ(view.validation_count, 21);

    EXPECT_EQ(feed.apply(view, event("evt_s0", "喝", "咖啡"), kDay0), EvidenceKind::None);
}

TEST_F(EvidenceFeedTest, TerminalAndUnstructuredViewsAreLeftAlone) {
    DerivedView expired = coffee_view(20, 0, 0.42);
    expired.status = ViewStatus::Expired;
    EXPECT_EQ(feed.apply(expired, event("e1", "喝", "咖啡"), kDay0), EvidenceKind::None);
    EXPECT_EQ(expired.validation_count, 20);

    DerivedView proposed = DerivedView::create("alice", "用户喜欢喝咖啡", view_types::Belief,
                                               "", "", {"evt_x"}, 0.5, kDay0);
    EXPECT_EQ(feed.apply(proposed, event("e2", "喝", "咖啡"), kDay0), EvidenceKind::None);
}

TEST_F(EvidenceFeedTest, Oppositions) {
    EXPECT_TRUE(feed.opposes("退", "购买"));
    EXPECT_TRUE(feed.opposes("购买", "退"));
    EXPECT_TRUE(feed.opposes("不吃", "吃"));
    EXPECT_FALSE(feed.opposes("吃", "吃"));
    EXPECT_FALSE(feed.opposes("跑", "游泳"));

    feed.add_opposition("跑", "游泳");
    EXPECT_TRUE(feed.opposes("游泳", "跑"));
}
