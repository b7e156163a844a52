#include <gtest/gtest.h>
#include "cogmem/pipeline/cognitive_pipeline.hpp"
#include "cogmem/pipeline/sweep_scheduler.hpp"
#include "test_helpers.hpp"

using namespace cogmem;
using cogmem::testutil::FlakyStore;
using cogmem::testutil::kDay0;

namespace {

EngineConfig quiet_config() {
    EngineConfig config;
    config.database_path = ":memory:";
    config.inference.provider = "none";
    config.storage_retry.base_delay_ms = 1;
    return config;
}

} // anonymous namespace

class PipelineScenarioTest : public ::testing::Test {
protected:
    SqliteStore store{":memory:"};
    CognitivePipeline pipeline{store, quiet_config()};

    void ingest_daily(const std::string& user, const std::string& text, int first_day, int last_day) {
        for (int d = first_day; d <= last_day; ++d) {
            pipeline.ingest(user, text, "", kDay0 + days(d));
        }
    }

    std::optional<DerivedView> active_view(const std::string& user, const std::string& type) {
        for (const auto& view : store.list_views(user, ViewStatus::Active)) {
            if (view.view_type == type) return view;
        }
        return std::nullopt;
    }
};

// ==========================================
// Ingest Tests
// ==========================================

TEST_F(PipelineScenarioTest, IngestStoresRawInputEventsAndEntities) {
    IngestResult result = pipeline.ingest("alice", "我每天都喝咖啡", "早餐", kDay0);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.extractor_used, "rule");
    EXPECT_FALSE(result.used_fallback);
    ASSERT_EQ(result.event_ids.size(), 1u);
    EXPECT_EQ(result.entity_ids.size(), 1u);

    auto raws = store.list_raw_inputs("alice");
    ASSERT_EQ(raws.size(), 1u);
    EXPECT_EQ(raws[0].raw_id, result.raw_id);
    EXPECT_EQ(raws[0].context, "早餐");
    EXPECT_EQ(raws[0].event_count, 1);

    auto event = store.get_event(result.event_ids[0]);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->action, "喝");
    EXPECT_EQ(event->target, "咖啡");
    EXPECT_EQ(event->source_reference, result.raw_id);
}

TEST_F(PipelineScenarioTest, UnextractableInputIsStillStored) {
    IngestResult result = pipeline.ingest("alice", "天气不错", "", kDay0);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.extractor_used, "none");
    EXPECT_TRUE(result.event_ids.empty());

    auto raws = store.list_raw_inputs("alice");
    ASSERT_EQ(raws.size(), 1u);
    EXPECT_EQ(raws[0].content, "天气不错");
    EXPECT_EQ(raws[0].event_count, 0);
}

TEST_F(PipelineScenarioTest, InvalidInputIsRejected) {
    EXPECT_THROW(pipeline.ingest("", "我每天都喝咖啡", "", kDay0), ValidationError);
    EXPECT_THROW(pipeline.ingest("alice", "   ", "", kDay0), ValidationError);
    EXPECT_TRUE(store.list_raw_inputs("alice").empty());
}

TEST(PipelineFallbackTest, ProviderOutageFallsBackToRules) {
    SqliteStore store(":memory:");
    auto provider = std::make_unique<testutil::FakeInferenceProvider>("", false);
    auto* fake = provider.get();
    CognitivePipeline pipeline(store, quiet_config(), std::move(provider));

    IngestResult result = pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0);
    EXPECT_EQ(fake->calls, 1);
    EXPECT_TRUE(result.used_fallback);
    EXPECT_EQ(result.extractor_used, "rule");
    EXPECT_EQ(result.event_ids.size(), 1u);
}

TEST(PipelineStorageTest, PersistentWriteFailureSurfaces) {
    FlakyStore store;
    CognitivePipeline pipeline(store, quiet_config());
    store.failing_inserts = 100;

    EXPECT_THROW(pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0), StorageUnavailable);
    EXPECT_EQ(store.list_raw_inputs("alice").size(), 1u);
}

TEST(PipelineStorageTest, TransientWriteFailureIsRetried) {
    FlakyStore store;
    CognitivePipeline pipeline(store, quiet_config());
    store.failing_inserts = 2;

    IngestResult result = pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(store.failing_inserts.load(), 0);
}

TEST(PipelineStorageTest, EntityWriteFailureKeepsCounterEvidence) {
    FlakyStore store;
    CognitivePipeline pipeline(store, quiet_config());
    DerivedView habit = DerivedView::create("alice", "用户倾向于在8点左右喝咖啡", view_types::Habit,
                                            "咖啡", "喝", {"e1", "e2", "e3"}, 0.42, kDay0);
    store.insert_view(habit);

    store.failing_entity_writes = 100;
    EXPECT_THROW(pipeline.ingest("alice", "今天没有喝咖啡", "", kDay0 + days(1)), StorageUnavailable);

    auto view = store.get_view(habit.view_id);
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->counter_evidence.size(), 1u);

    auto raws = store.list_raw_inputs("alice");
    ASSERT_EQ(raws.size(), 1u);
    EXPECT_EQ(raws[0].event_count, 1);
    EXPECT_TRUE(store.list_entities("alice").empty());
}

TEST(PipelineStorageTest, TransientEntityWriteFailureIsRetried) {
    FlakyStore store;
    CognitivePipeline pipeline(store, quiet_config());
    store.failing_entity_writes = 2;

    IngestResult result = pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.entity_ids.size(), 1u);
    EXPECT_EQ(store.list_entities("alice").size(), 1u);
    EXPECT_EQ(store.failing_entity_writes.load(), 0);
}

// ==========================================
// Habit Lifecycle Scenarios
// ==========================================

TEST_F(PipelineScenarioTest, DailyCoffeeBecomesStableConcept) {
    for (int d = 0; d <= 18; ++d) {
        pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0 + days(d));
        SweepReport report = pipeline.run_sweep("alice", kDay0 + days(d));
        EXPECT_TRUE(report.success);
        EXPECT_EQ(report.views_created, d == 4 ? 1 : 0) << "day " << d;
    }

    // Five drinks, all of them coffee, already make a preference
    auto preference = active_view("alice", view_types::Preference);
    ASSERT_TRUE(preference.has_value());
    EXPECT_EQ(preference->hypothesis, "用户喝时偏好咖啡");
    EXPECT_EQ(preference->validation_count, 19);
    EXPECT_FALSE(active_view("alice", view_types::Habit).has_value());

    pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0 + days(19));
    SweepReport created = pipeline.run_sweep("alice", kDay0 + days(19));
    EXPECT_EQ(created.views_proposed, 2);
    EXPECT_EQ(created.views_created, 1);
    EXPECT_EQ(created.kept_active, 2);

    auto habit = active_view("alice", view_types::Habit);
    ASSERT_TRUE(habit.has_value());
    const std::string view_id = habit->view_id;
    EXPECT_EQ(habit->hypothesis, "用户倾向于在8点左右喝咖啡");
    EXPECT_EQ(habit->validation_count, 20);
    EXPECT_NEAR(habit->confidence, 0.42, 1e-9);
    EXPECT_EQ(habit->expires_at, kDay0 + days(49));

    // New evidence flows into the existing views at ingest time
    for (int d = 20; d <= 24; ++d) {
        IngestResult result = pipeline.ingest("alice", "我每天都喝咖啡", "", kDay0 + days(d));
        EXPECT_EQ(result.supporting_evidence, 2);
        EXPECT_EQ(result.views_updated, 2);

        SweepReport report = pipeline.run_sweep("alice", kDay0 + days(d));
        EXPECT_EQ(report.views_created, 0);
        EXPECT_EQ(report.views_merged, 0);
        EXPECT_EQ(report.kept_active, 2);
        EXPECT_EQ(report.promoted, 0);
    }

    auto grown = store.get_view(view_id);
    ASSERT_TRUE(grown.has_value());
    EXPECT_EQ(grown->validation_count, 25);
    EXPECT_DOUBLE_EQ(grown->confidence, 1.0);

    SweepReport preference_promoted = pipeline.run_sweep("alice", kDay0 + days(34));
    EXPECT_EQ(preference_promoted.promoted, 1);
    EXPECT_EQ(preference_promoted.kept_active, 1);
    EXPECT_TRUE(store.find_active_concept("alice", "preference:喝:咖啡").has_value());

    SweepReport too_young = pipeline.run_sweep("alice", kDay0 + days(48));
    EXPECT_EQ(too_young.views_created, 0);
    EXPECT_EQ(too_young.promoted, 0);
    EXPECT_EQ(too_young.kept_active, 1);

    SweepReport promoted = pipeline.run_sweep("alice", kDay0 + days(49));
    EXPECT_TRUE(promoted.success);
    EXPECT_EQ(promoted.promoted, 1);
    ASSERT_EQ(promoted.concept_ids.size(), 1u);

    auto concept_row = store.find_active_concept("alice", "habit:喝:咖啡");
    ASSERT_TRUE(concept_row.has_value());
    EXPECT_EQ(concept_row->concept_id, promoted.concept_ids[0]);
    EXPECT_EQ(concept_row->derived_from_views, std::vector<std::string>{view_id});
    EXPECT_EQ(concept_row->definition["validation_count"].get<int>(), 25);
    EXPECT_EQ(pipeline.registry().get_active_concepts("alice").size(), 2u);

    EXPECT_EQ(store.get_view(view_id)->status, ViewStatus::Promoted);
}

TEST_F(PipelineScenarioTest, BackloggedDailyCoffeeIsPromotedAfterThirtyDays) {
    ingest_daily("alice", "我每天都喝咖啡", 0, 24);

    SweepReport first = pipeline.run_sweep("alice", kDay0 + days(24));
    EXPECT_EQ(first.views_created, 2);
    auto habit = active_view("alice", view_types::Habit);
    ASSERT_TRUE(habit.has_value());
    EXPECT_EQ(habit->validation_count, 25);
    EXPECT_NEAR(habit->confidence, 0.42, 1e-9);

    // Detected again on the next sweep, the habit is rescored from its evidence
    SweepReport confirmed = pipeline.run_sweep("alice", kDay0 + days(25));
    EXPECT_EQ(confirmed.views_merged, 1);
    EXPECT_DOUBLE_EQ(store.get_view(habit->view_id)->confidence, 1.0);

    for (int d = 26; d <= 53; ++d) {
        SweepReport report = pipeline.run_sweep("alice", kDay0 + days(d));
        EXPECT_EQ(report.views_merged, 0) << "day " << d;
        EXPECT_EQ(report.promoted, 0) << "day " << d;
        EXPECT_EQ(report.expired, 0) << "day " << d;
    }

    SweepReport promoted = pipeline.run_sweep("alice", kDay0 + days(54));
    EXPECT_EQ(promoted.promoted, 2);
    EXPECT_EQ(promoted.expired, 0);
    EXPECT_EQ(store.get_view(habit->view_id)->status, ViewStatus::Promoted);
    EXPECT_TRUE(store.find_active_concept("alice", "habit:喝:咖啡").has_value());
    EXPECT_TRUE(store.find_active_concept("alice", "preference:喝:咖啡").has_value());
}

TEST_F(PipelineScenarioTest, CounterEvidenceRejectsAndCoolsDown) {
    ingest_daily("alice", "我每天都喝咖啡", 0, 19);
    ASSERT_EQ(pipeline.run_sweep("alice", kDay0 + days(19)).views_created, 2);

    // Each refusal counts against both the habit and the preference
    int counter = 0;
    for (int i = 0; i < 7; ++i) {
        counter += pipeline.ingest("alice", "今天没有喝咖啡", "", kDay0 + days(20) + hours(i)).counter_evidence;
    }
    EXPECT_EQ(counter, 14);

    SweepReport rejected = pipeline.run_sweep("alice", kDay0 + days(20) + hours(10));
    EXPECT_EQ(rejected.rejected, 2);
    EXPECT_TRUE(store.list_views("alice", ViewStatus::Active).empty());

    // The same window does not bring the rejected hypotheses straight back
    SweepReport next = pipeline.run_sweep("alice", kDay0 + days(21));
    EXPECT_EQ(next.views_proposed, 2);
    EXPECT_EQ(next.views_created, 0);
    EXPECT_TRUE(store.list_views("alice", ViewStatus::Active).empty());
    EXPECT_TRUE(pipeline.registry().get_active_concepts("alice").empty());

    EXPECT_EQ(pipeline.archive(kDay0 + days(120)), 2u);
    EXPECT_TRUE(store.list_views("alice").empty());
}

TEST_F(PipelineScenarioTest, DislikeCountsAgainstTheHabit) {
    ingest_daily("alice", "我每天都喝咖啡", 0, 19);
    ASSERT_EQ(pipeline.run_sweep("alice", kDay0 + days(19)).views_created, 2);

    IngestResult result = pipeline.ingest("alice", "我再也不想喝咖啡了", "", kDay0 + days(20));
    EXPECT_EQ(result.supporting_evidence, 0);
    EXPECT_EQ(result.counter_evidence, 2);

    auto habit = active_view("alice", view_types::Habit);
    ASSERT_TRUE(habit.has_value());
    EXPECT_EQ(habit->counter_evidence.size(), 1u);
    EXPECT_EQ(habit->validation_count, 20);
}

TEST_F(PipelineScenarioTest, ConflictBlocksPromotionUntilResolved) {
    DerivedView meat = DerivedView::create("alice", "用户喜欢吃肉", view_types::Belief, "", "",
                                           {"e1", "e2", "e3"}, 0.95, kDay0);
    DerivedView vegetarian = DerivedView::create("alice", "用户是素食主义者", view_types::Belief, "", "",
                                                 {"e4", "e5", "e6"}, 0.95, kDay0);
    store.insert_view(meat);
    store.insert_view(vegetarian);

    SweepReport blocked = pipeline.run_sweep("alice", kDay0 + days(30));
    EXPECT_TRUE(blocked.success);
    EXPECT_EQ(blocked.conflicts_found, 1);
    EXPECT_EQ(blocked.kept_active, 2);
    EXPECT_EQ(blocked.blocked_by_conflict, 2);
    EXPECT_EQ(blocked.promoted, 0);
    EXPECT_EQ(blocked.expired, 0);

    auto current = store.get_view(vegetarian.view_id);
    ASSERT_TRUE(current.has_value());
    DerivedView resolved = *current;
    resolved.status = ViewStatus::Rejected;
    ASSERT_TRUE(store.update_view(resolved, current->revision));

    SweepReport promoted = pipeline.run_sweep("alice", kDay0 + days(31));
    EXPECT_EQ(promoted.conflicts_found, 0);
    EXPECT_EQ(promoted.promoted, 1);

    auto concepts = pipeline.registry().get_active_concepts("alice");
    ASSERT_EQ(concepts.size(), 1u);
    EXPECT_EQ(concepts[0].name, "belief:用户喜欢吃肉");
}

TEST_F(PipelineScenarioTest, UnvalidatedViewExpires) {
    DerivedView guess = DerivedView::create("alice", "用户喜欢喝茶", view_types::Belief, "", "",
                                            {"e1"}, 0.5, kDay0);
    store.insert_view(guess);

    EXPECT_EQ(pipeline.run_sweep("alice", kDay0 + days(29)).kept_active, 1);

    SweepReport report = pipeline.run_sweep("alice", kDay0 + days(30));
    EXPECT_EQ(report.expired, 1);
    EXPECT_EQ(store.get_view(guess.view_id)->status, ViewStatus::Expired);
}

TEST_F(PipelineScenarioTest, SweepLeavesOtherUsersAlone) {
    DerivedView tea = DerivedView::create("bob", "用户喜欢喝茶", view_types::Belief, "", "", {"e1"}, 0.5, kDay0);
    store.insert_view(tea);
    auto current = store.get_view(tea.view_id);
    ASSERT_TRUE(current.has_value());
    DerivedView rejected = *current;
    rejected.status = ViewStatus::Rejected;
    ASSERT_TRUE(store.update_view(rejected, current->revision));

    EXPECT_TRUE(pipeline.run_sweep("alice", kDay0 + days(200)).success);
    EXPECT_EQ(store.list_views("bob").size(), 1u);

    // Retention is applied by the maintenance pass only
    EXPECT_EQ(pipeline.archive(kDay0 + days(200)), 1u);
    EXPECT_TRUE(store.list_views("bob").empty());
}

TEST_F(PipelineScenarioTest, CancelledSweepWritesNothing) {
    ingest_daily("alice", "我每天都喝咖啡", 0, 19);

    CancellationToken token;
    token.cancel();
    SweepReport report = pipeline.run_sweep("alice", kDay0 + days(19), &token);

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.views_created, 0);
    EXPECT_TRUE(store.list_views("alice").empty());
}

// ==========================================
// Scheduler Tests
// ==========================================

class SweepSchedulerTest : public PipelineScenarioTest {};

TEST_F(SweepSchedulerTest, BatchOrIntervalMakesUserDue) {
    SchedulerConfig config;
    config.sweep_event_batch = 3;
    config.sweep_interval_minutes = 60;
    SweepScheduler scheduler(pipeline, config);

    EXPECT_TRUE(scheduler.due_users(kDay0).empty());

    scheduler.note_events("alice", 2, kDay0);
    scheduler.note_events("bob", 1, kDay0);
    EXPECT_TRUE(scheduler.due_users(kDay0 + 60).empty());

    scheduler.note_events("alice", 1, kDay0 + 60);
    EXPECT_EQ(scheduler.due_users(kDay0 + 60), std::vector<std::string>{"alice"});
    EXPECT_EQ(scheduler.pending_events("alice"), 3u);

    EXPECT_EQ(scheduler.due_users(kDay0 + hours(1)), (std::vector<std::string>{"alice", "bob"}));
}

TEST_F(SweepSchedulerTest, RunDueSweepsAndResetsCounters) {
    ingest_daily("alice", "我每天都喝咖啡", 0, 19);
    ingest_daily("bob", "我每天都喝咖啡", 0, 19);
    ingest_daily("carol", "我每天都喝咖啡", 0, 19);

    SchedulerConfig config;
    config.max_parallel_users = 2;
    SweepScheduler scheduler(pipeline, config);
    for (const char* user : {"alice", "bob", "carol"}) {
        scheduler.note_events(user, 20, kDay0 + days(19));
    }

    auto reports = scheduler.run_due(kDay0 + days(19));
    ASSERT_EQ(reports.size(), 3u);
    for (const auto& report : reports) {
        EXPECT_TRUE(report.success) << report.user_id;
        EXPECT_EQ(report.views_created, 2) << report.user_id;
        EXPECT_EQ(scheduler.pending_events(report.user_id), 0u);
    }
    EXPECT_EQ(store.list_views("bob").size(), 2u);
    EXPECT_TRUE(scheduler.due_users(kDay0 + days(19)).empty());
}

TEST_F(SweepSchedulerTest, CancelledSchedulerKeepsPendingWork) {
    SweepScheduler scheduler(pipeline);
    scheduler.note_events("alice", 25, kDay0);

    scheduler.cancel();
    EXPECT_TRUE(scheduler.run_due(kDay0).empty());
    EXPECT_EQ(scheduler.pending_events("alice"), 25u);

    scheduler.reset_cancellation();
    auto reports = scheduler.run_due(kDay0);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].success);
    EXPECT_EQ(scheduler.pending_events("alice"), 0u);
}
