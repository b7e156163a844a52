#include <gtest/gtest.h>
#include "cogmem/event/event_store.hpp"
#include "cogmem/storage/sqlite_store.hpp"
#include "test_helpers.hpp"

using namespace cogmem;
using cogmem::testutil::FlakyStore;
using cogmem::testutil::kDay0;
using cogmem::testutil::make_event;

class EventStoreTest : public ::testing::Test {
protected:
    SqliteStore store{":memory:"};
    EventStore events{store};
};

// ==========================================
// Append and Read Tests
// ==========================================

TEST_F(EventStoreTest, AppendAssignsIdAndReadsBackUnchanged) {
    Event event = make_event("alice", "吃", "苹果", kDay0, 0.85);
    event.quantity = 3.0;
    event.unit = "个";
    event.source_reference = "raw_1";

    std::string id = events.append(event);
    ASSERT_FALSE(id.empty());

    auto stored = events.get(id);
    ASSERT_TRUE(stored.has_value());
    event.event_id = id;
    EXPECT_EQ(*stored, event);
}

TEST_F(EventStoreTest, KeepsCallerSuppliedId) {
    Event event = make_event("alice", "喝", "咖啡", kDay0);
    event.event_id = "evt_fixed";
    EXPECT_EQ(events.append(event), "evt_fixed");
    EXPECT_TRUE(events.get("evt_fixed").has_value());
}

TEST_F(EventStoreTest, OpenVocabularyActionsAreStored) {
    std::string id = events.append(make_event("alice", "冥想", "冥想", kDay0));
    auto stored = events.get(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->action, "冥想");
}

TEST_F(EventStoreTest, QueryFiltersAndOrdersByTime) {
    events.append(make_event("alice", "喝", "咖啡", kDay0 + days(2)));
    events.append(make_event("alice", "喝", "茶", kDay0 + days(1)));
    events.append(make_event("alice", "吃", "面包", kDay0));
    events.append(make_event("bob", "喝", "咖啡", kDay0));

    EventFilter all;
    all.user_id = "alice";
    auto list = events.collect(all, 100);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].target, "面包");
    EXPECT_EQ(list[2].target, "咖啡");

    EventFilter drinks;
    drinks.user_id = "alice";
    drinks.action = "喝";
    EXPECT_EQ(events.count(drinks), 2u);

    EventFilter window;
    window.user_id = "alice";
    window.from = kDay0 + days(1);
    window.to = kDay0 + days(2);
    auto ranged = events.collect(window, 100);
    ASSERT_EQ(ranged.size(), 1u);
    EXPECT_EQ(ranged[0].target, "茶");
}

TEST_F(EventStoreTest, CursorStreamsOneAtATime) {
    for (int i = 0; i < 5; ++i) {
        events.append(make_event("alice", "喝", "咖啡", kDay0 + days(i)));
    }

    EventFilter filter;
    filter.user_id = "alice";
    auto cursor = events.query(filter);
    Event event;
    int seen = 0;
    Timestamp previous = 0;
    while (cursor->next(event)) {
        EXPECT_GE(event.timestamp, previous);
        previous = event.timestamp;
        ++seen;
    }
    EXPECT_EQ(seen, 5);
    EXPECT_FALSE(cursor->next(event));

    EXPECT_EQ(events.collect(filter, 2).size(), 2u);
}

TEST_F(EventStoreTest, QueryWithoutUserIsRejected) {
    EXPECT_THROW(events.query(EventFilter{}), ValidationError);
    EXPECT_THROW(events.count(EventFilter{}), ValidationError);
}

// ==========================================
// Validation Tests
// ==========================================

TEST_F(EventStoreTest, RejectsMalformedEvents) {
    Event no_user = make_event("", "吃", "苹果", kDay0);
    EXPECT_THROW(events.append(no_user), ValidationError);

    Event no_action = make_event("alice", "  ", "苹果", kDay0);
    EXPECT_THROW(events.append(no_action), ValidationError);

    Event no_target = make_event("alice", "吃", "", kDay0);
    EXPECT_THROW(events.append(no_target), ValidationError);

    Event bad_confidence = make_event("alice", "吃", "苹果", kDay0, 1.2);
    EXPECT_THROW(events.append(bad_confidence), ValidationError);

    Event negative_quantity = make_event("alice", "吃", "苹果", kDay0);
    negative_quantity.quantity = -1.0;
    EXPECT_THROW(events.append(negative_quantity), ValidationError);

    Event unit_without_quantity = make_event("alice", "吃", "苹果", kDay0);
    unit_without_quantity.unit = "个";
    EXPECT_THROW(events.append(unit_without_quantity), ValidationError);

    Event no_time = make_event("alice", "吃", "苹果", 0);
    EXPECT_THROW(events.append(no_time), ValidationError);

    EventFilter filter;
    filter.user_id = "alice";
    EXPECT_EQ(events.count(filter), 0u);
}

// ==========================================
// Storage Failure Tests
// ==========================================

TEST(EventStoreRetryTest, TransientFailuresAreRetried) {
    FlakyStore store;
    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.base_delay_ms = 1;
    EventStore events(store, policy);

    store.failing_inserts = 2;
    std::string id = events.append(make_event("alice", "喝", "咖啡", kDay0));
    EXPECT_TRUE(events.get(id).has_value());
    EXPECT_EQ(store.failing_inserts.load(), 0);
}

TEST(EventStoreRetryTest, PersistentFailureSurfacesAsStorageUnavailable) {
    FlakyStore store;
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.base_delay_ms = 1;
    EventStore events(store, policy);

    store.failing_inserts = 10;
    EXPECT_THROW(events.append(make_event("alice", "喝", "咖啡", kDay0)), StorageUnavailable);
    EXPECT_EQ(store.failing_inserts.load(), 7);
}

TEST(EventStoreRetryTest, ValidationErrorsAreNeverRetried) {
    FlakyStore store;
    RetryPolicy policy;
    policy.base_delay_ms = 1;
    EventStore events(store, policy);

    store.failing_inserts = 1;
    EXPECT_THROW(events.append(make_event("alice", "", "咖啡", kDay0)), ValidationError);
    EXPECT_EQ(store.failing_inserts.load(), 1);
}

// ==========================================
// Archive Tests
// ==========================================

TEST_F(EventStoreTest, ArchiveMovesOldEventsWithoutChangingThem) {
    Event old_event = make_event("alice", "喝", "茶", kDay0);
    old_event.event_id = "evt_old";
    events.append(old_event);
    events.append(make_event("alice", "喝", "咖啡", kDay0 + days(800)));

    EXPECT_EQ(events.archive(kDay0 + days(730)), 1u);

    EventFilter filter;
    filter.user_id = "alice";
    EXPECT_EQ(events.count(filter), 1u);
    EXPECT_FALSE(events.get("evt_old").has_value());

    auto archived = events.archived("alice");
    ASSERT_EQ(archived.size(), 1u);
    EXPECT_EQ(archived[0], old_event);
}

TEST_F(EventStoreTest, ArchiveMovesWholeBacklogAcrossUsers) {
    Event measured = make_event("alice", "吃", "苹果", kDay0);
    measured.event_id = "evt_measured";
    measured.quantity = 3.0;
    measured.unit = "个";
    events.append(measured);
    for (int i = 1; i < 200; ++i) {
        events.append(make_event(i % 2 == 0 ? "alice" : "bob", "喝", "咖啡", kDay0 + hours(i)));
    }
    events.append(make_event("bob", "喝", "茶", kDay0 + days(900)));

    EXPECT_EQ(events.archive(kDay0 + days(730)), 200u);
    EXPECT_EQ(events.archive(kDay0 + days(730)), 0u);

    EventFilter filter;
    filter.user_id = "bob";
    EXPECT_EQ(events.count(filter), 1u);

    auto alice = events.archived("alice");
    ASSERT_EQ(alice.size(), 100u);
    EXPECT_EQ(alice[0], measured);
    EXPECT_EQ(events.archived("bob").size(), 100u);
}

TEST(DataTierTest, TiersByAge) {
    Event event = make_event("alice", "喝", "茶", kDay0);
    EXPECT_EQ(tier_of(event, kDay0 + days(10)), DataTier::Hot);
    EXPECT_EQ(tier_of(event, kDay0 + days(200)), DataTier::Warm);
    EXPECT_EQ(tier_of(event, kDay0 + days(800)), DataTier::Cold);
    EXPECT_EQ(data_tier_to_string(DataTier::Warm), "warm");
}
