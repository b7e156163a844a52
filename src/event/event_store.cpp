#include "cogmem/event/event_store.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"

namespace cogmem {

EventStore::EventStore(MemoryStore& store, RetryPolicy write_retry)
    : store_(store), write_retry_(write_retry) {}

std::string EventStore::append(const Event& event) {
    event.validate();

    Event stored = event;
    if (stored.event_id.empty()) {
        stored.event_id = generate_id("evt");
    }

    retry_with_backoff<StorageUnavailable>(
        [&]() { store_.insert_event(stored); },
        write_retry_,
        "EventStore::append"
    );
    return stored.event_id;
}

std::unique_ptr<EventCursor> EventStore::query(const EventFilter& filter) const {
    if (filter.user_id.empty()) {
        throw ValidationError("event query requires a user_id");
    }
    return store_.query_events(filter);
}

std::vector<Event> EventStore::collect(const EventFilter& filter, size_t limit) const {
    std::vector<Event> events;
    auto cursor = query(filter);
    Event event;
    while (events.size() < limit && cursor->next(event)) {
        events.push_back(event);
    }
    return events;
}

std::optional<Event> EventStore::get(const std::string& event_id) const {
    return store_.get_event(event_id);
}

size_t EventStore::count(const EventFilter& filter) const {
    if (filter.user_id.empty()) {
        throw ValidationError("event count requires a user_id");
    }
    return store_.count_events(filter);
}

size_t EventStore::archive(Timestamp older_than) {
    return retry_with_backoff<StorageUnavailable>(
        [&]() { return store_.archive_events(older_than); },
        write_retry_,
        "EventStore::archive"
    );
}

std::vector<Event> EventStore::archived(const std::string& user_id) const {
    return store_.list_archived_events(user_id);
}

} // namespace cogmem
