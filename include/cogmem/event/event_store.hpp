#pragma once

#include "cogmem/core/retry.hpp"
#include "cogmem/event/event.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Event Store
// ============================================================================

/**
 * @brief Append-only ledger of structured events
 *
 * There is no update or delete. archive() moves old rows to the cold tier
 * without changing their content.
 */
class EventStore {
public:
    EventStore(MemoryStore& store, RetryPolicy write_retry = {});

    /**
     * @brief Validate and durably append an event
     *
     * Assigns an event_id when the event has none. Transient storage
     * failures are retried with backoff.
     *
     * @return The stored event id
     * @throws ValidationError for malformed fields (never retried)
     * @throws StorageUnavailable once retries are exhausted
     */
    std::string append(const Event& event);

    /**
     * @brief Stream events matching a filter, oldest first
     */
    std::unique_ptr<EventCursor> query(const EventFilter& filter) const;

    /**
     * @brief Materialize a bounded query. Prefer query() for open-ended scans.
     */
    std::vector<Event> collect(const EventFilter& filter, size_t limit) const;

    std::optional<Event> get(const std::string& event_id) const;

    size_t count(const EventFilter& filter) const;

    /**
     * @brief Move events older than the cutoff to the cold tier
     *
     * @return Number of events moved
     */
    size_t archive(Timestamp older_than);

    std::vector<Event> archived(const std::string& user_id) const;

private:
    MemoryStore& store_;
    RetryPolicy write_retry_;
};

} // namespace cogmem
