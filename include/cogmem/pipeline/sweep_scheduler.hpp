#pragma once

#include "cogmem/config/engine_config.hpp"
#include "cogmem/pipeline/cognitive_pipeline.hpp"
#include "cogmem/pipeline/user_lock_table.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Decides which users are due for a sweep and runs them in parallel
 *
 * A user becomes due after sweep_event_batch new events, or once
 * sweep_interval_minutes have passed since the last sweep with at least one
 * new event. Sweeps for different users run on separate threads; the
 * pipeline's per-user lock keeps any single user serialized.
 */
class SweepScheduler {
public:
    SweepScheduler(CognitivePipeline& pipeline, SchedulerConfig config = {});

    /**
     * @brief Record newly ingested events for a user
     */
    void note_events(const std::string& user_id, size_t count, Timestamp now);

    std::vector<std::string> due_users(Timestamp now) const;

    /**
     * @brief Sweep every due user, at most max_parallel_users at a time
     */
    std::vector<SweepReport> run_due(Timestamp now);

    /**
     * @brief Sweep the given users regardless of their counters
     */
    std::vector<SweepReport> run_users(const std::vector<std::string>& user_ids, Timestamp now);

    /**
     * @brief Ask in-flight sweeps to stop after their current view
     */
    void cancel() { token_.cancel(); }
    void reset_cancellation() { token_.reset(); }

    size_t pending_events(const std::string& user_id) const;

private:
    struct UserState {
        size_t pending = 0;
        Timestamp first_pending_at = 0;
        Timestamp last_sweep_at = 0;
    };

    CognitivePipeline& pipeline_;
    SchedulerConfig config_;
    CancellationToken token_;
    mutable std::mutex state_mutex_;
    std::map<std::string, UserState> users_;
};

} // namespace cogmem
