#include "cogmem/pipeline/sweep_scheduler.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace cogmem {

SweepScheduler::SweepScheduler(CognitivePipeline& pipeline, SchedulerConfig config)
    : pipeline_(pipeline), config_(config) {
    if (config_.max_parallel_users < 1) config_.max_parallel_users = 1;
}

void SweepScheduler::note_events(const std::string& user_id, size_t count, Timestamp now) {
    if (count == 0) return;
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& state = users_[user_id];
    if (state.pending == 0) state.first_pending_at = now;
    state.pending += count;
}

size_t SweepScheduler::pending_events(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = users_.find(user_id);
    return it == users_.end() ? 0 : it->second.pending;
}

std::vector<std::string> SweepScheduler::due_users(Timestamp now) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Timestamp interval = static_cast<Timestamp>(config_.sweep_interval_minutes) * 60;

    std::vector<std::string> due;
    for (const auto& [user_id, state] : users_) {
        if (state.pending == 0) continue;
        bool batch_full = state.pending >= static_cast<size_t>(config_.sweep_event_batch);
        Timestamp since = std::max(state.last_sweep_at, state.first_pending_at);
        bool interval_elapsed = now - since >= interval;
        if (batch_full || interval_elapsed) {
            due.push_back(user_id);
        }
    }
    return due;
}

std::vector<SweepReport> SweepScheduler::run_due(Timestamp now) {
    return run_users(due_users(now), now);
}

std::vector<SweepReport> SweepScheduler::run_users(const std::vector<std::string>& user_ids, Timestamp now) {
    std::vector<SweepReport> reports(user_ids.size());
    const size_t width = static_cast<size_t>(config_.max_parallel_users);

    for (size_t batch_start = 0; batch_start < user_ids.size(); batch_start += width) {
        if (token_.is_cancelled()) break;

        size_t batch_end = std::min(user_ids.size(), batch_start + width);
        std::vector<std::thread> workers;
        workers.reserve(batch_end - batch_start);

        for (size_t i = batch_start; i < batch_end; ++i) {
            workers.emplace_back([this, &reports, &user_ids, i, now]() {
                // std::logic_error (broken invariant) is left to terminate the process
                try {
                    reports[i] = pipeline_.run_sweep(user_ids[i], now, &token_);
                } catch (const std::runtime_error& e) {
                    reports[i].user_id = user_ids[i];
                    reports[i].ran_at = now;
                    reports[i].success = false;
                    reports[i].error_message = e.what();
                    std::cerr << "Sweep for " << user_ids[i] << " failed: " << e.what() << std::endl;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    for (size_t i = 0; i < user_ids.size(); ++i) {
        if (!reports[i].success) continue;
        auto& state = users_[user_ids[i]];
        state.pending = 0;
        state.first_pending_at = 0;
        state.last_sweep_at = now;
    }

    // Skipped (cancelled before start) users keep their pending counters
    reports.erase(std::remove_if(reports.begin(), reports.end(),
        [](const SweepReport& r) { return r.user_id.empty(); }), reports.end());
    return reports;
}

} // namespace cogmem
