#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace cogmem {

/**
 * @brief One mutex per user, created on first use
 *
 * Every mutation of a user's views happens under that user's mutex, so
 * ingest-time evidence and sweeps never interleave for the same user while
 * different users proceed in parallel.
 */
class UserLockTable {
public:
    std::mutex& lock_for(const std::string& user_id) {
        std::lock_guard<std::mutex> guard(table_mutex_);
        auto& slot = locks_[user_id];
        if (!slot) slot = std::make_unique<std::mutex>();
        return *slot;
    }

    size_t size() const {
        std::lock_guard<std::mutex> guard(table_mutex_);
        return locks_.size();
    }

private:
    mutable std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

/**
 * @brief Cooperative cancellation flag, checked between units of work
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace cogmem
