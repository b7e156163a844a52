#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/event/event_store.hpp"
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Detector Configuration
// ============================================================================

struct DetectorConfig {
    int lookback_days = 30;                 ///< Window scanned per sweep
    int frequency_threshold = 20;           ///< Events per (action, target, hour) group
    int hour_bucket_size = 1;               ///< Width of the hour-of-day bucket
    double llm_discount = 0.7;              ///< Applied to the mean raw confidence
    double preference_ratio = 0.7;          ///< Share of one target among an action's events
    int preference_min_count = 5;           ///< Minimum occurrences of the preferred target
    int view_ttl_days = 30;                 ///< expires_at = created_at + ttl
    bool verbose = false;
};

// ============================================================================
// Pattern Detector
// ============================================================================

/**
 * @brief Proposes Derived Views from recurring events
 *
 * Pure over the events it reads: it never writes to storage. Deciding what
 * becomes of the proposals is left to the caller and the Promotion Gate.
 */
class PatternDetector {
public:
    explicit PatternDetector(const EventStore& events, DetectorConfig config = {});

    /**
     * @brief Detect frequency and preference patterns in [now - lookback, now]
     *
     * Events are streamed through the store cursor, never loaded in bulk.
     */
    std::vector<DerivedView> detect_patterns(const std::string& user_id,
                                             int lookback_days,
                                             Timestamp now) const;

    std::vector<DerivedView> detect_patterns(const std::string& user_id, Timestamp now) const {
        return detect_patterns(user_id, config_.lookback_days, now);
    }

    static std::string frequency_hypothesis(int hour, const std::string& action, const std::string& target);
    static std::string preference_hypothesis(const std::string& action, const std::string& target);

    const DetectorConfig& config() const { return config_; }

private:
    const EventStore& events_;
    DetectorConfig config_;
};

} // namespace cogmem
