#include "cogmem/cognitive/pattern_detector.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <tuple>

namespace cogmem {

namespace {

struct GroupStats {
    std::vector<std::string> event_ids;
    double confidence_sum = 0.0;
};

// "没喝", "不吃": a refusal is not a choice among targets
bool is_negated_action(const std::string& action) {
    for (const char* prefix : {"不", "没", "别", "停止"}) {
        if (starts_with(action, prefix)) return true;
    }
    return false;
}

} // anonymous namespace

PatternDetector::PatternDetector(const EventStore& events, DetectorConfig config)
    : events_(events), config_(config) {
    if (config_.hour_bucket_size < 1) config_.hour_bucket_size = 1;
}

std::string PatternDetector::frequency_hypothesis(int hour, const std::string& action, const std::string& target) {
    if (action == target) {
        // Intransitive actions ("跑步") carry the verb as their target
        return "用户倾向于在" + std::to_string(hour) + "点左右" + action;
    }
    return "用户倾向于在" + std::to_string(hour) + "点左右" + action + target;
}

std::string PatternDetector::preference_hypothesis(const std::string& action, const std::string& target) {
    return "用户" + action + "时偏好" + target;
}

std::vector<DerivedView> PatternDetector::detect_patterns(const std::string& user_id,
                                                          int lookback_days,
                                                          Timestamp now) const {
    EventFilter filter;
    filter.user_id = user_id;
    filter.from = now - days(lookback_days);
    filter.to = now + 1;

    // (action, target, bucket start hour) -> stats
    std::map<std::tuple<std::string, std::string, int>, GroupStats> frequency_groups;
    // action -> target -> stats
    std::map<std::string, std::map<std::string, GroupStats>> preference_groups;

    auto cursor = events_.query(filter);
    Event event;
    size_t scanned = 0;
    while (cursor->next(event)) {
        ++scanned;
        int bucket = (hour_of_day(event.timestamp) / config_.hour_bucket_size) * config_.hour_bucket_size;

        auto& freq = frequency_groups[std::make_tuple(event.action, event.target, bucket)];
        freq.event_ids.push_back(event.event_id);
        freq.confidence_sum += event.confidence;

        // Intransitive actions carry no target to choose between
        if (event.action == event.target || is_negated_action(event.action)) continue;
        auto& pref = preference_groups[event.action][event.target];
        pref.event_ids.push_back(event.event_id);
        pref.confidence_sum += event.confidence;
    }

    std::vector<DerivedView> views;

    // Frequency patterns
    for (const auto& [key, stats] : frequency_groups) {
        int count = static_cast<int>(stats.event_ids.size());
        if (count < config_.frequency_threshold) continue;

        const auto& [action, target, hour] = key;
        double mean = stats.confidence_sum / count;
        double confidence = std::clamp(mean * config_.llm_discount, 0.0, 1.0);

        views.push_back(DerivedView::create(
            user_id,
            frequency_hypothesis(hour, action, target),
            view_types::Habit,
            target,
            action,
            stats.event_ids,
            confidence,
            now,
            config_.view_ttl_days
        ));
    }

    // Preference patterns: a single target seen often enough is chosen every time
    for (const auto& [action, targets] : preference_groups) {
        size_t total = 0;
        for (const auto& entry : targets) total += entry.second.event_ids.size();

        for (const auto& [target, stats] : targets) {
            int count = static_cast<int>(stats.event_ids.size());
            double ratio = static_cast<double>(count) / static_cast<double>(total);
            if (count < config_.preference_min_count || ratio < config_.preference_ratio) continue;

            views.push_back(DerivedView::create(
                user_id,
                preference_hypothesis(action, target),
                view_types::Preference,
                target,
                action,
                stats.event_ids,
                ratio,
                now,
                config_.view_ttl_days
            ));
        }
    }

    if (config_.verbose) {
        std::cout << "Pattern detection for " << user_id << ": scanned " << scanned
                  << " events, proposed " << views.size() << " views" << std::endl;
    }

    return views;
}

} // namespace cogmem
