#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/cognitive/promotion_gate.hpp"
#include "cogmem/event/event.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace cogmem {

enum class EvidenceKind {
    None,
    Supporting,
    Counter
};

std::string evidence_kind_to_string(EvidenceKind kind);

/**
 * @brief Routes new events into the views they support or contradict
 *
 * An event with the view's (action, target) supports it. An event on the
 * same target whose action opposes the view's action ("没喝" vs "喝",
 * "戒" vs "抽") is counter evidence.
 */
class EvidenceFeed {
public:
    explicit EvidenceFeed(const PromotionGate& gate);

    EvidenceKind classify(const Event& event, const DerivedView& view) const;

    /**
     * @brief Record the event against the view and recalculate confidence
     *
     * Event ids are never added twice, and terminal views are left alone.
     *
     * @return The kind of evidence recorded (None when nothing changed)
     */
    EvidenceKind apply(DerivedView& view, const Event& event, Timestamp now) const;

    bool opposes(const std::string& event_action, const std::string& view_action) const;

    void add_opposition(const std::string& action, const std::string& opposed_action);

private:
    const PromotionGate& gate_;
    std::vector<std::string> negation_prefixes_;
    std::map<std::string, std::set<std::string>> opposites_;

    static bool same_target(const std::string& a, const std::string& b);
};

} // namespace cogmem
