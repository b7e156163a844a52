#include "cogmem/cognitive/evidence_feed.hpp"
#include "cogmem/core/text_utils.hpp"

namespace cogmem {

std::string evidence_kind_to_string(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::Supporting: return "supporting";
        case EvidenceKind::Counter: return "counter";
        case EvidenceKind::None: return "none";
        default: return "none";
    }
}

EvidenceFeed::EvidenceFeed(const PromotionGate& gate)
    : gate_(gate),
      negation_prefixes_({"没有", "停止", "不", "没", "别"}) {
    add_opposition("戒", "喝");
    add_opposition("戒", "吃");
    add_opposition("戒", "抽");
    add_opposition("退", "购买");
    add_opposition("退", "买");
    add_opposition("讨厌", "喜欢");
}

void EvidenceFeed::add_opposition(const std::string& action, const std::string& opposed_action) {
    opposites_[action].insert(opposed_action);
    opposites_[opposed_action].insert(action);
}

bool EvidenceFeed::same_target(const std::string& a, const std::string& b) {
    std::string x = to_lower_ascii(trim(a));
    std::string y = to_lower_ascii(trim(b));
    if (x.empty() || y.empty()) return false;
    return x == y || contains(x, y) || contains(y, x);
}

bool EvidenceFeed::opposes(const std::string& event_action, const std::string& view_action) const {
    if (event_action.empty() || view_action.empty() || event_action == view_action) return false;

    for (const auto& prefix : negation_prefixes_) {
        if (event_action == prefix + view_action || view_action == prefix + event_action) {
            return true;
        }
    }

    auto it = opposites_.find(event_action);
    return it != opposites_.end() && it->second.count(view_action) > 0;
}

EvidenceKind EvidenceFeed::classify(const Event& event, const DerivedView& view) const {
    if (event.user_id != view.user_id || view.action.empty()) return EvidenceKind::None;
    if (!same_target(event.target, view.subject)) return EvidenceKind::None;

    if (event.action == view.action && trim(event.target) == trim(view.subject)) {
        return EvidenceKind::Supporting;
    }
    if (opposes(event.action, view.action)) {
        return EvidenceKind::Counter;
    }
    return EvidenceKind::None;
}

EvidenceKind EvidenceFeed::apply(DerivedView& view, const Event& event, Timestamp now) const {
    if (view.status != ViewStatus::Active || event.event_id.empty()) return EvidenceKind::None;

    EvidenceKind kind = classify(event, view);
    if (kind == EvidenceKind::None) return kind;

    if (view.has_evidence(event.event_id)) return EvidenceKind::None;

    if (kind == EvidenceKind::Supporting) {
        view.derived_from.push_back(event.event_id);
        view.validation_count = static_cast<int>(view.derived_from.size());
    } else {
        view.counter_evidence.push_back(event.event_id);
    }

    view.confidence = gate_.recalculate_confidence(view);
    view.updated_at = now;
    return kind;
}

} // namespace cogmem
