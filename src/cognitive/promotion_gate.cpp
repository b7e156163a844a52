#include "cogmem/cognitive/promotion_gate.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cogmem {

std::string gate_action_to_string(GateAction action) {
    switch (action) {
        case GateAction::KeepActive: return "keep_active";
        case GateAction::Promote: return "promote";
        case GateAction::Expire: return "expire";
        case GateAction::Reject: return "reject";
        case GateAction::NoChange: return "no_change";
        default: return "keep_active";
    }
}

nlohmann::json GateDecision::to_json() const {
    return {
        {"action", gate_action_to_string(action)},
        {"resulting_status", view_status_to_string(resulting_status)},
        {"conflict_detected", conflict_detected},
        {"conflicting_view_ids", conflicting_view_ids},
        {"reason", reason}
    };
}

PromotionGate::PromotionGate(GateConfig config) : config_(config) {}

double PromotionGate::recalculate_confidence(const DerivedView& view) const {
    double support = std::log10(static_cast<double>(std::max(1, view.validation_count)));
    double value = config_.confidence_base
                 + support * config_.confidence_log_weight
                 - static_cast<double>(view.counter_evidence.size()) * config_.counter_penalty;
    return std::clamp(value, 0.0, 1.0);
}

bool PromotionGate::meets_promotion_criteria(const DerivedView& view, Timestamp now) const {
    return view.confidence > config_.promote_confidence &&
           days_between(view.created_at, now) >= config_.min_age_days &&
           view.validation_count >= config_.min_validations &&
           view.counter_ratio() <= config_.promote_ratio;
}

GateDecision PromotionGate::evaluate(const DerivedView& view,
                                     Timestamp now,
                                     const std::vector<std::string>& conflicting_view_ids) const {
    GateDecision decision;
    decision.conflicting_view_ids = conflicting_view_ids;
    decision.conflict_detected = !conflicting_view_ids.empty();

    if (view.status != ViewStatus::Active) {
        decision.action = GateAction::NoChange;
        decision.resulting_status = view.status;
        decision.reason = "already " + view_status_to_string(view.status);
        return decision;
    }

    double ratio = view.counter_ratio();
    if (ratio > config_.reject_ratio) {
        std::ostringstream oss;
        oss << "counter evidence ratio " << ratio << " exceeds " << config_.reject_ratio;
        decision.action = GateAction::Reject;
        decision.resulting_status = ViewStatus::Rejected;
        decision.reason = oss.str();
        return decision;
    }

    bool promotable = meets_promotion_criteria(view, now);
    if (promotable && !decision.conflict_detected) {
        std::ostringstream oss;
        oss << "confidence " << view.confidence << ", " << view.validation_count
            << " validations, age " << static_cast<int>(days_between(view.created_at, now)) << " days";
        decision.action = GateAction::Promote;
        decision.resulting_status = ViewStatus::Promoted;
        decision.reason = oss.str();
        return decision;
    }

    if (now >= view.expires_at) {
        if (promotable) {
            // Held until the conflict resolves one way or the other
            decision.action = GateAction::KeepActive;
            decision.resulting_status = ViewStatus::Active;
            decision.reason = "promotion blocked by conflict";
            return decision;
        }
        decision.action = GateAction::Expire;
        decision.resulting_status = ViewStatus::Expired;
        decision.reason = "expired without meeting promotion criteria";
        return decision;
    }

    decision.action = GateAction::KeepActive;
    decision.resulting_status = ViewStatus::Active;
    decision.reason = decision.conflict_detected ? "conflicting views present" : "awaiting validation";
    return decision;
}

void PromotionGate::check_transition(ViewStatus from, ViewStatus to) {
    if (from == to || from == ViewStatus::Active) return;
    throw std::logic_error("Illegal view transition " + view_status_to_string(from) +
                           " -> " + view_status_to_string(to));
}

bool PromotionGate::apply_decision(DerivedView& view, const GateDecision& decision, Timestamp now) const {
    if (decision.action == GateAction::NoChange) {
        check_transition(view.status, decision.resulting_status);
        return false;
    }

    check_transition(view.status, decision.resulting_status);
    if (view.status == decision.resulting_status) {
        return false;
    }

    view.status = decision.resulting_status;
    view.updated_at = now;
    return true;
}

} // namespace cogmem
