#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Gate Configuration
// ============================================================================

struct GateConfig {
    double promote_confidence = 0.85;       ///< Strictly greater than
    int min_age_days = 30;                  ///< Minimum view age before promotion
    int min_validations = 3;                ///< Minimum supporting events
    double promote_ratio = 0.15;            ///< Max counter/support ratio to promote
    double reject_ratio = 0.30;             ///< Ratio strictly above this rejects
    double confidence_base = 0.5;
    double confidence_log_weight = 0.5;     ///< Weight of log10(validation_count)
    double counter_penalty = 0.1;           ///< Subtracted per counter event
};

// ============================================================================
// Gate Decision
// ============================================================================

enum class GateAction {
    KeepActive,
    Promote,
    Expire,
    Reject,
    NoChange                                ///< View already terminal
};

std::string gate_action_to_string(GateAction action);

/**
 * @brief Outcome of one gate evaluation
 *
 * A conflict is reported here as a flag. It is an outcome, not an error.
 */
struct GateDecision {
    GateAction action = GateAction::KeepActive;
    ViewStatus resulting_status = ViewStatus::Active;
    bool conflict_detected = false;
    std::vector<std::string> conflicting_view_ids;
    std::string reason;

    nlohmann::json to_json() const;
};

// ============================================================================
// Promotion Gate
// ============================================================================

/**
 * @brief Deterministic rule engine that decides a Derived View's fate
 *
 * evaluate() is pure: it reads the view and the clock and returns a
 * decision. apply_decision() is the only state transition and refuses to
 * move a view backwards.
 */
class PromotionGate {
public:
    explicit PromotionGate(GateConfig config = {});

    /**
     * @brief Decide a view's fate at time now
     *
     * Order: terminal views are a no-op, then Reject (ratio > reject_ratio),
     * then Promote, then Expire, else KeepActive. An otherwise promotable
     * view blocked by a conflict is kept active past its expiry.
     */
    GateDecision evaluate(const DerivedView& view,
                          Timestamp now,
                          const std::vector<std::string>& conflicting_view_ids = {}) const;

    /**
     * @brief Apply a decision to a view in memory
     *
     * @return true if the view changed status
     * @throws std::logic_error when the decision would move a terminal view
     */
    bool apply_decision(DerivedView& view, const GateDecision& decision, Timestamp now) const;

    /**
     * @brief clamp(base + log10(validation_count) * log_weight - |counter| * penalty, 0, 1)
     */
    double recalculate_confidence(const DerivedView& view) const;

    /**
     * @throws std::logic_error unless from == to or from is Active
     */
    static void check_transition(ViewStatus from, ViewStatus to);

    const GateConfig& config() const { return config_; }

private:
    GateConfig config_;

    bool meets_promotion_criteria(const DerivedView& view, Timestamp now) const;
};

} // namespace cogmem
