#include "cogmem/pipeline/cognitive_pipeline.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>

namespace cogmem {

using json = nlohmann::json;

// ============================================================================
// Result Helpers
// ============================================================================

json IngestResult::to_json() const {
    return {
        {"raw_id", raw_id},
        {"event_ids", event_ids},
        {"entity_ids", entity_ids},
        {"extractor_used", extractor_used},
        {"used_fallback", used_fallback},
        {"dropped_candidates", dropped_candidates},
        {"supporting_evidence", supporting_evidence},
        {"counter_evidence", counter_evidence},
        {"views_updated", views_updated},
        {"success", success},
        {"error_message", error_message}
    };
}

void SweepReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Sweep Summary: " << user_id << " @ " << to_iso8601(ran_at) << "\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Pattern Detection:\n";
    std::cout << "  Proposed: " << views_proposed << "\n";
    std::cout << "  Created: " << views_created << "\n";
    std::cout << "  Merged: " << views_merged << "\n\n";

    std::cout << "Promotion Gate:\n";
    std::cout << "  Promoted: " << promoted << "\n";
    std::cout << "  Expired: " << expired << "\n";
    std::cout << "  Rejected: " << rejected << "\n";
    std::cout << "  Kept active: " << kept_active << "\n";
    std::cout << "  Blocked by conflict: " << blocked_by_conflict << "\n\n";

    if (!conflicts.empty()) {
        std::cout << "Conflicts:\n";
        for (const auto& c : conflicts) {
            std::cout << "  [" << c.kind << "] " << c.view_a << " <-> " << c.view_b
                      << ": " << c.reason << "\n";
        }
        std::cout << "\n";
    }

    if (!concept_ids.empty()) {
        std::cout << "New concepts:\n";
        for (const auto& id : concept_ids) {
            std::cout << "  " << id << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Duration: " << duration_seconds << " seconds\n";
    if (cancelled) std::cout << "Sweep was cancelled\n";
    if (!error_message.empty()) std::cout << "Error: " << error_message << "\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json SweepReport::to_json() const {
    json conflict_list = json::array();
    for (const auto& c : conflicts) conflict_list.push_back(c.to_json());

    return {
        {"user_id", user_id},
        {"ran_at", to_iso8601(ran_at)},
        {"views_proposed", views_proposed},
        {"views_created", views_created},
        {"views_merged", views_merged},
        {"conflicts_found", conflicts_found},
        {"promoted", promoted},
        {"expired", expired},
        {"rejected", rejected},
        {"kept_active", kept_active},
        {"blocked_by_conflict", blocked_by_conflict},
        {"write_retries", write_retries},
        {"concept_ids", concept_ids},
        {"conflicts", conflict_list},
        {"cancelled", cancelled},
        {"success", success},
        {"error_message", error_message},
        {"duration_seconds", duration_seconds}
    };
}

// ============================================================================
// Construction
// ============================================================================

ConflictLexicon CognitivePipeline::load_lexicon(const EngineConfig& config) {
    if (config.conflict_lexicon_path.empty()) {
        return ConflictLexicon::defaults();
    }
    return ConflictLexicon::from_json_file(config.conflict_lexicon_path);
}

CognitivePipeline::CognitivePipeline(MemoryStore& store,
                                     EngineConfig config,
                                     std::unique_ptr<InferenceProvider> provider)
    : store_(store),
      config_(std::move(config)),
      provider_(std::move(provider)),
      events_(store_, config_.storage_retry),
      extractor_(provider_.get(), config_.verbose),
      resolver_(store_, config_.resolver),
      relations_(store_, config_.resolver.attribute_decay_days),
      detector_(events_, config_.detector),
      conflicts_(load_lexicon(config_)),
      gate_(config_.gate),
      feed_(gate_),
      registry_(store_, config_.verbose) {}

// ============================================================================
// Ingest
// ============================================================================

IngestResult CognitivePipeline::ingest(const std::string& user_id,
                                       const std::string& text,
                                       const std::string& context,
                                       Timestamp now) {
    if (trim(user_id).empty()) {
        throw ValidationError("user_id is required");
    }
    if (trim(text).empty()) {
        throw ValidationError("input text is empty");
    }

    IngestResult result;

    // Raw input first: it is kept even if nothing can be extracted
    RawInput raw;
    raw.raw_id = generate_id("raw");
    raw.user_id = user_id;
    raw.content = text;
    raw.context = context;
    raw.received_at = now;
    retry_with_backoff<StorageUnavailable>(
        [&]() { store_.insert_raw_input(raw); },
        config_.storage_retry, "insert_raw_input");
    result.raw_id = raw.raw_id;

    ExtractionOutcome outcome = extractor_.extract(user_id, text, context, raw.raw_id, now);
    result.extractor_used = outcome.extractor_used;
    result.used_fallback = outcome.used_fallback;
    result.dropped_candidates = outcome.dropped_candidates;
    result.error_message = outcome.error_message;

    std::vector<Event> stored;
    for (auto& event : outcome.events) {
        try {
            event.event_id = events_.append(event);
            result.event_ids.push_back(event.event_id);
            stored.push_back(event);
        } catch (const ValidationError& e) {
            result.dropped_candidates++;
            if (config_.verbose) {
                std::cerr << "  Dropped event: " << e.what() << std::endl;
            }
        }
    }

    if (!stored.empty()) {
        retry_with_backoff<StorageUnavailable>(
            [&]() { store_.set_raw_event_count(raw.raw_id, static_cast<int>(stored.size())); },
            config_.storage_retry, "set_raw_event_count");
    }

    // Stored events reach the views before anything else can fail: no sweep
    // rescans old events for counter evidence
    feed_evidence(user_id, stored, now, result);

    // Entities named by the events, linked when they share this input
    std::set<std::string> seen_targets;
    for (const auto& event : stored) {
        if (event.target == event.action || !seen_targets.insert(event.target).second) continue;
        Entity entity = retry_with_backoff<StorageUnavailable>(
            [&]() { return resolver_.resolve(user_id, event.target, text, event.timestamp); },
            config_.storage_retry, "resolve_entity");
        result.entity_ids.push_back(entity.entity_id);
    }
    relations_.observe(user_id, result.entity_ids, now);

    result.success = !stored.empty();
    if (config_.verbose) {
        std::cout << "Ingested " << result.raw_id << ": " << stored.size() << " events via "
                  << result.extractor_used << (result.used_fallback ? " (fallback)" : "")
                  << ", " << result.entity_ids.size() << " entities" << std::endl;
    }
    return result;
}

void CognitivePipeline::feed_evidence(const std::string& user_id,
                                      const std::vector<Event>& stored,
                                      Timestamp now,
                                      IngestResult& result) {
    if (stored.empty()) return;

    std::lock_guard<std::mutex> guard(locks_.lock_for(user_id));

    for (const auto& snapshot : store_.list_views(user_id, ViewStatus::Active)) {
        for (int attempt = 0; attempt < kMaxOptimisticRetries; ++attempt) {
            auto current = store_.get_view(snapshot.view_id);
            if (!current || current->status != ViewStatus::Active) break;

            DerivedView view = *current;
            int supporting = 0;
            int counter = 0;
            for (const auto& event : stored) {
                EvidenceKind kind = feed_.apply(view, event, now);
                if (kind == EvidenceKind::Supporting) ++supporting;
                else if (kind == EvidenceKind::Counter) ++counter;
            }
            if (supporting + counter == 0) break;

            if (store_.update_view(view, current->revision)) {
                result.supporting_evidence += supporting;
                result.counter_evidence += counter;
                result.views_updated++;
                break;
            }
            if (attempt + 1 == kMaxOptimisticRetries) {
                throw StorageUnavailable("view " + view.view_id + " kept changing during evidence update");
            }
        }
    }
}

// ============================================================================
// Sweep
// ============================================================================

bool CognitivePipeline::merge_candidate(DerivedView existing,
                                        const DerivedView& candidate,
                                        Timestamp now,
                                        SweepReport& report) {
    for (int attempt = 0; attempt < kMaxOptimisticRetries; ++attempt) {
        DerivedView view = existing;
        bool added = false;
        for (const auto& id : candidate.derived_from) {
            if (!view.has_evidence(id)) {
                view.derived_from.push_back(id);
                added = true;
            }
        }
        view.validation_count = static_cast<int>(view.derived_from.size());
        double rescored = gate_.recalculate_confidence(view);

        // Re-detection on a later sweep confirms the pattern over time: the
        // detector's discounted estimate gives way to the evidence count
        bool confirmed = now > view.created_at && rescored != view.confidence;
        if (!added && !confirmed) return false;

        view.confidence = rescored;
        view.updated_at = now;

        if (store_.update_view(view, existing.revision)) {
            return true;
        }

        report.write_retries++;
        auto reloaded = store_.get_view(existing.view_id);
        if (!reloaded || reloaded->status != ViewStatus::Active) return false;
        existing = *reloaded;
    }
    throw StorageUnavailable("view " + existing.view_id + " kept changing during merge");
}

void CognitivePipeline::evaluate_view(const std::string& view_id,
                                      const std::vector<ViewConflict>& conflicts,
                                      Timestamp now,
                                      SweepReport& report) {
    for (int attempt = 0; attempt < kMaxOptimisticRetries; ++attempt) {
        auto current = store_.get_view(view_id);
        if (!current) return;

        GateDecision decision = gate_.evaluate(*current, now, ConflictDetector::conflicts_for(conflicts, view_id));

        if (decision.action == GateAction::NoChange) return;
        if (decision.action == GateAction::KeepActive) {
            report.kept_active++;
            if (decision.conflict_detected) report.blocked_by_conflict++;
            return;
        }

        bool written = false;
        std::string concept_id;
        store_.run_in_transaction([&]() {
            DerivedView next = *current;
            gate_.apply_decision(next, decision, now);
            if (!store_.update_view(next, current->revision)) return;
            written = true;
            if (decision.action == GateAction::Promote) {
                concept_id = registry_.promote(next, now);
            }
        });

        if (!written) {
            report.write_retries++;
            continue;
        }

        switch (decision.action) {
            case GateAction::Promote:
                report.promoted++;
                report.concept_ids.push_back(concept_id);
                break;
            case GateAction::Expire:
                report.expired++;
                break;
            case GateAction::Reject:
                report.rejected++;
                break;
            default:
                break;
        }

        if (config_.verbose) {
            std::cout << "  " << view_id << " -> " << gate_action_to_string(decision.action)
                      << " (" << decision.reason << ")" << std::endl;
        }
        return;
    }
    throw StorageUnavailable("view " + view_id + " kept changing during evaluation");
}

SweepReport CognitivePipeline::run_sweep(const std::string& user_id,
                                         Timestamp now,
                                         const CancellationToken* cancel) {
    SweepReport report;
    report.user_id = user_id;
    report.ran_at = now;
    auto start = std::chrono::steady_clock::now();

    auto cancelled = [&]() {
        if (cancel && cancel->is_cancelled()) {
            report.cancelled = true;
            return true;
        }
        return false;
    };

    try {
        std::lock_guard<std::mutex> guard(locks_.lock_for(user_id));

        std::vector<DerivedView> candidates = detector_.detect_patterns(user_id, now);
        report.views_proposed = static_cast<int>(candidates.size());

        std::vector<DerivedView> known = store_.list_views(user_id);
        Timestamp cooldown_start = now - days(config_.detector.lookback_days);

        for (const auto& candidate : candidates) {
            if (cancelled()) break;

            auto active = std::find_if(known.begin(), known.end(), [&](const DerivedView& v) {
                return v.status == ViewStatus::Active && v.subject_key() == candidate.subject_key();
            });
            if (active != known.end()) {
                if (merge_candidate(*active, candidate, now, report)) report.views_merged++;
                continue;
            }

            // A recently settled hypothesis is not re-proposed from the same window
            bool settled = std::any_of(known.begin(), known.end(), [&](const DerivedView& v) {
                return v.status != ViewStatus::Active && v.subject_key() == candidate.subject_key() &&
                       v.updated_at >= cooldown_start;
            });
            if (settled) continue;

            store_.insert_view(candidate);
            known.push_back(candidate);
            report.views_created++;
        }

        if (!report.cancelled) {
            std::vector<DerivedView> active = store_.list_views(user_id, ViewStatus::Active);
            report.conflicts = conflicts_.find_conflicts(active);
            report.conflicts_found = static_cast<int>(report.conflicts.size());

            for (const auto& view : active) {
                if (cancelled()) break;
                evaluate_view(view.view_id, report.conflicts, now, report);
            }
        }

        report.success = !report.cancelled;
    } catch (const CogmemError& e) {
        report.success = false;
        report.error_message = e.what();
        std::cerr << "Sweep failed for " << user_id << ": " << e.what() << std::endl;
    }

    auto end = std::chrono::steady_clock::now();
    report.duration_seconds = std::chrono::duration<double>(end - start).count();

    if (config_.verbose) {
        report.print_summary();
    }
    return report;
}

size_t CognitivePipeline::archive(Timestamp now) {
    size_t moved = events_.archive(now - days(config_.event_archive_days));
    moved += store_.archive_views(now - days(config_.view_retention_days));
    return moved;
}

} // namespace cogmem
