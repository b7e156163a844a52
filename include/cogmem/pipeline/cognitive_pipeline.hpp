#pragma once

#include "cogmem/cognitive/concept_registry.hpp"
#include "cogmem/cognitive/conflict_detector.hpp"
#include "cogmem/cognitive/evidence_feed.hpp"
#include "cogmem/cognitive/pattern_detector.hpp"
#include "cogmem/cognitive/promotion_gate.hpp"
#include "cogmem/config/engine_config.hpp"
#include "cogmem/entity/entity_resolver.hpp"
#include "cogmem/entity/relation_tracker.hpp"
#include "cogmem/event/event_store.hpp"
#include "cogmem/extraction/event_extractor.hpp"
#include "cogmem/pipeline/user_lock_table.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Results
// ============================================================================

/**
 * @brief What one ingest() call stored and touched
 */
struct IngestResult {
    std::string raw_id;
    std::vector<std::string> event_ids;
    std::vector<std::string> entity_ids;
    std::string extractor_used;
    bool used_fallback = false;
    int dropped_candidates = 0;
    int supporting_evidence = 0;            ///< Event-to-view links added
    int counter_evidence = 0;
    int views_updated = 0;
    bool success = false;                   ///< At least one event stored
    std::string error_message;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of one user's sweep
 */
struct SweepReport {
    std::string user_id;
    Timestamp ran_at = 0;
    int views_proposed = 0;
    int views_created = 0;
    int views_merged = 0;
    int conflicts_found = 0;
    int promoted = 0;
    int expired = 0;
    int rejected = 0;
    int kept_active = 0;
    int blocked_by_conflict = 0;
    int write_retries = 0;
    std::vector<std::string> concept_ids;
    std::vector<ViewConflict> conflicts;
    bool cancelled = false;
    bool success = false;
    std::string error_message;
    double duration_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Cognitive Pipeline
// ============================================================================

/**
 * @brief Wires extraction, entities, views, the gate and the registry together
 *
 * ingest() is synchronous and only does cheap per-event work. Pattern
 * detection and promotion happen in run_sweep(), typically driven by a
 * SweepScheduler.
 */
class CognitivePipeline {
public:
    /**
     * @param store Storage boundary, must outlive the pipeline
     * @param config Engine configuration
     * @param provider Inference back end, null for rule-only extraction
     */
    CognitivePipeline(MemoryStore& store,
                      EngineConfig config,
                      std::unique_ptr<InferenceProvider> provider = nullptr);

    /**
     * @brief Persist a raw input, extract and store its events, resolve entities
     *        and feed the events into the user's active views
     *
     * The raw input is stored before extraction, so it survives even when no
     * event can be extracted.
     *
     * @throws ValidationError for an empty user id or blank text
     * @throws StorageUnavailable when storage stays unavailable after retries
     */
    IngestResult ingest(const std::string& user_id,
                        const std::string& text,
                        const std::string& context,
                        Timestamp now);

    /**
     * @brief Detect patterns, reconcile views, check conflicts and run the gate
     *
     * Each view's transition (and its promotion into the registry) is one
     * transaction. Cancellation is honoured between views.
     */
    SweepReport run_sweep(const std::string& user_id,
                          Timestamp now,
                          const CancellationToken* cancel = nullptr);

    /**
     * @brief Move old events and old terminal views to the cold tier
     *
     * @return Number of rows moved
     */
    size_t archive(Timestamp now);

    MemoryStore& store() { return store_; }
    EventStore& events() { return events_; }
    EntityResolver& resolver() { return resolver_; }
    RelationTracker& relations() { return relations_; }
    const PatternDetector& detector() const { return detector_; }
    const ConflictDetector& conflicts() const { return conflicts_; }
    const PromotionGate& gate() const { return gate_; }
    ConceptRegistry& registry() { return registry_; }
    UserLockTable& locks() { return locks_; }
    const EngineConfig& config() const { return config_; }

private:
    static constexpr int kMaxOptimisticRetries = 5;

    MemoryStore& store_;
    EngineConfig config_;
    std::unique_ptr<InferenceProvider> provider_;
    EventStore events_;
    EventExtractor extractor_;
    EntityResolver resolver_;
    RelationTracker relations_;
    PatternDetector detector_;
    ConflictDetector conflicts_;
    PromotionGate gate_;
    EvidenceFeed feed_;
    ConceptRegistry registry_;
    UserLockTable locks_;

    static ConflictLexicon load_lexicon(const EngineConfig& config);

    void feed_evidence(const std::string& user_id,
                       const std::vector<Event>& stored,
                       Timestamp now,
                       IngestResult& result);

    bool merge_candidate(DerivedView existing, const DerivedView& candidate, Timestamp now, SweepReport& report);

    void evaluate_view(const std::string& view_id,
                       const std::vector<ViewConflict>& conflicts,
                       Timestamp now,
                       SweepReport& report);
};

} // namespace cogmem
