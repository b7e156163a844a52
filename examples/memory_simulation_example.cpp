#include "cogmem/consumer/access_gateway.hpp"
#include "cogmem/pipeline/cognitive_pipeline.hpp"
#include "cogmem/pipeline/sweep_scheduler.hpp"
#include "cogmem/storage/sqlite_store.hpp"
#include <iomanip>
#include <iostream>

using namespace cogmem;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_views(MemoryStore& store, const std::string& user_id) {
    for (const auto& view : store.list_views(user_id)) {
        std::cout << "  [" << view_status_to_string(view.status) << "] " << view.hypothesis
                  << "  confidence=" << std::fixed << std::setprecision(2) << view.confidence
                  << " validations=" << view.validation_count
                  << " counter=" << view.counter_evidence.size() << "\n";
    }
}

int main(int argc, char* argv[]) {
    print_separator("Cognitive Memory Simulation");

    std::cout << "Simulates two months of a user's statements with a rule-only\n";
    std::cout << "extractor and an in-memory database:\n";
    std::cout << "  statements -> events -> derived views -> promotion gate -> concepts\n";

    // =========================================================================
    // Configuration
    // =========================================================================

    print_separator("Step 1: Configuration");

    EngineConfig config;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        std::cout << "Loading configuration from: " << argv[2] << "\n";
        config = EngineConfig::from_json_file(argv[2]);
    }
    config.database_path = ":memory:";
    config.inference.provider = "none";

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    SqliteStore store(config.database_path);
    CognitivePipeline pipeline(store, config);
    SweepScheduler scheduler(pipeline, config.scheduler);

    const std::string user = "alice";
    const Timestamp day0 = from_iso8601("2024-03-01T08:00:00Z");

    std::cout << "Frequency threshold: " << config.detector.frequency_threshold << " events\n";
    std::cout << "Promotion: confidence > " << config.gate.promote_confidence
              << ", age >= " << config.gate.min_age_days << " days\n";

    // =========================================================================
    // Daily statements
    // =========================================================================

    print_separator("Step 2: 25 days of morning coffee");

    for (int day = 0; day < 25; ++day) {
        Timestamp now = day0 + days(day);
        IngestResult result = pipeline.ingest(user, "我每天都喝咖啡", "", now);
        scheduler.note_events(user, result.event_ids.size(), now);

        // Daily maintenance window
        SweepReport report = pipeline.run_sweep(user, now);
        if (report.views_created > 0) {
            std::cout << "Day " << day << ": new view created\n";
        }
    }
    print_views(store, user);

    // =========================================================================
    // Contradictory views
    // =========================================================================

    print_separator("Step 3: Contradicting hypotheses");

    std::vector<std::string> evidence;
    for (int i = 0; i < 3; ++i) {
        Event event;
        event.user_id = user;
        event.timestamp = day0 + days(i) + hours(4);
        event.action = "吃";
        event.target = "牛排";
        event.confidence = 0.9;
        evidence.push_back(pipeline.events().append(event));
    }

    AccessGateway gateway(store, config.detector.llm_discount, config.detector.view_ttl_days);
    gateway.register_consumer("diet-coach", AccessLevel::ReadWriteDerived);
    gateway.propose_view("diet-coach", user, "用户喜欢吃肉", view_types::Preference, evidence, 0.9, day0 + days(25));
    gateway.propose_view("diet-coach", user, "用户是素食主义者", view_types::Belief, evidence, 0.9, day0 + days(25));

    SweepReport conflict_report = pipeline.run_sweep(user, day0 + days(26));
    std::cout << "Conflicts found: " << conflict_report.conflicts_found << "\n";
    for (const auto& c : conflict_report.conflicts) {
        std::cout << "  [" << c.kind << "] " << c.reason << "\n";
    }

    // =========================================================================
    // Thirty days later
    // =========================================================================

    print_separator("Step 4: Promotion gate after 31 more days");

    SweepReport final_report = pipeline.run_sweep(user, day0 + days(24 + 31));
    final_report.print_summary();
    print_views(store, user);

    std::cout << "\nActive concepts:\n";
    for (const auto& c : pipeline.registry().get_active_concepts(user)) {
        std::cout << "  " << c.name << " v" << c.version << ": " << c.description << "\n";
    }

    // =========================================================================
    // Consumer boundary
    // =========================================================================

    print_separator("Step 5: Consumer access");

    gateway.register_consumer("dashboard", AccessLevel::ReadOnly);
    UsageStatistics stats = gateway.query_statistics("dashboard", user, day0, day0 + days(60), day0 + days(60));
    std::cout << "Events in range: " << stats.event_count << ", active views: " << stats.active_view_count << "\n";

    try {
        gateway.submit_event("dashboard", Event{}, day0 + days(60));
    } catch (const PermissionDenied& e) {
        std::cout << "As expected: " << e.what() << "\n";
    }

    std::cout << "Audit entries: " << gateway.audit_log(user).size() << "\n";

    print_separator("Simulation complete");
    return 0;
}
