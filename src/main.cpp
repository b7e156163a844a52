#include "cogmem/cli/cli.hpp"
#include "cogmem/config/engine_config.hpp"
#include "cogmem/consumer/access_gateway.hpp"
#include "cogmem/export/data_exporter.hpp"
#include "cogmem/pipeline/cognitive_pipeline.hpp"
#include "cogmem/storage/sqlite_store.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

using namespace cogmem;
using cogmem::cli::Args;
using cogmem::cli::ArgDef;
using cogmem::cli::CLI;

// ============== Helper Functions ==============

namespace {

const char* const kCliConsumer = "cli";

struct Session {
    EngineConfig config;
    std::unique_ptr<SqliteStore> store;
    std::unique_ptr<CognitivePipeline> pipeline;
};

EngineConfig load_config(const Args& args) {
    EngineConfig config = load_config_with_fallback(args.get("config", "").value);
    if (args.has("db")) {
        config.database_path = args.get("db").value;
    }
    if (args.has("verbose")) {
        config.verbose = true;
        config.inference.verbose = true;
        config.resolver.verbose = true;
        config.detector.verbose = true;
    }
    return config;
}

Session open_session(EngineConfig config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }

    Session session;
    session.config = config;
    session.store = std::make_unique<SqliteStore>(config.database_path);
    auto provider = InferenceProviderFactory::create(config.inference.provider, config.inference);
    session.pipeline = std::make_unique<CognitivePipeline>(*session.store, config, std::move(provider));

    if (config.verbose) {
        std::cout << "Database: " << config.database_path << "\n";
        std::cout << "Inference: " << config.inference.provider << " (" << config.inference.model << ")\n";
    }
    return session;
}

Session open_session(const Args& args) {
    return open_session(load_config(args));
}

std::string user_of(const Args& args) {
    return args.get("user", "default").value;
}

void print_view(const DerivedView& view) {
    std::cout << "  [" << view_status_to_string(view.status) << "] " << view.view_id << "\n";
    std::cout << "      " << view.hypothesis << "\n";
    std::cout << "      confidence " << std::fixed << std::setprecision(2) << view.confidence
              << ", validations " << view.validation_count
              << ", counter " << view.counter_evidence.size()
              << ", expires " << to_iso8601(view.expires_at) << "\n";
}

void print_concept(const StableConcept& c) {
    std::cout << "  " << c.name << " v" << c.version << (c.deprecated ? " (deprecated)" : "") << "\n";
    std::cout << "      id: " << c.concept_id << "\n";
    std::cout << "      " << c.description << "\n";
    if (c.parent_concept_id) {
        std::cout << "      parent: " << *c.parent_concept_id << "\n";
    }
    if (c.superseded_by) {
        std::cout << "      superseded by: " << *c.superseded_by << "\n";
    }
}

} // anonymous namespace

// ============== Commands ==============

int cmd_ingest(const Args& args) {
    std::string text = args.positional_at(0, "text");
    Session session = open_session(args);
    Timestamp now = args.get("at").as_timestamp();

    IngestResult result = session.pipeline->ingest(user_of(args), text, args.get("context", "").value, now);
    std::cout << result.to_json().dump(2) << "\n";

    if (args.has("sweep")) {
        SweepReport report = session.pipeline->run_sweep(user_of(args), now);
        report.print_summary();
    }
    return 0;
}

int cmd_sweep(const Args& args) {
    Session session = open_session(args);
    Timestamp now = args.get("at").as_timestamp();

    SweepReport report = session.pipeline->run_sweep(user_of(args), now);
    report.print_summary();
    return report.success ? 0 : 1;
}

int cmd_views(const Args& args) {
    Session session = open_session(args);
    std::optional<ViewStatus> status;
    if (args.has("status")) {
        status = string_to_view_status(args.get("status").value);
    }

    auto views = session.store->list_views(user_of(args), status);
    std::cout << "Views for " << user_of(args) << ": " << views.size() << "\n";
    for (const auto& view : views) {
        print_view(view);
    }
    return 0;
}

int cmd_concepts(const Args& args) {
    Session session = open_session(args);
    bool all = args.has("all");

    auto concepts = all ? session.store->list_concepts(user_of(args), false)
                        : session.pipeline->registry().get_active_concepts(user_of(args));
    std::cout << (all ? "All" : "Active") << " concepts for " << user_of(args) << ": " << concepts.size() << "\n";
    for (const auto& c : concepts) {
        print_concept(c);
    }
    return 0;
}

int cmd_history(const Args& args) {
    std::string name = args.positional_at(0, "name");
    Session session = open_session(args);

    auto versions = session.pipeline->registry().history(user_of(args), name);
    if (versions.empty()) {
        std::cerr << "No concept named " << name << "\n";
        return 1;
    }
    for (const auto& c : versions) {
        print_concept(c);
    }
    return 0;
}

int cmd_rollback(const Args& args) {
    std::string concept_id = args.positional_at(0, "concept_id");
    Session session = open_session(args);

    std::string restored = session.pipeline->registry().rollback(concept_id, now_utc());
    std::cout << "Restored previous definition as " << restored << "\n";
    return 0;
}

int cmd_entities(const Args& args) {
    Session session = open_session(args);

    auto entities = session.store->list_entities(user_of(args));
    std::cout << "Entities for " << user_of(args) << ": " << entities.size() << "\n";
    for (const auto& e : entities) {
        std::cout << "  " << e.canonical_name << " [" << e.entity_type << " "
                  << std::fixed << std::setprecision(2) << e.type_confidence << "] mentions "
                  << e.mention_count << "\n";
        for (const auto& [key, attr] : e.attributes) {
            std::cout << "      " << key << " = " << attr.value << " (" << attr.confidence << ")\n";
        }
    }

    if (args.has("relations")) {
        std::cout << "\nStrongest relations:\n";
        for (const auto& rel : session.pipeline->relations().strongest(user_of(args), 20)) {
            std::cout << "  " << rel.source_entity_id << " -- " << rel.target_entity_id
                      << " (" << rel.strength << ", " << rel.co_occurrence_count << "x)\n";
        }
    }
    return 0;
}

int cmd_stats(const Args& args) {
    Session session = open_session(args);
    Timestamp now = now_utc();
    Timestamp from = args.has("from") ? args.get("from").as_timestamp() : 0;
    Timestamp to = args.has("to") ? args.get("to").as_timestamp() : now + 1;

    AccessGateway gateway(*session.store, session.config.detector.llm_discount, session.config.detector.view_ttl_days);
    gateway.register_consumer(kCliConsumer, AccessLevel::ReadOnly);
    UsageStatistics stats = gateway.query_statistics(kCliConsumer, user_of(args), from, to, now);
    std::cout << stats.to_json().dump(2) << "\n";
    return 0;
}

int cmd_export(const Args& args) {
    std::string path = args.positional_at(0, "file");
    Session session = open_session(args);

    DataExporter exporter(*session.store);
    exporter.export_to_file(user_of(args), path, now_utc());
    std::cout << "Exported " << user_of(args) << " to " << path << "\n";
    return 0;
}

int cmd_audit(const Args& args) {
    Session session = open_session(args);

    auto entries = session.store->list_audit(user_of(args));
    for (const auto& entry : entries) {
        std::cout << to_iso8601(entry.timestamp) << "  " << entry.consumer_id << "  " << entry.operation
                  << "  " << (entry.success ? "ok" : "denied/failed") << "  results=" << entry.result_count;
        if (!entry.error_message.empty()) std::cout << "  " << entry.error_message;
        std::cout << "\n";
    }
    std::cout << entries.size() << " audit entries\n";
    return 0;
}

int cmd_archive(const Args& args) {
    int older_than_days = std::stoi(args.positional_at(0, "days"));
    if (older_than_days < 0) {
        throw std::runtime_error("days must be non-negative");
    }

    EngineConfig config = load_config(args);
    config.event_archive_days = older_than_days;
    config.view_retention_days = older_than_days;
    Session session = open_session(config);

    size_t moved = session.pipeline->archive(now_utc());
    std::cout << "Moved " << moved << " rows to the archive\n";
    return 0;
}

int cmd_config_init(const Args& args) {
    std::string path = args.positional_at(0, "file");
    EngineConfig config = load_config(args);

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Warning: " << error << "\n";
    }
    config.to_json_file(path);
    std::cout << "Wrote configuration to " << path << "\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("cogmem", "1.0.0");

    cli.add_global_arg({"db", "d", "SQLite database path (overrides config)", "", false, false});
    cli.add_global_arg({"user", "u", "User id", "default", false, false});
    cli.add_global_arg({"config", "c", "Engine config JSON file", "", false, false});
    cli.add_global_arg({"verbose", "V", "Verbose logging", "", false, true});

    cli.register_command({
        "ingest",
        "Store a statement, extract events and update views",
        {
            {"context", "x", "Surrounding conversation", "", false, false},
            {"at", "t", "Event time (ISO-8601, default now)", "", false, false},
            {"sweep", "s", "Run a sweep right after ingesting", "", false, true}
        },
        cmd_ingest,
        "<text>"
    });

    cli.register_command({
        "sweep",
        "Detect patterns and run the promotion gate for a user",
        {
            {"at", "t", "Sweep time (ISO-8601, default now)", "", false, false}
        },
        cmd_sweep
    });

    cli.register_command({
        "views",
        "List derived views",
        {
            {"status", "s", "Filter: active, expired, promoted, rejected", "", false, false}
        },
        cmd_views
    });

    cli.register_command({
        "concepts",
        "List stable concepts",
        {
            {"all", "a", "Include deprecated versions", "", false, true}
        },
        cmd_concepts
    });

    cli.register_command({"history", "Show every version of a concept", {}, cmd_history, "<name>"});
    cli.register_command({"rollback", "Restore a concept's previous version", {}, cmd_rollback, "<concept_id>"});

    cli.register_command({
        "entities",
        "List resolved entities",
        {
            {"relations", "r", "Also show strongest co-occurrence relations", "", false, true}
        },
        cmd_entities
    });

    cli.register_command({
        "stats",
        "Usage statistics through the consumer gateway",
        {
            {"from", "f", "Range start (ISO-8601)", "", false, false},
            {"to", "t", "Range end (ISO-8601)", "", false, false}
        },
        cmd_stats
    });

    cli.register_command({"export", "Export all data for a user as JSON", {}, cmd_export, "<file>"});
    cli.register_command({"audit", "Show the consumer audit log", {}, cmd_audit});
    cli.register_command({"archive", "Move events and settled views older than N days to the archive", {}, cmd_archive, "<days>"});
    cli.register_command({"config-init", "Write the effective configuration to a file", {}, cmd_config_init, "<file>"});

    return cli.run(argc, argv);
}
