#include "cli/cli.hpp"
#include "api/semantic_db.hpp"
#include "config/engine_config.hpp"
#include "storage/document_mirror.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

using namespace sdb;

// ============== Helper Functions ==============

// Config file when given, environment otherwise; --verbose wins either way
EngineConfig load_config(const Args& args) {
    EngineConfig config = args.has("config")
        ? EngineConfig::from_json_file(args.get("config").value)
        : EngineConfig::from_environment();

    if (args.has("verbose")) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

// Database seeded from --input when present
std::unique_ptr<SemanticDB> open_database(const Args& args) {
    auto db = std::make_unique<SemanticDB>(load_config(args));

    if (args.has(CLI::INPUT_ARG)) {
        std::string input_path = args.get(CLI::INPUT_ARG).value;
        if (db->config().verbose) {
            std::cout << "Loading graph from: " << input_path << "\n";
        }
        JsonFileMirror mirror;
        db->import_document(mirror.read(input_path));
    }
    return db;
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << "\n";
}

// ============== sdb stats ==============
int cmd_stats(const Args& args) {
    auto db = open_database(args);
    auto stats = db->graph().compute_statistics();

    if (args.has("json")) {
        print_json(db->statistics());
        return 0;
    }

    std::cout << "\nGraph Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Edges: " << stats.num_edges << "\n";
    std::cout << "  Contexts: " << stats.num_contexts << "\n";
    std::cout << "  Conflicts: " << stats.num_conflicts << "\n";
    std::cout << "  Suggested edges: " << stats.num_suggested << "\n";
    std::cout << "  Decay candidates: " << stats.num_decay_candidates << "\n";
    std::cout << "  Avg confidence: " << stats.avg_confidence << "\n";
    std::cout << "  Avg tension: " << stats.avg_tension << "\n";
    std::cout << "  Avg out-degree: " << stats.avg_out_degree << "\n";
    std::cout << "  Max out-degree: " << stats.max_out_degree << "\n";

    if (!stats.edges_by_type.empty()) {
        std::cout << "\nEdges by type:\n";
        for (const auto& [type, count] : stats.edges_by_type) {
            std::cout << "  " << type << ": " << count << "\n";
        }
    }

    return 0;
}

// ============== sdb diagnose ==============
int cmd_diagnose(const Args& args) {
    auto db = open_database(args);
    Diagnosis diagnosis = db->diagnose();

    if (args.has("json")) {
        print_json(diagnosis.to_json());
        return 0;
    }

    const auto& coherence = diagnosis.coherence;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "\nCoherence: " << coherence.global
              << " (" << coherence_status_to_string(coherence.status) << ")\n";
    std::cout << "  Structural: " << coherence.structural << "\n";
    std::cout << "  Semantic: " << coherence.semantic << "\n";
    std::cout << "  Tension penalty: " << coherence.tension_penalty << "\n";

    std::cout << "\nTensions (" << diagnosis.tensions.size() << "):\n";
    for (const auto& finding : diagnosis.tensions) {
        std::cout << "  [" << severity_to_string(finding.severity) << "] "
                  << tension_kind_to_string(finding.kind);
        if (finding.kind == TensionKind::MEANING_CONFLICT) {
            std::cout << " " << finding.source << " -> " << finding.target;
        } else if (finding.kind == TensionKind::ISOLATION) {
            std::cout << " (" << finding.count << " nodes)";
        } else {
            std::cout << " (" << finding.cycle.size() << " nodes, avg tension "
                      << finding.avg_tension << ")";
        }
        std::cout << "\n";
    }
    if (diagnosis.cycle_search_truncated) {
        std::cout << "  (cycle search stopped early)\n";
    }

    std::cout << "\nTrend: " << trend_to_string(diagnosis.trend.trend) << "\n";

    if (!diagnosis.recommendations.empty()) {
        std::cout << "\nRecommendations:\n";
        for (const auto& rec : diagnosis.recommendations) {
            std::cout << "  - " << rec << "\n";
        }
    }

    return 0;
}

// ============== sdb dream ==============
int cmd_dream(const Args& args) {
    auto db = open_database(args);
    size_t max_suggestions = static_cast<size_t>(args.get("max", "5").as_int(5));

    auto suggestions = args.has("queue")
        ? db->link_prediction().dreaming_cycle(max_suggestions)
        : db->dreaming_session(max_suggestions);

    if (args.has("accept")) {
        for (const auto& suggestion : suggestions) {
            db->accept_suggestion(suggestion);
        }
        std::string output = args.get("output", args.get("input").value).value;
        if (output.empty()) {
            std::cerr << "Error: --output is required with --accept when no --input is given\n";
            return 1;
        }
        db->graph().export_to_json(output);
        std::cout << "Accepted " << suggestions.size() << " suggestions into " << output << "\n";
    }

    if (args.has("json")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& suggestion : suggestions) {
            j.push_back(suggestion.to_json());
        }
        print_json(j);
        return 0;
    }

    std::cout << "\nSuggestions (" << suggestions.size() << "):\n";
    for (const auto& suggestion : suggestions) {
        std::cout << "  " << suggestion.source << " -> " << suggestion.target
                  << "  [" << std::fixed << std::setprecision(2) << suggestion.confidence << "] "
                  << suggestion.meaning << "\n";
    }
    return 0;
}

// ============== sdb query ==============
int cmd_query(const Args& args) {
    auto db = open_database(args);
    print_json(db->query_rql(args.require("rql")));
    return 0;
}

// ============== sdb export ==============
int cmd_export(const Args& args) {
    auto db = open_database(args);
    std::string output = args.require("output");

    nlohmann::json summary = nlohmann::json::object();
    if (args.has("summary")) {
        summary = nlohmann::json::parse(args.get("summary").value);
    }

    fs::path parent = fs::path(output).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    JsonFileMirror mirror;
    db->export_cycle_to(output, summary, mirror);
    std::cout << "Saved: " << output << "\n";
    return 0;
}

// ============== sdb add-edge ==============
int cmd_add_edge(const Args& args) {
    auto db = open_database(args);

    std::string output = args.get("output", args.get("input").value).value;
    if (output.empty()) {
        std::cerr << "Error: --output is required when no --input is given\n";
        return 1;
    }

    std::string weight_id = db->add_edge(
        args.require("source"),
        args.require("target"),
        args.get("gesture", "Λ").value,
        args.require("meaning"),
        args.get("confidence", "0.7").as_unit(0.7),
        args.get("tension", "0.0").as_unit(0.0),
        args.get("context").value,
        args.get("blind-spots").as_list()
    );

    db->graph().export_to_json(output);

    const EdgeRecord* record = db->graph().get_edge_by_id(weight_id);
    if (args.has("json") && record) {
        print_json(record->to_json());
    } else {
        std::cout << "Stored " << weight_id << " in " << output << "\n";
        if (db->graph().conflict_zones().count(weight_id) > 0) {
            std::cout << "Warning: record is in the conflict zone\n";
        }
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("sdb", SemanticDB::VERSION);

    cli.add_global_arg({CLI::INPUT_ARG, "i", "Graph or export document (JSON)", "", false, false});
    cli.add_global_arg({"config", "c", "Engine config file (JSON); environment used otherwise", "", false, false});
    cli.add_global_arg({"json", "j", "Print JSON instead of a summary", "", false, true});
    cli.add_global_arg({"verbose", "v", "Verbose logging", "", false, true});

    cli.register_command({
        "stats",
        "Print statistics about a graph",
        {},
        cmd_stats
    });

    cli.register_command({
        "diagnose",
        "Score coherence, list tensions and recommendations",
        {},
        cmd_diagnose
    });

    cli.register_command({
        "dream",
        "Propose hypothetical edges",
        {
            {"max", "m", "Maximum number of suggestions", "5", false, false},
            {"queue", "q", "Seed from the dreaming queue instead of the three strategies", "", false, true},
            {"accept", "a", "Insert every suggestion and save the graph", "", false, true},
            {"output", "o", "Graph file written with --accept (default: --input)", "", false, false}
        },
        cmd_dream
    });

    cli.register_command({
        "query",
        "Run an RQL query, e.g. (QUERY :from A :to C)",
        {
            {"rql", "r", "RQL expression", "", true, false}
        },
        cmd_query
    });

    cli.register_command({
        "export",
        "Write an export document for a cycle",
        {
            {"output", "o", "Output path for the export document", "", true, false},
            {"summary", "s", "Cycle summary as a JSON object", "", false, false}
        },
        cmd_export
    });

    // Starts a new graph when no --input is given
    cli.register_command({
        "add-edge",
        "Insert a relation and save the graph",
        {
            {"output", "o", "Graph file to write (default: --input)", "", false, false},
            {"source", "s", "Source entity", "", true, false},
            {"target", "t", "Target entity", "", true, false},
            {"gesture", "g", "Relation symbol or name (Α, Λ, Σ, Ω, ∇, Φ)", "Λ", false, false},
            {"meaning", "m", "Meaning of the relation", "", true, false},
            {"confidence", "", "Initial confidence", "0.7", false, false},
            {"tension", "", "Initial tension", "0.0", false, false},
            {"context", "x", "Context id (default: from config)", "", false, false},
            {"blind-spots", "b", "Comma-separated acknowledged unknowns", "", false, false}
        },
        cmd_add_edge,
        false
    });

    return cli.run(argc, argv);
}
