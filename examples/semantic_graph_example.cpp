#include "api/semantic_db.hpp"
#include "storage/document_mirror.hpp"
#include "storage/persistence.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace sdb;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("SemanticDB Example - Tension-aware Knowledge Graph");

    const std::string output_dir = "output_json";
    std::filesystem::create_directories(output_dir);

    EngineConfig config = EngineConfig::from_environment();
    InMemoryPersistence persistence;
    SemanticDB db(config, &persistence);

    std::cout << "Building a small graph about water and life...\n\n";

    // 1. Plain connections
    std::cout << "1. Connections:\n";
    std::cout << "   water --Λ--> life, life --Λ--> evolution\n";
    db.add_edge("water", "life", "Λ", "enables", 0.9);
    db.add_edge("life", "evolution", "Λ", "drives", 0.8);

    // 2. Same relation seen from another context merges
    std::cout << "\n2. Same relation observed in a second context:\n";
    std::string merged = db.add_edge("water", "life", "Λ", "enables", 0.7, 0.0, "biology");
    const EdgeRecord* record = db.graph().get_edge_by_id(merged);
    std::cout << "   " << merged << " now spans " << record->confidence_by_context.size()
              << " contexts, confidence " << std::fixed << std::setprecision(3)
              << record->confidence << "\n";

    // 3. A competing meaning creates a conflict
    std::cout << "\n3. Competing meaning:\n";
    std::cout << "   water --Λ--> life \"threatens\"\n";
    db.add_edge("water", "life", "Λ", "threatens", 0.8, 0.3, "flood_reports", {"scale of floods"});
    std::cout << "   Conflict zone size: " << db.graph().conflict_zones().size() << "\n";

    // 4. Broker with unconnected successors
    db.add_edge("sun", "water", "Λ", "evaporates", 0.8);
    db.add_edge("sun", "plants", "Λ", "feeds", 0.85);
    db.add_edge("sun", "climate", "Σ", "shapes", 0.75);

    print_separator("Diagnosis");
    Diagnosis diagnosis = db.diagnose();
    std::cout << "Coherence: " << diagnosis.coherence.global << " ("
              << coherence_status_to_string(diagnosis.coherence.status) << ")\n";
    std::cout << "Tensions: " << diagnosis.tensions.size() << "\n";
    for (const auto& rec : diagnosis.recommendations) {
        std::cout << "  - " << rec << "\n";
    }

    print_separator("Dreaming");
    auto suggestions = db.dreaming_session(5);
    for (const auto& suggestion : suggestions) {
        std::cout << "  " << suggestion.source << " -> " << suggestion.target
                  << "  " << suggestion.meaning << "\n";
    }
    if (!suggestions.empty()) {
        std::string accepted = db.accept_suggestion(suggestions.front());
        std::cout << "\nAccepted: " << db.graph().get_edge_by_id(accepted)->meaning << "\n";
    }

    print_separator("RQL");
    std::cout << db.query_rql("(QUERY :from water :to evolution)").dump(2) << "\n";
    std::cout << db.query_rql("(EXPLORE :entity sun :depth 2)").dump(2) << "\n";
    std::cout << db.query_rql("(Φ :intention \"how does water sustain life\")").dump(2) << "\n";

    print_separator("Export");
    std::string export_path = output_dir + "/semantic_cycle.json";
    JsonFileMirror mirror;
    db.export_cycle_to(export_path, {{"cycle_id", "example"}, {"gestures", db.events_recorded()}}, mirror);
    std::cout << "Saved: " << export_path << "\n";
    std::cout << "Events stored: " << persistence.size(PersistenceBackend::EVENTS_TABLE) << "\n";
    std::cout << db.statistics().dump(2) << "\n";

    return 0;
}
