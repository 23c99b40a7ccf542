#include "api/semantic_db.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace sdb {

SemanticDB::SemanticDB(const EngineConfig& config, PersistenceBackend* persistence)
    : config_(config),
      consistency_(graph_),
      link_prediction_(graph_),
      query_engine_(graph_, consistency_),
      persistence_(persistence) {
    graph_.set_conflict_confidence(config_.conflict_confidence);
    consistency_.set_config(config_.consistency_config());
    link_prediction_.set_config(config_.link_prediction_config());

    if (config_.verbose) {
        std::cout << "SemanticDB ready for operator: " << config_.operator_id << "\n";
    }
}

// ==========================================
// Gestures
// ==========================================

std::string SemanticDB::add_node(const std::string& id,
                                 const std::map<std::string, std::string>& attributes) {
    return graph_.add_node(id, attributes);
}

std::string SemanticDB::add_edge(const std::string& source,
                                 const std::string& target,
                                 const std::string& gesture,
                                 const std::string& meaning,
                                 double confidence,
                                 double tension,
                                 const std::string& context_id,
                                 const std::vector<std::string>& blind_spots) {
    EdgeRecord record(source, target, string_to_relation_type(gesture), meaning,
                      confidence, tension);

    double before = consistency_.current_coherence();
    std::string weight_id = graph_.add_edge(record, resolve_context(context_id));
    record_event(weight_id, before, blind_spots);
    return weight_id;
}

std::string SemanticDB::add_edge(const EdgeRecord& record, const std::string& context_id) {
    double before = consistency_.current_coherence();
    std::string weight_id = graph_.add_edge(record, resolve_context(context_id));
    record_event(weight_id, before, {});
    return weight_id;
}

// ==========================================
// Queries and Dreaming
// ==========================================

nlohmann::json SemanticDB::query_rql(const std::string& text) {
    return query_engine_.run(text);
}

std::vector<EdgeRecord> SemanticDB::dreaming_session(size_t max_suggestions) {
    auto suggestions = link_prediction_.generate_suggestions(max_suggestions);
    if (config_.verbose) {
        std::cout << "Dreaming session produced " << suggestions.size() << " suggestions\n";
    }
    return suggestions;
}

std::string SemanticDB::accept_suggestion(const EdgeRecord& suggestion) {
    double before = consistency_.current_coherence();
    std::string weight_id = link_prediction_.accept_suggestion(suggestion, ACCEPTED_CONTEXT);
    record_event(weight_id, before, {});
    return weight_id;
}

Diagnosis SemanticDB::diagnose() {
    return consistency_.diagnose();
}

// ==========================================
// Dialogues
// ==========================================

std::string SemanticDB::start_dialogue(const std::string& context,
                                       const std::vector<std::string>& participants) {
    Dialogue dialogue;
    dialogue.id = "DLG_" + random_hex(12);
    dialogue.context = context;
    dialogue.participants = participants;
    dialogue.created_at = Clock::now();

    if (persistence_) {
        persistence_->store_dialogue(dialogue);
    }
    dialogues_[dialogue.id] = dialogue;
    return dialogue.id;
}

void SemanticDB::add_dialogue_turn(const std::string& dialogue_id,
                                   const std::string& speaker,
                                   const std::string& text) {
    auto it = dialogues_.find(dialogue_id);
    if (it == dialogues_.end()) {
        throw ValidationError("unknown dialogue: " + dialogue_id);
    }

    it->second.add_turn(speaker, text);
    if (persistence_) {
        persistence_->store_dialogue(it->second);
    }
}

const Dialogue* SemanticDB::get_dialogue(const std::string& dialogue_id) const {
    auto it = dialogues_.find(dialogue_id);
    return it != dialogues_.end() ? &it->second : nullptr;
}

// ==========================================
// Export / Import
// ==========================================

nlohmann::json SemanticDB::export_cycle(const nlohmann::json& cycle_summary) {
    nlohmann::json graph_json = graph_.to_json();

    nlohmann::json document;
    document["metadata"] = {
        {"protocol", PROTOCOL},
        {"version", VERSION},
        {"operator_id", config_.operator_id},
        {"timestamp", to_iso8601(Clock::now())}
    };
    document["cycle_summary"] = cycle_summary;
    document["ontological_context"] = {
        {"entities", graph_json["nodes"]},
        {"edges", graph_json["edges"]},
        {"conflict_zones", graph_json["conflict_zones"]},
        {"coherence", consistency_.calculate_global_coherence().global}
    };
    return document;
}

void SemanticDB::export_cycle_to(const std::string& path,
                                 const nlohmann::json& cycle_summary,
                                 DocumentMirror& mirror) {
    mirror.write(export_cycle(cycle_summary), path);
    if (config_.verbose) {
        std::cout << "Exported cycle to " << path << " via " << mirror.get_name() << "\n";
    }
}

void SemanticDB::import_document(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ValidationError("import document must be a JSON object");
    }

    if (!document.contains("ontological_context")) {
        graph_.import_json(document);
        return;
    }

    const auto& context = document["ontological_context"];
    nlohmann::json graph_json = nlohmann::json::object();
    if (context.contains("entities")) graph_json["nodes"] = context["entities"];
    if (context.contains("edges")) graph_json["edges"] = context["edges"];
    if (context.contains("conflict_zones")) graph_json["conflict_zones"] = context["conflict_zones"];
    graph_.import_json(graph_json);
}

nlohmann::json SemanticDB::statistics() {
    nlohmann::json j = graph_.compute_statistics().to_json();
    j["coherence"] = consistency_.current_coherence();
    j["dialogues"] = dialogues_.size();
    j["events_recorded"] = events_recorded_;
    j["total_suggestions"] = link_prediction_.total_suggestions();
    j["operator_id"] = config_.operator_id;
    j["protocol"] = PROTOCOL;
    return j;
}

// ==========================================
// Internal Helpers
// ==========================================

void SemanticDB::record_event(const std::string& weight_id,
                              double coherence_before,
                              const std::vector<std::string>& blind_spots) {
    const EdgeRecord* record = graph_.get_edge_by_id(weight_id);
    if (!record) {
        throw ValidationError("stored record not found: " + weight_id);
    }

    std::string gesture = relation_type_to_string(record->type);
    Timestamp now = Clock::now();

    OntologicalEvent event;
    event.id = gesture + "_" + random_hex(12);
    event.timestamp = now;
    event.gesture = gesture;
    event.operator_id = config_.operator_id;
    event.operands = {record->source, record->target, record->meaning};
    event.result = weight_id;
    event.entities_affected = {record->source, record->target};
    event.blind_spots = blind_spots;
    event.coherence_before = coherence_before;
    event.coherence_after = consistency_.calculate_global_coherence().global;
    event.tension_level = record->tension;
    event.significance = std::min(1.0,
        std::abs(event.coherence_after - event.coherence_before) * 0.5 +
        static_cast<double>(event.entities_affected.size()) * 0.1 +
        static_cast<double>(blind_spots.size()) * 0.2);
    event.ethics = {{"creator", config_.operator_id}, {"timestamp", to_iso8601(now)}};
    event.weight_id = weight_id;

    events_recorded_++;

    if (persistence_) {
        persistence_->store_event(event);
        persistence_->store_edge_record(*record);
    }
}

std::string SemanticDB::resolve_context(const std::string& context_id) const {
    return context_id.empty() ? config_.default_context : context_id;
}

} // namespace sdb
