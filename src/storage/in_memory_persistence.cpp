#include "storage/persistence.hpp"
#include "core/errors.hpp"

namespace sdb {

// ============================================================================
// Data Structures
// ============================================================================

nlohmann::json OntologicalEvent::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["timestamp"] = to_iso8601(timestamp);
    j["gesture"] = gesture;
    j["operator_id"] = operator_id;
    j["operands"] = operands;
    j["result"] = result;
    j["entities_affected"] = entities_affected;
    j["blind_spots"] = blind_spots;
    j["coherence_before"] = coherence_before;
    j["coherence_after"] = coherence_after;
    j["tension_level"] = tension_level;
    j["significance"] = significance;
    j["ethics"] = ethics;
    j["weight_id"] = weight_id;
    return j;
}

OntologicalEvent OntologicalEvent::from_json(const nlohmann::json& j) {
    OntologicalEvent event;
    event.id = j.value("id", "");
    event.timestamp = j.contains("timestamp")
        ? from_iso8601(j["timestamp"].get<std::string>()) : Clock::now();
    event.gesture = j.value("gesture", "");
    event.operator_id = j.value("operator_id", "");
    event.result = j.value("result", "");
    event.coherence_before = j.value("coherence_before", 1.0);
    event.coherence_after = j.value("coherence_after", 1.0);
    event.tension_level = j.value("tension_level", 0.0);
    event.significance = j.value("significance", 0.0);
    event.weight_id = j.value("weight_id", "");

    if (j.contains("operands")) {
        event.operands = j["operands"].get<std::vector<std::string>>();
    }
    if (j.contains("entities_affected")) {
        event.entities_affected = j["entities_affected"].get<std::vector<std::string>>();
    }
    if (j.contains("blind_spots")) {
        event.blind_spots = j["blind_spots"].get<std::vector<std::string>>();
    }
    if (j.contains("ethics")) {
        event.ethics = j["ethics"].get<std::map<std::string, std::string>>();
    }
    return event;
}

nlohmann::json DialogueTurn::to_json() const {
    return {
        {"speaker", speaker},
        {"text", text},
        {"timestamp", to_iso8601(timestamp)}
    };
}

DialogueTurn DialogueTurn::from_json(const nlohmann::json& j) {
    DialogueTurn turn;
    turn.speaker = j.value("speaker", "");
    turn.text = j.value("text", "");
    turn.timestamp = j.contains("timestamp")
        ? from_iso8601(j["timestamp"].get<std::string>()) : Clock::now();
    return turn;
}

void Dialogue::add_turn(const std::string& speaker, const std::string& text) {
    turns.push_back({speaker, text, Clock::now()});
}

nlohmann::json Dialogue::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["context"] = context;
    j["participants"] = participants;

    nlohmann::json turns_json = nlohmann::json::array();
    for (const auto& turn : turns) {
        turns_json.push_back(turn.to_json());
    }
    j["turns"] = turns_json;
    j["created_at"] = to_iso8601(created_at);
    return j;
}

Dialogue Dialogue::from_json(const nlohmann::json& j) {
    Dialogue dialogue;
    dialogue.id = j.value("id", "");
    dialogue.context = j.value("context", "");
    if (j.contains("participants")) {
        dialogue.participants = j["participants"].get<std::vector<std::string>>();
    }
    if (j.contains("turns")) {
        for (const auto& turn_json : j["turns"]) {
            dialogue.turns.push_back(DialogueTurn::from_json(turn_json));
        }
    }
    dialogue.created_at = j.contains("created_at")
        ? from_iso8601(j["created_at"].get<std::string>()) : Clock::now();
    return dialogue;
}

// ============================================================================
// InMemoryPersistence
// ============================================================================

void InMemoryPersistence::Table::upsert(const std::string& id, const nlohmann::json& row) {
    auto it = index.find(id);
    if (it != index.end()) {
        rows[it->second] = row;
        return;
    }
    index[id] = rows.size();
    rows.push_back(row);
}

void InMemoryPersistence::store_event(const OntologicalEvent& event) {
    if (event.id.empty() || event.gesture.empty() || event.weight_id.empty()) {
        throw ValidationError("event requires id, gesture and weight_id");
    }
    events_.upsert(event.id, event.to_json());
}

void InMemoryPersistence::store_edge_record(const EdgeRecord& record) {
    if (record.weight_id.empty()) {
        throw ValidationError("edge record requires a weight_id");
    }
    edge_records_.upsert(record.weight_id, record.to_json());
}

std::optional<EdgeRecord> InMemoryPersistence::load_edge_record(const std::string& weight_id) const {
    auto it = edge_records_.index.find(weight_id);
    if (it == edge_records_.index.end()) {
        return std::nullopt;
    }
    return EdgeRecord::from_json(edge_records_.rows[it->second]);
}

void InMemoryPersistence::store_dialogue(const Dialogue& dialogue) {
    if (dialogue.id.empty()) {
        throw ValidationError("dialogue requires an id");
    }
    dialogues_.upsert(dialogue.id, dialogue.to_json());
}

std::vector<nlohmann::json> InMemoryPersistence::query(
    const std::string& table_name,
    const std::map<std::string, nlohmann::json>& filters,
    size_t limit
) const {
    std::vector<nlohmann::json> result;
    for (const auto& row : table(table_name).rows) {
        if (result.size() >= limit) {
            break;
        }

        bool matches = true;
        for (const auto& [field, expected] : filters) {
            if (!row.contains(field) || row[field] != expected) {
                matches = false;
                break;
            }
        }
        if (matches) {
            result.push_back(row);
        }
    }
    return result;
}

size_t InMemoryPersistence::size(const std::string& table_name) const {
    return table(table_name).rows.size();
}

const InMemoryPersistence::Table& InMemoryPersistence::table(const std::string& name) const {
    if (name == EVENTS_TABLE) return events_;
    if (name == EDGE_RECORDS_TABLE) return edge_records_;
    if (name == DIALOGUES_TABLE) return dialogues_;
    throw ValidationError("unknown table: " + name);
}

} // namespace sdb
