#include "graph/graph_store.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace sdb {

namespace {

constexpr const char* kGraphFormatVersion = "1.0";

} // namespace

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json GraphStore::to_json() const {
    nlohmann::json j;

    j["metadata"] = {
        {"version", kGraphFormatVersion},
        {"exported_at", to_iso8601(Clock::now())},
        {"node_count", nodes_.size()},
        {"edge_count", edges_.size()}
    };

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& record : edges_) {
        edges_json.push_back(record.to_json());
    }
    j["edges"] = edges_json;

    j["conflict_zones"] = conflict_zones_;

    return j;
}

void GraphStore::import_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("graph document must be a JSON object");
    }

    // Restore into a staging store so a malformed document leaves this one untouched
    GraphStore staged;
    staged.conflict_confidence_ = conflict_confidence_;
    staged.restore_from(j);
    *this = std::move(staged);
}

void GraphStore::restore_from(const nlohmann::json& j) {
    // Nodes keep their serialized attributes
    auto restore_node = [this](Node node) {
        validate_id(node.id, "node id");
        if (node.weight_id.empty()) {
            node.weight_id = generate_node_weight_id(node.id);
        }
        auto it = node_index_.find(node.id);
        if (it != node_index_.end()) {
            nodes_[it->second] = node;
            return;
        }
        node_index_[node.id] = nodes_.size();
        nodes_.push_back(node);
        out_edges_.emplace_back();
        in_edges_.emplace_back();
    };

    if (j.contains("nodes")) {
        const auto& nodes_json = j["nodes"];
        if (nodes_json.is_array()) {
            for (const auto& node_json : nodes_json) {
                restore_node(Node::from_json(node_json));
            }
        } else if (nodes_json.is_object()) {
            // Keyed form: {"<id>": {attributes}}
            for (const auto& [id, attrs] : nodes_json.items()) {
                nlohmann::json node_json = attrs;
                node_json["id"] = id;
                restore_node(Node::from_json(node_json));
            }
        } else {
            throw ValidationError("'nodes' must be an array or an object");
        }
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            add_edge(EdgeRecord::from_json(edge_json), RESTORED_CONTEXT, true);
        }
    }

    if (j.contains("conflict_zones")) {
        for (const auto& id : j["conflict_zones"]) {
            std::string weight_id = id.get<std::string>();
            if (registry_.count(weight_id) > 0) {
                conflict_zones_.insert(weight_id);
            }
        }
    }
}

void GraphStore::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

void GraphStore::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    file.close();

    import_json(j);
}

} // namespace sdb
