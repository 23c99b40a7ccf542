#include "graph/graph_store.hpp"
#include "graph/graph_algorithms.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace sdb {

namespace {

constexpr auto kNodeLifespan = std::chrono::hours(24 * 365);

} // namespace

// ==========================================
// Node Implementation
// ==========================================

nlohmann::json Node::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["weight_id"] = weight_id;
    j["type"] = type;
    j["creator"] = creator;
    j["domain"] = domain;
    j["meaning"] = meaning;
    j["created_at"] = to_iso8601(created_at);
    j["lifespan"] = to_iso8601(lifespan);
    j["activation_count"] = activation_count;
    j["status"] = lifecycle_status_to_string(status);
    j["properties"] = properties;
    return j;
}

Node Node::from_json(const nlohmann::json& j) {
    Node node;
    node.id = j.at("id").get<std::string>();
    node.weight_id = j.value("weight_id", "");
    node.type = j.value("type", "entity");
    node.creator = j.value("creator", "system");
    node.domain = j.value("domain", "general");
    node.meaning = j.value("meaning", "");
    node.activation_count = j.value("activation_count", 0);
    node.status = string_to_lifecycle_status(j.value("status", std::string("active")));

    auto now = Clock::now();
    node.created_at = j.contains("created_at")
        ? from_iso8601(j["created_at"].get<std::string>()) : now;
    node.lifespan = j.contains("lifespan")
        ? from_iso8601(j["lifespan"].get<std::string>()) : node.created_at + kNodeLifespan;

    if (j.contains("properties")) {
        node.properties = j["properties"].get<std::map<std::string, std::string>>();
    }

    return node;
}

nlohmann::json ContextStats::to_json() const {
    return {
        {"created_at", to_iso8601(created_at)},
        {"edge_count", edge_count},
        {"mean_confidence", mean_confidence}
    };
}

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_contexts"] = num_contexts;
    j["num_conflicts"] = num_conflicts;
    j["num_suggested"] = num_suggested;
    j["num_decay_candidates"] = num_decay_candidates;
    j["avg_confidence"] = avg_confidence;
    j["avg_tension"] = avg_tension;
    j["avg_out_degree"] = avg_out_degree;
    j["max_out_degree"] = max_out_degree;
    j["edges_by_type"] = edges_by_type;
    j["edges_by_status"] = edges_by_status;
    return j;
}

// ==========================================
// GraphStore Implementation
// ==========================================

std::string GraphStore::add_node(const std::string& id,
                                 const std::map<std::string, std::string>& attributes) {
    validate_id(id, "node id");

    auto it = node_index_.find(id);
    std::string previous_weight_id;
    if (it != node_index_.end()) {
        previous_weight_id = nodes_[it->second].weight_id;
    }

    Node node;
    node.id = id;
    for (const auto& [key, value] : attributes) {
        if (key == "weight_id") node.weight_id = value;
        else if (key == "type") node.type = value;
        else if (key == "creator") node.creator = value;
        else if (key == "domain") node.domain = value;
        else if (key == "meaning") node.meaning = value;
        else node.properties[key] = value;
    }

    if (node.weight_id.empty()) {
        node.weight_id = previous_weight_id.empty() ? generate_node_weight_id(id) : previous_weight_id;
    }

    node.created_at = Clock::now();
    node.lifespan = node.created_at + kNodeLifespan;
    node.activation_count = 0;
    node.status = LifecycleStatus::ACTIVE;

    if (it != node_index_.end()) {
        // Existing node: overwrite attributes, keep handle and adjacency
        nodes_[it->second] = node;
    } else {
        NodeHandle handle = nodes_.size();
        nodes_.push_back(node);
        node_index_[id] = handle;
        out_edges_.emplace_back();
        in_edges_.emplace_back();
    }

    return node.weight_id;
}

std::string GraphStore::add_edge(const EdgeRecord& record,
                                 const std::string& context_id,
                                 bool auto_merge) {
    validate_id(record.source, "edge source");
    validate_id(record.target, "edge target");

    NodeHandle src = ensure_node(record.source);
    NodeHandle tgt = ensure_node(record.target);

    const std::vector<EdgeHandle>* existing = pair_edges(src, tgt);

    // Merge target: first exact (type, meaning) match on the pair
    std::optional<EdgeHandle> merge_target;
    if (auto_merge && existing) {
        for (EdgeHandle h : *existing) {
            const auto& candidate = edges_[h];
            if (candidate.type == record.type && candidate.meaning == record.meaning) {
                merge_target = h;
                break;
            }
        }
    }

    EdgeRecord incoming = record;
    std::string final_id;
    if (merge_target) {
        final_id = edges_[*merge_target].weight_id;
    } else {
        if (incoming.weight_id.empty() || registry_.count(incoming.weight_id) > 0) {
            incoming.weight_id = EdgeRecord::generate_weight_id();
        }
        final_id = incoming.weight_id;
    }

    // Conflict detection runs over every same-type record on the pair
    if (existing && record.confidence > conflict_confidence_) {
        for (EdgeHandle h : *existing) {
            const auto& other = edges_[h];
            if (other.type == record.type && other.meaning != record.meaning) {
                conflict_zones_.insert(other.weight_id);
                conflict_zones_.insert(final_id);
            }
        }
    }

    if (merge_target) {
        auto& target = edges_[*merge_target];
        target.update_from_context(context_id, record.confidence, record.tension);
        if (record.meaning.size() > target.meaning.size()) {
            target.meaning = record.meaning;
        }
        return final_id;
    }

    incoming.register_context(context_id);

    EdgeHandle handle = edges_.size();
    edges_.push_back(incoming);
    edge_ends_.emplace_back(src, tgt);
    edge_keys_.push_back(record.source + "→" + record.target + ":" +
                         relation_type_to_string(incoming.type) + ":" + random_hex(8));
    registry_[final_id] = handle;

    out_edges_[src].push_back(handle);
    in_edges_[tgt].push_back(handle);
    pair_index_[{src, tgt}].push_back(handle);

    dreaming_queue_.push({incoming.confidence * (1.0 - incoming.tension),
                          incoming.source, incoming.target});
    update_context_stats(context_id, incoming.confidence);

    return final_id;
}

const EdgeRecord* GraphStore::get_edge(const std::string& source,
                                       const std::string& target,
                                       RelationType type) const {
    for (const auto* record : edges_between(source, target)) {
        if (record->type == type) {
            return record;
        }
    }
    return nullptr;
}

const EdgeRecord* GraphStore::get_edge_by_id(const std::string& weight_id) const {
    auto it = registry_.find(weight_id);
    return it != registry_.end() ? &edges_[it->second] : nullptr;
}

std::vector<const EdgeRecord*> GraphStore::edges_between(const std::string& source,
                                                         const std::string& target) const {
    std::vector<const EdgeRecord*> result;
    auto s = node_handle(source);
    auto t = node_handle(target);
    if (!s || !t) {
        return result;
    }

    if (const auto* handles = pair_edges(*s, *t)) {
        for (EdgeHandle h : *handles) {
            result.push_back(&edges_[h]);
        }
    }
    return result;
}

const Node* GraphStore::get_node(const std::string& id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

bool GraphStore::has_node(const std::string& id) const {
    return node_index_.find(id) != node_index_.end();
}

std::vector<std::string> GraphStore::successors(const std::string& id) const {
    std::vector<std::string> result;
    if (auto handle = node_handle(id)) {
        for (NodeHandle n : successor_handles(*handle)) {
            result.push_back(nodes_[n].id);
        }
    }
    return result;
}

std::vector<std::string> GraphStore::predecessors(const std::string& id) const {
    std::vector<std::string> result;
    if (auto handle = node_handle(id)) {
        for (NodeHandle n : predecessor_handles(*handle)) {
            result.push_back(nodes_[n].id);
        }
    }
    return result;
}

bool GraphStore::has_direct_edge(const std::string& source, const std::string& target) const {
    auto s = node_handle(source);
    auto t = node_handle(target);
    return s && t && pair_edges(*s, *t) != nullptr;
}

bool GraphStore::has_any_edge(const std::string& a, const std::string& b) const {
    return has_direct_edge(a, b) || has_direct_edge(b, a);
}

std::vector<std::string> GraphStore::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        ids.push_back(node.id);
    }
    return ids;
}

std::vector<const EdgeRecord*> GraphStore::all_edges() const {
    std::vector<const EdgeRecord*> result;
    result.reserve(edges_.size());
    for (const auto& record : edges_) {
        result.push_back(&record);
    }
    return result;
}

std::optional<ContextStats> GraphStore::context_stats(const std::string& context_id) const {
    auto it = context_stats_.find(context_id);
    if (it == context_stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DreamingEntry> GraphStore::dreaming_queue() const {
    auto queue = dreaming_queue_;
    std::vector<DreamingEntry> entries;
    entries.reserve(queue.size());
    while (!queue.empty()) {
        entries.push_back(queue.top());
        queue.pop();
    }
    return entries;
}

// ==========================================
// Record Lifecycle
// ==========================================

bool GraphStore::activate_edge(const std::string& weight_id, const std::string& context_id) {
    auto* record = find_edge(weight_id);
    if (!record) {
        return false;
    }
    record->activate(context_id);

    auto it = node_index_.find(record->source);
    if (it != node_index_.end()) {
        nodes_[it->second].activation_count++;
    }
    return true;
}

bool GraphStore::resolve_tension(const std::string& weight_id,
                                 const std::string& context_id,
                                 double new_tension) {
    auto* record = find_edge(weight_id);
    if (!record) {
        return false;
    }
    record->resolve_tension(context_id, new_tension);
    refresh_conflict_state(*record);
    return true;
}

bool GraphStore::archive_node(const std::string& id) {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        return false;
    }
    nodes_[it->second].status = LifecycleStatus::ARCHIVED;
    return true;
}

bool GraphStore::archive_edge(const std::string& weight_id) {
    auto* record = find_edge(weight_id);
    if (!record) {
        return false;
    }
    record->status = LifecycleStatus::ARCHIVED;
    record->updated_at = Clock::now();
    conflict_zones_.erase(weight_id);
    return true;
}

std::vector<std::string> GraphStore::decay_candidates() const {
    return decay_candidates(Clock::now());
}

std::vector<std::string> GraphStore::decay_candidates(Timestamp now) const {
    std::vector<std::string> ids;
    for (const auto& record : edges_) {
        if (record.should_decay(now)) {
            ids.push_back(record.weight_id);
        }
    }
    return ids;
}

// ==========================================
// Traversal and Analysis
// ==========================================

std::vector<std::vector<std::string>> GraphStore::find_paths(const std::string& from,
                                                             const std::string& to,
                                                             int max_length) const {
    return enumerate_simple_paths(*this, from, to, max_length);
}

GraphStatistics GraphStore::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_edges = edges_.size();
    stats.num_contexts = context_stats_.size();
    stats.num_conflicts = conflict_zones_.size();

    if (!nodes_.empty()) {
        size_t total_out = 0;
        for (NodeHandle h = 0; h < nodes_.size(); ++h) {
            size_t degree = successor_handles(h).size();
            total_out += degree;
            stats.max_out_degree = std::max(stats.max_out_degree, degree);
        }
        stats.avg_out_degree = static_cast<double>(total_out) / nodes_.size();
    }

    if (edges_.empty()) {
        return stats;
    }

    double total_confidence = 0.0;
    double total_tension = 0.0;
    auto now = Clock::now();
    for (const auto& record : edges_) {
        total_confidence += record.confidence;
        total_tension += record.tension;
        if (record.suggested) stats.num_suggested++;
        if (record.should_decay(now)) stats.num_decay_candidates++;
        stats.edges_by_type[relation_type_to_string(record.type)]++;
        stats.edges_by_status[lifecycle_status_to_string(record.status)]++;
    }

    stats.avg_confidence = total_confidence / edges_.size();
    stats.avg_tension = total_tension / edges_.size();

    return stats;
}

// ==========================================
// Handle-level Access
// ==========================================

std::optional<NodeHandle> GraphStore::node_handle(const std::string& id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<NodeHandle> GraphStore::successor_handles(NodeHandle handle) const {
    std::vector<NodeHandle> result;
    for (EdgeHandle e : out_edges_.at(handle)) {
        NodeHandle next = edge_ends_[e].second;
        if (std::find(result.begin(), result.end(), next) == result.end()) {
            result.push_back(next);
        }
    }
    return result;
}

std::vector<NodeHandle> GraphStore::predecessor_handles(NodeHandle handle) const {
    std::vector<NodeHandle> result;
    for (EdgeHandle e : in_edges_.at(handle)) {
        NodeHandle prev = edge_ends_[e].first;
        if (std::find(result.begin(), result.end(), prev) == result.end()) {
            result.push_back(prev);
        }
    }
    return result;
}

const std::vector<EdgeHandle>* GraphStore::pair_edges(NodeHandle source, NodeHandle target) const {
    auto it = pair_index_.find({source, target});
    if (it == pair_index_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

void GraphStore::clear() {
    nodes_.clear();
    node_index_.clear();
    edges_.clear();
    edge_ends_.clear();
    edge_keys_.clear();
    registry_.clear();
    out_edges_.clear();
    in_edges_.clear();
    pair_index_.clear();
    conflict_zones_.clear();
    context_stats_.clear();
    dreaming_queue_ = std::priority_queue<DreamingEntry>();
}

// ==========================================
// Internal Helpers
// ==========================================

NodeHandle GraphStore::ensure_node(const std::string& id) {
    auto it = node_index_.find(id);
    if (it != node_index_.end()) {
        return it->second;
    }
    add_node(id);
    return node_index_.at(id);
}

EdgeRecord* GraphStore::find_edge(const std::string& weight_id) {
    auto it = registry_.find(weight_id);
    return it != registry_.end() ? &edges_[it->second] : nullptr;
}

void GraphStore::update_context_stats(const std::string& context_id, double confidence) {
    auto it = context_stats_.find(context_id);
    if (it == context_stats_.end()) {
        ContextStats stats;
        stats.created_at = Clock::now();
        it = context_stats_.emplace(context_id, stats).first;
    }

    auto& stats = it->second;
    double total = stats.mean_confidence * static_cast<double>(stats.edge_count) + confidence;
    stats.edge_count++;
    stats.mean_confidence = total / static_cast<double>(stats.edge_count);
}

void GraphStore::refresh_conflict_state(const EdgeRecord& record) {
    if (!record.is_conflicted()) {
        conflict_zones_.erase(record.weight_id);
    }
}

void GraphStore::validate_id(const std::string& id, const std::string& role) {
    bool blank = std::all_of(id.begin(), id.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw ValidationError(role + " must be a non-empty identifier");
    }
}

std::string GraphStore::generate_node_weight_id(const std::string& id) {
    return "N_" + id + "_" + random_hex(8);
}

} // namespace sdb
