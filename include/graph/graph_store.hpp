#ifndef GRAPH_STORE_HPP
#define GRAPH_STORE_HPP

#include "graph/edge_record.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

using NodeHandle = std::size_t;
using EdgeHandle = std::size_t;

/**
 * @brief An entity in the graph
 *
 * Nodes carry no relations themselves; all structure lives in the edge
 * records that reference them by id.
 */
struct Node {
    std::string id;                                    // Unique identifier
    std::string weight_id;                             // "N_<id>_<8 hex>" unless supplied
    std::string type = "entity";
    std::string creator = "system";
    std::string domain = "general";
    std::string meaning;
    Timestamp created_at;
    Timestamp lifespan;                                // created_at + 365 days
    int activation_count = 0;
    LifecycleStatus status = LifecycleStatus::ACTIVE;
    std::map<std::string, std::string> properties;     // Unrecognized attributes

    nlohmann::json to_json() const;
    static Node from_json(const nlohmann::json& j);
};

/**
 * @brief Aggregate bookkeeping for one context id
 */
struct ContextStats {
    Timestamp created_at;
    size_t edge_count = 0;
    double mean_confidence = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Entry of the link-prediction priority queue
 *
 * Priority is confidence * (1 - tension) of the record at insertion time.
 */
struct DreamingEntry {
    double priority = 0.0;
    std::string source;
    std::string target;

    bool operator<(const DreamingEntry& other) const {
        return priority < other.priority;
    }
};

/**
 * @brief Summary of the store contents
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_contexts = 0;
    size_t num_conflicts = 0;
    size_t num_suggested = 0;
    size_t num_decay_candidates = 0;

    double avg_confidence = 0.0;
    double avg_tension = 0.0;
    double avg_out_degree = 0.0;
    size_t max_out_degree = 0;

    std::map<std::string, size_t> edges_by_type;       // relation symbol -> count
    std::map<std::string, size_t> edges_by_status;     // lifecycle status -> count

    nlohmann::json to_json() const;
};

/**
 * @brief Directed multigraph of nodes and stateful edge records
 *
 * Nodes and records live in two arenas and are addressed by integer handles.
 * The per-node adjacency lists, the (source, target) pair index and the
 * weight-id registry all resolve to the same record slot, so a record is
 * stored exactly once regardless of how it is looked up.
 *
 * Insertion is where the semantics live:
 * - same (source, target, type, meaning) merges into the existing record
 * - same (source, target, type) with a different meaning at confidence > 0.5
 *   flags both records in the conflict zone, and both are kept
 *
 * Pointers and references returned by accessors are invalidated by the next
 * mutating call. Callers keep weight ids, not pointers.
 *
 * Not thread-safe. Callers serialize mutation.
 */
class GraphStore {
public:
    GraphStore() = default;

    static constexpr const char* DEFAULT_CONTEXT = "global";
    static constexpr const char* RESTORED_CONTEXT = "restored";
    static constexpr double CONFLICT_CONFIDENCE = 0.5;

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Add or overwrite a node
     * @param id Node identifier (must not be blank)
     * @param attributes weight_id, type, creator, domain and meaning fill the
     *        node; anything else lands in properties
     * @return The node's weight id
     * @throws ValidationError if the id is empty or whitespace-only
     *
     * Repeat calls keep the node's handle and edges but reset its
     * timestamps, activation count and status.
     */
    std::string add_node(const std::string& id,
                         const std::map<std::string, std::string>& attributes = {});

    /**
     * @brief Insert an edge record, merging or flagging conflicts as needed
     * @param record The incoming record (copied into the store)
     * @param context_id Context the observation comes from
     * @param auto_merge Fold an exact (type, meaning) match into the existing record
     * @return Weight id of the stored record (the existing one when merged)
     * @throws ValidationError if an endpoint id is blank
     *
     * Missing endpoints are created as bare entities.
     */
    std::string add_edge(const EdgeRecord& record,
                         const std::string& context_id = DEFAULT_CONTEXT,
                         bool auto_merge = true);

    /**
     * @brief First record on (source, target) with the given type, or nullptr
     */
    const EdgeRecord* get_edge(const std::string& source,
                               const std::string& target,
                               RelationType type = RelationType::LAMBDA) const;

    const EdgeRecord* get_edge_by_id(const std::string& weight_id) const;

    /**
     * @brief All records from source to target, in insertion order
     */
    std::vector<const EdgeRecord*> edges_between(const std::string& source,
                                                 const std::string& target) const;

    const Node* get_node(const std::string& id) const;
    bool has_node(const std::string& id) const;

    /**
     * @brief Distinct direct successors / predecessors in adjacency order
     */
    std::vector<std::string> successors(const std::string& id) const;
    std::vector<std::string> predecessors(const std::string& id) const;
    std::vector<std::string> neighbors(const std::string& id) const { return successors(id); }

    bool has_direct_edge(const std::string& source, const std::string& target) const;

    /**
     * @brief True if an edge exists in either direction
     */
    bool has_any_edge(const std::string& a, const std::string& b) const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /**
     * @brief Node ids in insertion order
     */
    std::vector<std::string> node_ids() const;

    std::vector<const EdgeRecord*> all_edges() const;

    const std::set<std::string>& conflict_zones() const { return conflict_zones_; }

    std::optional<ContextStats> context_stats(const std::string& context_id) const;
    const std::map<std::string, ContextStats>& all_context_stats() const { return context_stats_; }

    /**
     * @brief Snapshot of the dreaming queue, highest priority first
     */
    std::vector<DreamingEntry> dreaming_queue() const;

    // ==========================================
    // Record Lifecycle
    // ==========================================

    /**
     * @brief Reinforce a stored record
     * @return false if the id is unknown
     */
    bool activate_edge(const std::string& weight_id,
                       const std::string& context_id = "activation");

    /**
     * @brief Lower a record's tension (all contexts when context_id is empty)
     * @return false if the id is unknown
     *
     * The record leaves the conflict zone once its tension is back at or
     * below 0.8.
     */
    bool resolve_tension(const std::string& weight_id,
                         const std::string& context_id = "",
                         double new_tension = 0.0);

    bool archive_node(const std::string& id);
    bool archive_edge(const std::string& weight_id);

    /**
     * @brief Weight ids of records whose should_decay() holds
     */
    std::vector<std::string> decay_candidates() const;
    std::vector<std::string> decay_candidates(Timestamp now) const;

    // ==========================================
    // Traversal and Analysis
    // ==========================================

    /**
     * @brief Simple paths from one node to another
     * @param max_length Maximum number of hops
     * @return Each path as a list of node ids, in discovery order
     */
    std::vector<std::vector<std::string>> find_paths(const std::string& from,
                                                     const std::string& to,
                                                     int max_length = 3) const;

    GraphStatistics compute_statistics() const;

    // ==========================================
    // Handle-level Access
    // ==========================================

    std::optional<NodeHandle> node_handle(const std::string& id) const;
    const Node& node_at(NodeHandle handle) const { return nodes_.at(handle); }
    const EdgeRecord& edge_at(EdgeHandle handle) const { return edges_.at(handle); }
    NodeHandle edge_source(EdgeHandle handle) const { return edge_ends_.at(handle).first; }
    NodeHandle edge_target(EdgeHandle handle) const { return edge_ends_.at(handle).second; }
    const std::string& edge_key(EdgeHandle handle) const { return edge_keys_.at(handle); }

    const std::vector<EdgeHandle>& out_edges(NodeHandle handle) const { return out_edges_.at(handle); }
    const std::vector<EdgeHandle>& in_edges(NodeHandle handle) const { return in_edges_.at(handle); }

    /**
     * @brief Distinct successor handles in adjacency order
     */
    std::vector<NodeHandle> successor_handles(NodeHandle handle) const;
    std::vector<NodeHandle> predecessor_handles(NodeHandle handle) const;

    /**
     * @brief Record handles from source to target, or nullptr when there are none
     */
    const std::vector<EdgeHandle>* pair_edges(NodeHandle source, NodeHandle target) const;

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief Serialize nodes, records and the conflict zone
     */
    nlohmann::json to_json() const;

    /**
     * @brief Replace the contents with a serialized graph
     *
     * Nodes keep their serialized attributes. Every record is replayed
     * through add_edge() under the "restored" context, so merge rules apply.
     */
    void import_json(const nlohmann::json& j);

    void export_to_json(const std::string& filename) const;
    void load_from_json(const std::string& filename);

    void clear();

    /**
     * @brief Incoming confidence above which a meaning mismatch is flagged
     */
    void set_conflict_confidence(double threshold) { conflict_confidence_ = threshold; }
    double conflict_confidence() const { return conflict_confidence_; }

private:
    // ==========================================
    // Internal Data Structures
    // ==========================================

    std::vector<Node> nodes_;
    std::unordered_map<std::string, NodeHandle> node_index_;           // id -> handle

    std::vector<EdgeRecord> edges_;
    std::vector<std::pair<NodeHandle, NodeHandle>> edge_ends_;         // handle -> (source, target)
    std::vector<std::string> edge_keys_;                               // "<src>→<tgt>:<type>:<hex>"
    std::unordered_map<std::string, EdgeHandle> registry_;             // weight_id -> handle

    std::vector<std::vector<EdgeHandle>> out_edges_;
    std::vector<std::vector<EdgeHandle>> in_edges_;
    std::map<std::pair<NodeHandle, NodeHandle>, std::vector<EdgeHandle>> pair_index_;

    std::set<std::string> conflict_zones_;
    std::map<std::string, ContextStats> context_stats_;
    std::priority_queue<DreamingEntry> dreaming_queue_;

    double conflict_confidence_ = CONFLICT_CONFIDENCE;

    // ==========================================
    // Internal Helper Methods
    // ==========================================

    /**
     * @brief Handle of an existing node, or a freshly created bare entity
     */
    NodeHandle ensure_node(const std::string& id);

    EdgeRecord* find_edge(const std::string& weight_id);

    void update_context_stats(const std::string& context_id, double confidence);

    /**
     * @brief Fill an empty store from a serialized graph
     */
    void restore_from(const nlohmann::json& j);

    /**
     * @brief Remove a record from the conflict zone once its tension has been resolved
     */
    void refresh_conflict_state(const EdgeRecord& record);

    static void validate_id(const std::string& id, const std::string& role);
    static std::string generate_node_weight_id(const std::string& id);
};

} // namespace sdb

#endif // GRAPH_STORE_HPP
