#ifndef EDGE_RECORD_HPP
#define EDGE_RECORD_HPP

#include "core/time_util.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace sdb {

/**
 * @brief The six relation kinds an edge can carry
 */
enum class RelationType {
    ALPHA,   // Α - genesis
    LAMBDA,  // Λ - connection
    SIGMA,   // Σ - synthesis
    OMEGA,   // Ω - boundary
    NABLA,   // ∇ - enrichment
    PHI      // Φ - dialogue
};

/**
 * @brief UTF-8 symbol for a relation type ("Λ" etc.)
 */
std::string relation_type_to_string(RelationType type);

/**
 * @brief Parse a relation symbol or its ASCII name ("lambda", "LAMBDA")
 * @throws UnknownGestureError for anything else
 */
RelationType string_to_relation_type(const std::string& s);

/**
 * @brief Lifecycle status shared by nodes and edge records
 */
enum class LifecycleStatus {
    ACTIVE,
    SLEEPING,
    CONFLICTED,
    ARCHIVED
};

std::string lifecycle_status_to_string(LifecycleStatus status);
LifecycleStatus string_to_lifecycle_status(const std::string& s);

/**
 * @brief Stateful, mergeable edge between two nodes
 *
 * An EdgeRecord remembers how confident each context was in its meaning and
 * how much unresolved tension each context observed. The global confidence
 * is the mean of the per-context confidences and the global tension is the
 * maximum of the per-context tensions; both are recomputed after every
 * mutation.
 *
 * Records are value types. Once inserted into a GraphStore the store owns
 * the live copy and callers refer to it by weight_id.
 */
struct EdgeRecord {
    std::string source;
    std::string target;
    RelationType type = RelationType::LAMBDA;
    std::string meaning;
    std::string intention;

    double confidence = 0.7;                           // [0, 1]
    double tension = 0.0;                              // [0, 1]
    double coherence_contribution = 0.0;               // confidence * (1 - tension)

    std::map<std::string, double> confidence_by_context;
    std::map<std::string, double> tension_by_context;

    std::string weight_id;                             // "HW_" + 12 hex
    int activation_count = 0;
    Timestamp last_activated;
    Timestamp created_at;
    Timestamp updated_at;
    Timestamp lifespan;                                // created_at + 365 days

    std::vector<std::string> parent_ids;
    std::vector<std::string> child_ids;

    bool suggested = false;                            // produced by link prediction
    LifecycleStatus status = LifecycleStatus::ACTIVE;

    EdgeRecord();

    /**
     * @brief Create a record and seed the "genesis" context with its
     *        initial confidence and tension
     */
    EdgeRecord(const std::string& source,
               const std::string& target,
               RelationType type,
               const std::string& meaning,
               double confidence = 0.7,
               double tension = 0.0,
               const std::string& intention = "");

    /**
     * @brief Hebbian reinforcement: bump confidence by 2% (capped at 0.95)
     *        and fold it into the context's running average
     */
    void activate(const std::string& context_id = "activation");

    /**
     * @brief Fold a context observation into the record
     *
     * Context confidence is averaged with the observation. Context tension
     * never decreases here; use resolve_tension() to lower it.
     * Ends with activate(context_id).
     */
    void update_from_context(const std::string& context_id,
                             double new_confidence,
                             double new_tension = 0.0);

    /**
     * @brief Seed a context with the current confidence/tension, without activation
     */
    void register_context(const std::string& context_id);

    /**
     * @brief Explicitly lower tension for one context (or all when context_id is empty)
     */
    void resolve_tension(const std::string& context_id, double new_tension = 0.0);

    /**
     * @brief Create a variant child sharing endpoints, at 80% confidence
     *
     * Lineage is recorded on both records.
     */
    EdgeRecord split(const std::string& variant_meaning,
                     std::optional<RelationType> new_type = std::nullopt);

    /**
     * @brief Synthesize a new record from two records on the same (source, target, type)
     * @throws IncompatibleMergeError if source, target or type differ
     */
    EdgeRecord merge_with(const EdgeRecord& other) const;

    /**
     * @brief Advisory: lifespan expired, idle for 90+ days and tension > 0.9
     */
    bool should_decay() const;
    bool should_decay(Timestamp now) const;

    bool is_conflicted() const { return tension > 0.8; }

    /**
     * @brief Recompute confidence, tension, contribution and status from the context maps
     */
    void recalculate_metrics();

    nlohmann::json to_json() const;
    static EdgeRecord from_json(const nlohmann::json& j);

    static std::string generate_weight_id();
};

} // namespace sdb

#endif // EDGE_RECORD_HPP
