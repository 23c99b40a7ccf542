#pragma once

#include "graph/graph_store.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

// Link prediction configuration
struct LinkPredictionConfig {
    size_t max_suggestions = 10;

    // Structural holes (broker with unconnected successors)
    double structural_hole_threshold = 0.4;
    double structural_hole_tension = 0.1;

    // Neighbor similarity (Jaccard over predecessors and successors)
    double similarity_threshold = 0.35;
    double similarity_tension = 0.05;

    // Path completion (A -> M -> B without A - B)
    double path_completion_threshold = 0.5;
    double path_completion_tension = 0.05;
    double default_hop_confidence = 0.7;

    // Queue-driven dreaming cycle
    double dreaming_similarity_threshold = 0.3;
    double dreaming_tension = 0.1;
    size_t dreaming_min_nodes = 3;

    bool verbose = false;
};

// Progress callback
using DreamingProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Proposes hypothetical edges ("dreaming") and folds accepted ones back
 *
 * Suggestions are Λ records flagged suggested, with meanings starting
 * "hypothesis:". They are never inserted by the engine itself; a caller
 * decides and hands them back through accept_suggestion().
 */
class LinkPredictionEngine {
public:
    explicit LinkPredictionEngine(GraphStore& graph);

    void set_config(const LinkPredictionConfig& config) { config_ = config; }
    const LinkPredictionConfig& config() const { return config_; }
    void set_verbose(bool verbose) { config_.verbose = verbose; }
    void set_progress_callback(DreamingProgressCallback cb) { progress_cb_ = std::move(cb); }

    /**
     * @brief Run the three strategies in order until max_suggestions is reached
     *
     * Order: structural holes, neighbor similarity, path completion.
     * An unordered pair is proposed at most once, and never when the pair
     * already has an edge in either direction.
     */
    std::vector<EdgeRecord> generate_suggestions(size_t max_suggestions = 10);

    /**
     * @brief Similarity search seeded by the store's dreaming queue
     *
     * Walks queued (source, target) entries in priority order and compares
     * each endpoint against every node it is not directly linked to.
     * Produces nothing for graphs with fewer than three nodes.
     */
    std::vector<EdgeRecord> dreaming_cycle(size_t max_suggestions = 10);

    /**
     * @brief Insert a suggestion into the graph
     * @return Weight id of the stored record
     * @throws InvalidAcceptanceError if the record is not a suggestion
     */
    std::string accept_suggestion(EdgeRecord record,
                                  const std::string& context_id = "dream_accepted");

    nlohmann::json stats() const;

    size_t total_suggestions() const { return total_suggestions_; }
    std::optional<Timestamp> last_run() const { return last_run_; }

    static constexpr const char* HYPOTHESIS_PREFIX = "hypothesis:";
    static constexpr const char* ACCEPTED_PREFIX = "accepted hypothesis:";

private:
    using PairKey = std::pair<std::string, std::string>;

    GraphStore& graph_;
    LinkPredictionConfig config_;
    size_t total_suggestions_ = 0;
    std::optional<Timestamp> last_run_;
    DreamingProgressCallback progress_cb_;

    void report_progress(const std::string& stage, int current, int total) const;

    void find_structural_holes(std::vector<EdgeRecord>& out,
                               std::set<PairKey>& processed,
                               size_t limit) const;
    void find_similar_pairs(std::vector<EdgeRecord>& out,
                            std::set<PairKey>& processed,
                            size_t limit) const;
    void find_path_completions(std::vector<EdgeRecord>& out,
                               std::set<PairKey>& processed,
                               size_t limit) const;

    /**
     * @brief 1 - connected successor pairs / total successor pairs
     */
    double structural_hole_score(const std::vector<std::string>& successors) const;

    double hop_confidence(const std::string& from, const std::string& to) const;

    static PairKey make_pair_key(const std::string& a, const std::string& b);
    static EdgeRecord make_suggestion(const std::string& source,
                                      const std::string& target,
                                      const std::string& meaning,
                                      const std::string& strategy,
                                      double confidence,
                                      double tension);
};

} // namespace sdb
