#ifndef QUERY_ENGINE_HPP
#define QUERY_ENGINE_HPP

#include "query/rql_parser.hpp"
#include "graph/graph_store.hpp"
#include "diagnostics/consistency_engine.hpp"
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

/**
 * @brief Result of a Φ query: intention keywords resonating with node ids
 */
struct PhiResult {
    std::string intention;
    std::string context;
    std::vector<std::string> keywords;
    std::vector<std::string> relevant_entities;
    std::vector<std::string> blind_spots;
    std::string insight;
    double coherence_at_query = 1.0;

    nlohmann::json to_json() const;
};

struct PathMatch {
    std::vector<std::string> nodes;
    std::vector<std::string> record_ids;               // first record of each hop
    double mean_confidence = 0.0;

    nlohmann::json to_json() const;
};

struct PathResult {
    std::string source;
    std::string target;
    size_t paths_found = 0;                            // paths passing min_coherence
    std::vector<PathMatch> paths;                      // at most 5, discovery order
    double coherence_threshold = 0.5;

    nlohmann::json to_json() const;
};

struct ExploreResult {
    std::string entity;
    bool found = false;
    std::string message;
    std::set<std::string> neighbors;
    int depth = 2;

    nlohmann::json to_json() const;
};

struct ContextMatch {
    bool is_entity = true;
    std::string name;                                  // entity id
    std::string source;                                // relation endpoints
    std::string target;
    std::string meaning;

    nlohmann::json to_json() const;
};

struct ContextResult {
    std::string keyword;
    std::vector<ContextMatch> matches;                 // at most 10
    size_t match_count = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Executes RQL queries against a graph
 *
 * Path and neighbor lookups go to the GraphStore; Φ queries also take a
 * fresh coherence measurement from the ConsistencyEngine.
 */
class QueryEngine {
public:
    QueryEngine(const GraphStore& graph, ConsistencyEngine& coherence);

    static constexpr size_t MAX_PATHS = 5;
    static constexpr size_t MAX_CONTEXT_MATCHES = 10;
    static constexpr size_t MAX_KEYWORDS = 10;

    /**
     * @brief Parse and execute
     * @return JSON result tagged with "type"
     */
    nlohmann::json run(const std::string& text);

    RqlQuery parse(const std::string& text) const { return parser_.parse(text); }
    nlohmann::json execute(const RqlQuery& query);

    PhiResult execute_phi(const RqlQuery& query);
    PathResult execute_path(const RqlQuery& query) const;
    ExploreResult execute_explore(const RqlQuery& query) const;
    ContextResult execute_context(const RqlQuery& query) const;

    /**
     * @brief Lower-cased words longer than 3 characters, minus stop words
     *
     * Deduplicated in order of appearance, at most MAX_KEYWORDS.
     */
    static std::vector<std::string> extract_keywords(const std::string& text);

private:
    const GraphStore& graph_;
    ConsistencyEngine& coherence_;
    RqlParser parser_;

    double hop_confidence(const std::string& from, const std::string& to,
                          std::string& record_id) const;
};

} // namespace sdb

#endif // QUERY_ENGINE_HPP
