#pragma once

#include "diagnostics/consistency_engine.hpp"
#include "discovery/link_prediction.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace sdb {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Settings shared by the graph, diagnostics and dreaming engines
 */
struct EngineConfig {
    // Identity and storage
    std::string operator_id = "anonymous";      ///< Recorded on events and exports
    std::string data_directory = "sdb_data";    ///< Where exports are mirrored
    bool verbose = false;                       ///< Console logging

    // Graph
    std::string default_context = "global";     ///< Context for insertions without one
    double conflict_confidence = 0.5;           ///< Incoming confidence needed to flag a conflict

    // Diagnostics
    int history_capacity = 1000;                ///< Coherence history bound
    int history_retain = 500;                   ///< Entries kept after truncation
    int cycle_max_length = 12;                  ///< Longest cycle enumerated
    long cycle_step_budget = 200000;            ///< DFS steps before giving up
    int cycle_time_budget_ms = 2000;            ///< Wall-clock budget for cycle search

    // Dreaming
    int max_suggestions = 10;
    double structural_hole_threshold = 0.4;
    double similarity_threshold = 0.35;
    double dreaming_similarity_threshold = 0.3;
    double path_completion_threshold = 0.5;

    /**
     * @brief Load configuration from JSON file
     *
     * Keys that are absent keep their defaults.
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Defaults overridden by SDB_OPERATOR, SDB_DATA_DIR and SDB_VERBOSE
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    ConsistencyConfig consistency_config() const;
    LinkPredictionConfig link_prediction_config() const;
};

} // namespace sdb
