#pragma once

#include "graph/graph_store.hpp"
#include "graph/graph_algorithms.hpp"
#include <deque>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

// Consistency configuration
struct ConsistencyConfig {
    // Status banding
    double healthy_threshold = 0.7;
    double warning_threshold = 0.4;
    double crisis_threshold = 0.2;

    // Tension detection
    double high_tension = 0.7;           // Records above this feed the tension penalty
    double conflict_confidence = 0.6;    // Both records above this for a meaning_conflict
    double tense_cycle_threshold = 0.6;  // Mean record tension along a cycle

    // Bounded history and tension log
    size_t history_capacity = 1000;
    size_t history_retain = 500;

    // Cycle enumeration limits
    CycleSearchBudget cycle_budget;

    // Recommendations
    size_t isolation_recommendation = 5; // Isolated nodes above this suggest new links

    bool verbose = false;
};

enum class CoherenceStatus {
    EMPTY,
    HEALTHY,
    WARNING,
    CRISIS,
    COLLAPSE
};

std::string coherence_status_to_string(CoherenceStatus status);

struct CoherenceMetrics {
    size_t nodes = 0;
    size_t edges = 0;
    size_t isolated_nodes = 0;
    size_t high_tension_relations = 0;
    double avg_confidence = 1.0;
};

/**
 * @brief Multi-dimensional health score of a graph
 */
struct CoherenceReport {
    double global = 1.0;
    double structural = 1.0;
    double semantic = 1.0;
    double tension_penalty = 0.0;
    CoherenceMetrics metrics;
    CoherenceStatus status = CoherenceStatus::EMPTY;
    Timestamp timestamp;

    nlohmann::json to_json() const;
};

enum class TensionKind {
    MEANING_CONFLICT,
    TENSE_CYCLE,
    ISOLATION
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

std::string tension_kind_to_string(TensionKind kind);
std::string severity_to_string(Severity severity);

/**
 * @brief One detected tension
 *
 * Which fields are meaningful depends on the kind:
 * meaning_conflict uses source/target/record_ids, tense_cycle uses
 * cycle/avg_tension, isolation uses count.
 */
struct TensionFinding {
    TensionKind kind = TensionKind::ISOLATION;
    Severity severity = Severity::LOW;
    std::string source;
    std::string target;
    std::vector<std::string> record_ids;
    std::vector<std::string> cycle;
    double avg_tension = 0.0;
    size_t count = 0;

    nlohmann::json to_json() const;
};

enum class Trend {
    IMPROVING,
    STABLE,
    DEGRADING,
    INSUFFICIENT_DATA
};

std::string trend_to_string(Trend trend);

struct TrendReport {
    Trend trend = Trend::INSUFFICIENT_DATA;
    double change = 0.0;
    size_t data_points = 0;
    double first = 0.0;
    double last = 0.0;
    double window_hours = 24.0;

    nlohmann::json to_json() const;
};

struct Diagnosis {
    CoherenceReport coherence;
    std::vector<TensionFinding> tensions;
    TrendReport trend;
    std::vector<std::string> recommendations;
    bool cycle_search_truncated = false;
    Timestamp timestamp;

    nlohmann::json to_json() const;
};

/**
 * @brief Read-and-score diagnostics over a GraphStore
 *
 * The engine never mutates the graph. Its only state is a bounded history
 * of (timestamp, global score) pairs and a bounded log of past findings;
 * both are trimmed to the newest history_retain entries once they exceed
 * history_capacity.
 */
class ConsistencyEngine {
public:
    explicit ConsistencyEngine(const GraphStore& graph);

    void set_config(const ConsistencyConfig& config) { config_ = config; }
    const ConsistencyConfig& config() const { return config_; }
    void set_verbose(bool verbose) { config_.verbose = verbose; }

    /**
     * @brief Score the graph and append the result to the history
     *
     * An empty graph scores a perfect 1.0 with status "empty" and is not
     * recorded.
     */
    CoherenceReport calculate_global_coherence();

    /**
     * @brief Meaning conflicts, tense cycles and isolation, in that order
     *
     * Cycle enumeration is bounded; when it gives up the findings gathered
     * so far are kept and last_cycle_search_truncated() reports true.
     */
    std::vector<TensionFinding> detect_tensions();

    /**
     * @brief Compare the first and last score recorded within the window
     */
    TrendReport get_coherence_trend(double window_hours = 24.0) const;

    /**
     * @brief Coherence, tensions, trend and advisory recommendations
     */
    Diagnosis diagnose();

    /**
     * @brief Last recorded global score, or 1.0 before any measurement
     */
    double current_coherence() const;

    const std::deque<std::pair<Timestamp, double>>& history() const { return history_; }
    const std::deque<TensionFinding>& tension_log() const { return tension_log_; }
    bool last_cycle_search_truncated() const { return last_cycle_truncated_; }

private:
    const GraphStore& graph_;
    ConsistencyConfig config_;
    std::deque<std::pair<Timestamp, double>> history_;
    std::deque<TensionFinding> tension_log_;
    bool last_cycle_truncated_ = false;

    double structural_coherence() const;
    CoherenceStatus status_for(double score) const;

    void find_meaning_conflicts(std::vector<TensionFinding>& out) const;
    void find_tense_cycles(std::vector<TensionFinding>& out);

    template <typename T>
    void append_bounded(std::deque<T>& log, const T& entry) const {
        log.push_back(entry);
        if (log.size() > config_.history_capacity) {
            while (log.size() > config_.history_retain) {
                log.pop_front();
            }
        }
    }
};

} // namespace sdb
