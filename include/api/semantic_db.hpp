#pragma once

#include "config/engine_config.hpp"
#include "diagnostics/consistency_engine.hpp"
#include "discovery/link_prediction.hpp"
#include "graph/graph_store.hpp"
#include "query/query_engine.hpp"
#include "storage/document_mirror.hpp"
#include "storage/persistence.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

/**
 * @brief One database instance: graph, diagnostics, dreaming and RQL
 *
 * Owns its GraphStore and the engines bound to it. A PersistenceBackend
 * may be borrowed; when present every edge insertion is recorded as an
 * OntologicalEvent and the stored record is written through.
 *
 * Not copyable (the engines hold references to the owned graph).
 */
class SemanticDB {
public:
    static constexpr const char* PROTOCOL = "Λ-Protocol 6.0";
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* ACCEPTED_CONTEXT = "dream_accepted";

    explicit SemanticDB(const EngineConfig& config = EngineConfig(),
                        PersistenceBackend* persistence = nullptr);

    SemanticDB(const SemanticDB&) = delete;
    SemanticDB& operator=(const SemanticDB&) = delete;

    // ==========================================
    // Gestures
    // ==========================================

    std::string add_node(const std::string& id,
                         const std::map<std::string, std::string>& attributes = {});

    /**
     * @brief Insert a relation given by its gesture symbol or name
     * @param gesture "Λ", "lambda", "Σ", ... (see string_to_relation_type)
     * @param context_id Empty means the configured default context
     * @return Weight id of the stored record
     * @throws UnknownGestureError, ValidationError
     */
    std::string add_edge(const std::string& source,
                         const std::string& target,
                         const std::string& gesture,
                         const std::string& meaning,
                         double confidence = 0.7,
                         double tension = 0.0,
                         const std::string& context_id = "",
                         const std::vector<std::string>& blind_spots = {});

    std::string add_edge(const EdgeRecord& record, const std::string& context_id = "");

    // ==========================================
    // Queries and Dreaming
    // ==========================================

    nlohmann::json query_rql(const std::string& text);

    std::vector<EdgeRecord> dreaming_session(size_t max_suggestions = 5);

    /**
     * @brief Fold a dreamed suggestion into the graph under "dream_accepted"
     * @throws InvalidAcceptanceError if the record is not a suggestion
     */
    std::string accept_suggestion(const EdgeRecord& suggestion);

    Diagnosis diagnose();

    // ==========================================
    // Dialogues
    // ==========================================

    std::string start_dialogue(const std::string& context,
                               const std::vector<std::string>& participants);

    /**
     * @throws ValidationError for an unknown dialogue id
     */
    void add_dialogue_turn(const std::string& dialogue_id,
                           const std::string& speaker,
                           const std::string& text);

    const Dialogue* get_dialogue(const std::string& dialogue_id) const;

    // ==========================================
    // Export / Import
    // ==========================================

    /**
     * @brief Export document: metadata, the caller's cycle summary and the
     *        full ontological context (entities, edges, conflict zones,
     *        current coherence)
     */
    nlohmann::json export_cycle(const nlohmann::json& cycle_summary);

    /**
     * @brief export_cycle() written through a document mirror
     */
    void export_cycle_to(const std::string& path,
                         const nlohmann::json& cycle_summary,
                         DocumentMirror& mirror);

    /**
     * @brief Replace the graph with an export document or a raw graph document
     */
    void import_document(const nlohmann::json& document);

    nlohmann::json statistics();

    // ==========================================
    // Components
    // ==========================================

    const EngineConfig& config() const { return config_; }
    GraphStore& graph() { return graph_; }
    const GraphStore& graph() const { return graph_; }
    ConsistencyEngine& consistency() { return consistency_; }
    LinkPredictionEngine& link_prediction() { return link_prediction_; }
    QueryEngine& query_engine() { return query_engine_; }

    size_t events_recorded() const { return events_recorded_; }

private:
    EngineConfig config_;
    GraphStore graph_;
    ConsistencyEngine consistency_;
    LinkPredictionEngine link_prediction_;
    QueryEngine query_engine_;
    PersistenceBackend* persistence_;

    std::map<std::string, Dialogue> dialogues_;
    size_t events_recorded_ = 0;

    /**
     * @brief Record the insertion of a stored record and write it through
     */
    void record_event(const std::string& weight_id,
                      double coherence_before,
                      const std::vector<std::string>& blind_spots);

    std::string resolve_context(const std::string& context_id) const;
};

} // namespace sdb
