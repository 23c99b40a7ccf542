#pragma once

#include "graph/edge_record.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief One gesture applied to the graph, as recorded for audit
 */
struct OntologicalEvent {
    std::string id;                         ///< Unique event id
    Timestamp timestamp;
    std::string gesture;                    ///< Relation symbol (Α, Λ, Σ, Ω, ∇, Φ)
    std::string operator_id;                ///< Who applied the gesture
    std::vector<std::string> operands;      ///< Inputs (node ids, record ids)
    std::string result;                     ///< Outcome, usually a weight id
    std::vector<std::string> entities_affected;
    std::vector<std::string> blind_spots;   ///< Acknowledged unknowns
    double coherence_before = 1.0;
    double coherence_after = 1.0;
    double tension_level = 0.0;
    double significance = 0.0;              ///< |coherence_after - coherence_before| or caller-supplied
    std::map<std::string, std::string> ethics;  ///< Free-form ethics metadata
    std::string weight_id;                  ///< Weight id of the event itself

    nlohmann::json to_json() const;
    static OntologicalEvent from_json(const nlohmann::json& j);
};

struct DialogueTurn {
    std::string speaker;
    std::string text;
    Timestamp timestamp;

    nlohmann::json to_json() const;
    static DialogueTurn from_json(const nlohmann::json& j);
};

/**
 * @brief A recorded conversation about a context
 */
struct Dialogue {
    std::string id;
    std::string context;
    std::vector<std::string> participants;
    std::vector<DialogueTurn> turns;
    Timestamp created_at;

    void add_turn(const std::string& speaker, const std::string& text);

    nlohmann::json to_json() const;
    static Dialogue from_json(const nlohmann::json& j);
};

// ============================================================================
// Persistence Interface
// ============================================================================

/**
 * @brief Durable storage for events, edge records and dialogues
 *
 * The graph core depends only on this interface. Backends surface their
 * own failures to the caller unchanged; retries are a backend concern.
 */
class PersistenceBackend {
public:
    virtual ~PersistenceBackend() = default;

    static constexpr const char* EVENTS_TABLE = "events";
    static constexpr const char* EDGE_RECORDS_TABLE = "edge_records";
    static constexpr const char* DIALOGUES_TABLE = "dialogues";

    /**
     * @brief Store (or replace) an event
     * @throws ValidationError if id, gesture or weight_id is empty
     */
    virtual void store_event(const OntologicalEvent& event) = 0;

    /**
     * @brief Store (or replace) a record keyed by its weight id
     */
    virtual void store_edge_record(const EdgeRecord& record) = 0;

    virtual std::optional<EdgeRecord> load_edge_record(const std::string& weight_id) const = 0;

    virtual void store_dialogue(const Dialogue& dialogue) = 0;

    /**
     * @brief Rows of a table whose fields equal every filter value
     *
     * @param table One of "events", "edge_records", "dialogues"
     * @param filters Field name -> required value
     * @param limit Maximum number of rows, oldest first
     * @throws ValidationError for an unknown table
     */
    virtual std::vector<nlohmann::json> query(
        const std::string& table,
        const std::map<std::string, nlohmann::json>& filters = {},
        size_t limit = 100
    ) const = 0;
};

/**
 * @brief Process-local backend keeping rows as JSON documents
 */
class InMemoryPersistence : public PersistenceBackend {
public:
    void store_event(const OntologicalEvent& event) override;
    void store_edge_record(const EdgeRecord& record) override;
    std::optional<EdgeRecord> load_edge_record(const std::string& weight_id) const override;
    void store_dialogue(const Dialogue& dialogue) override;

    std::vector<nlohmann::json> query(
        const std::string& table,
        const std::map<std::string, nlohmann::json>& filters = {},
        size_t limit = 100
    ) const override;

    size_t size(const std::string& table) const;

private:
    // Rows in insertion order, plus an id -> position index for replacement
    struct Table {
        std::vector<nlohmann::json> rows;
        std::map<std::string, size_t> index;

        void upsert(const std::string& id, const nlohmann::json& row);
    };

    Table events_;
    Table edge_records_;
    Table dialogues_;

    const Table& table(const std::string& name) const;
};

} // namespace sdb
