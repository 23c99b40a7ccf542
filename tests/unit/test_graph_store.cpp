#include <gtest/gtest.h>
#include "graph/graph_store.hpp"
#include "graph/graph_algorithms.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstdio>

using namespace sdb;

class GraphStoreTest : public ::testing::Test {
protected:
    GraphStore graph;

    std::string add(const std::string& source, const std::string& target,
                    const std::string& meaning, double confidence = 0.8,
                    const std::string& context = GraphStore::DEFAULT_CONTEXT,
                    RelationType type = RelationType::LAMBDA) {
        return graph.add_edge(EdgeRecord(source, target, type, meaning, confidence), context);
    }
};

// ==========================================
// Node Tests
// ==========================================

TEST_F(GraphStoreTest, AddNode) {
    std::string weight_id = graph.add_node("water", {{"type", "substance"}, {"color", "blue"}});

    EXPECT_EQ(weight_id.rfind("N_water_", 0), 0);
    const Node* node = graph.get_node("water");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->type, "substance");
    EXPECT_EQ(node->properties.at("color"), "blue");
    EXPECT_EQ(node->creator, "system");
}

TEST_F(GraphStoreTest, RepeatAddNodeKeepsWeightId) {
    std::string first = graph.add_node("water");
    std::string second = graph.add_node("water", {{"domain", "chemistry"}});

    EXPECT_EQ(first, second);
    EXPECT_EQ(graph.num_nodes(), 1);
    EXPECT_EQ(graph.get_node("water")->domain, "chemistry");
}

TEST_F(GraphStoreTest, BlankNodeIdThrows) {
    EXPECT_THROW(graph.add_node(""), ValidationError);
    EXPECT_THROW(graph.add_node("   "), ValidationError);
    EXPECT_THROW(add("", "b", "x"), ValidationError);
}

TEST_F(GraphStoreTest, AddEdgeCreatesEndpoints) {
    add("A", "B", "links");

    EXPECT_TRUE(graph.has_node("A"));
    EXPECT_TRUE(graph.has_node("B"));
    EXPECT_EQ(graph.get_node("B")->type, "entity");
    EXPECT_TRUE(graph.has_direct_edge("A", "B"));
    EXPECT_FALSE(graph.has_direct_edge("B", "A"));
    EXPECT_TRUE(graph.has_any_edge("B", "A"));
}

// ==========================================
// Merge and Conflict Tests
// ==========================================

TEST_F(GraphStoreTest, SameMeaningMerges) {
    std::string first = add("A", "B", "p", 0.8, "c1");
    std::string second = add("A", "B", "p", 0.8, "c2");

    EXPECT_EQ(first, second);
    EXPECT_EQ(graph.num_edges(), 1);

    const EdgeRecord* record = graph.get_edge_by_id(first);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->activation_count, 1);
    EXPECT_EQ(record->confidence_by_context.count("c1"), 1);
    EXPECT_EQ(record->confidence_by_context.count("c2"), 1);
    EXPECT_EQ(record->confidence_by_context.count("genesis"), 1);
    EXPECT_TRUE(graph.conflict_zones().empty());
}

TEST_F(GraphStoreTest, DifferentMeaningConflicts) {
    std::string p = add("A", "B", "p", 0.8);
    std::string q = add("A", "B", "q", 0.8);

    EXPECT_NE(p, q);
    EXPECT_EQ(graph.num_edges(), 2);
    EXPECT_EQ(graph.conflict_zones().size(), 2);
    EXPECT_EQ(graph.conflict_zones().count(p), 1);
    EXPECT_EQ(graph.conflict_zones().count(q), 1);
}

TEST_F(GraphStoreTest, LowConfidenceDoesNotConflict) {
    add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.4);

    EXPECT_EQ(graph.num_edges(), 2);
    EXPECT_TRUE(graph.conflict_zones().empty());
}

TEST_F(GraphStoreTest, DifferentTypesDoNotConflict) {
    add("A", "B", "p", 0.9, "global", RelationType::LAMBDA);
    add("A", "B", "q", 0.9, "global", RelationType::SIGMA);

    EXPECT_EQ(graph.num_edges(), 2);
    EXPECT_TRUE(graph.conflict_zones().empty());
    EXPECT_EQ(graph.get_edge("A", "B", RelationType::SIGMA)->meaning, "q");
}

TEST_F(GraphStoreTest, AutoMergeDisabledKeepsBoth) {
    EdgeRecord record("A", "B", RelationType::LAMBDA, "p", 0.8);
    graph.add_edge(record, "c1", false);
    graph.add_edge(EdgeRecord("A", "B", RelationType::LAMBDA, "p", 0.8), "c1", false);

    EXPECT_EQ(graph.num_edges(), 2);
    EXPECT_TRUE(graph.conflict_zones().empty());
}

TEST_F(GraphStoreTest, DuplicateWeightIdIsReminted) {
    EdgeRecord first("A", "B", RelationType::LAMBDA, "p");
    EdgeRecord second("C", "D", RelationType::LAMBDA, "q");
    second.weight_id = first.weight_id;

    std::string id1 = graph.add_edge(first);
    std::string id2 = graph.add_edge(second);

    EXPECT_EQ(id1, first.weight_id);
    EXPECT_NE(id2, id1);
    EXPECT_EQ(graph.get_edge_by_id(id2)->source, "C");
}

TEST_F(GraphStoreTest, InsertionRegistersContextWithoutActivation) {
    std::string id = add("A", "B", "p", 0.8, "biology");
    const EdgeRecord* record = graph.get_edge_by_id(id);

    EXPECT_EQ(record->activation_count, 0);
    EXPECT_DOUBLE_EQ(record->confidence_by_context.at("biology"), 0.8);
}

// ==========================================
// Context and Queue Tests
// ==========================================

TEST_F(GraphStoreTest, ContextStatistics) {
    add("A", "B", "p", 0.8, "c1");
    add("B", "C", "q", 0.6, "c1");
    add("A", "B", "p", 0.9, "c1");  // merge, not counted again

    auto stats = graph.context_stats("c1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->edge_count, 2);
    EXPECT_NEAR(stats->mean_confidence, 0.7, 1e-9);
    EXPECT_FALSE(graph.context_stats("unknown").has_value());
}

TEST_F(GraphStoreTest, DreamingQueueOrder) {
    graph.add_edge(EdgeRecord("C", "D", RelationType::LAMBDA, "weak", 0.5, 0.2));
    graph.add_edge(EdgeRecord("A", "B", RelationType::LAMBDA, "strong", 0.9, 0.0));

    auto queue = graph.dreaming_queue();
    ASSERT_EQ(queue.size(), 2);
    EXPECT_EQ(queue[0].source, "A");
    EXPECT_NEAR(queue[0].priority, 0.9, 1e-9);
    EXPECT_NEAR(queue[1].priority, 0.4, 1e-9);
}

TEST_F(GraphStoreTest, SuccessorsAreDistinct) {
    add("A", "B", "p");
    add("A", "B", "q", 0.3);
    add("A", "C", "r");

    EXPECT_EQ(graph.successors("A"), (std::vector<std::string>{"B", "C"}));
    EXPECT_EQ(graph.predecessors("B"), (std::vector<std::string>{"A"}));
    EXPECT_TRUE(graph.successors("Z").empty());
    EXPECT_EQ(graph.edges_between("A", "B").size(), 2);
}

// ==========================================
// Lifecycle Tests
// ==========================================

TEST_F(GraphStoreTest, ActivateEdge) {
    std::string id = add("A", "B", "p");

    EXPECT_TRUE(graph.activate_edge(id));
    EXPECT_FALSE(graph.activate_edge("HW_unknown"));
    EXPECT_EQ(graph.get_edge_by_id(id)->activation_count, 1);
    EXPECT_EQ(graph.get_node("A")->activation_count, 1);
}

TEST_F(GraphStoreTest, ResolveTensionLeavesConflictZone) {
    std::string p = add("A", "B", "p", 0.8);
    std::string q = add("A", "B", "q", 0.8);
    ASSERT_EQ(graph.conflict_zones().size(), 2);

    EXPECT_TRUE(graph.resolve_tension(p));
    EXPECT_EQ(graph.conflict_zones().count(p), 0);
    EXPECT_EQ(graph.conflict_zones().count(q), 1);
    EXPECT_FALSE(graph.resolve_tension("HW_unknown"));
}

TEST_F(GraphStoreTest, ArchiveEdge) {
    std::string p = add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.8);

    EXPECT_TRUE(graph.archive_edge(p));
    EXPECT_EQ(graph.get_edge_by_id(p)->status, LifecycleStatus::ARCHIVED);
    EXPECT_EQ(graph.conflict_zones().count(p), 0);

    EXPECT_TRUE(graph.archive_node("A"));
    EXPECT_EQ(graph.get_node("A")->status, LifecycleStatus::ARCHIVED);
    EXPECT_FALSE(graph.archive_node("Z"));
}

TEST_F(GraphStoreTest, DecayCandidates) {
    std::string tense = graph.add_edge(EdgeRecord("A", "B", RelationType::LAMBDA, "p", 0.5, 0.95));
    add("B", "C", "q");

    auto later = Clock::now() + std::chrono::hours(24 * 400);
    EXPECT_EQ(graph.decay_candidates(later), (std::vector<std::string>{tense}));
    EXPECT_TRUE(graph.decay_candidates().empty());
}

// ==========================================
// Traversal Tests
// ==========================================

TEST_F(GraphStoreTest, FindPaths) {
    add("A", "B", "p");
    add("B", "C", "q");
    add("A", "C", "r");

    auto paths = graph.find_paths("A", "C", 3);
    ASSERT_EQ(paths.size(), 2);
    EXPECT_NE(std::find(paths.begin(), paths.end(), std::vector<std::string>{"A", "B", "C"}), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), std::vector<std::string>{"A", "C"}), paths.end());

    EXPECT_EQ(graph.find_paths("A", "C", 1).size(), 1);
    EXPECT_TRUE(graph.find_paths("A", "A", 3).empty());
    EXPECT_TRUE(graph.find_paths("A", "Z", 3).empty());
}

TEST_F(GraphStoreTest, ComputeStatistics) {
    add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.6);
    add("B", "C", "r", 0.7, "global", RelationType::SIGMA);

    auto stats = graph.compute_statistics();
    EXPECT_EQ(stats.num_nodes, 3);
    EXPECT_EQ(stats.num_edges, 3);
    EXPECT_EQ(stats.num_conflicts, 2);
    EXPECT_EQ(stats.edges_by_type["Λ"], 2);
    EXPECT_EQ(stats.edges_by_type["Σ"], 1);
    EXPECT_EQ(stats.max_out_degree, 1);
    EXPECT_NEAR(stats.avg_confidence, 0.7, 1e-9);
}

// ==========================================
// Import/Export Tests
// ==========================================

TEST_F(GraphStoreTest, JsonRoundTrip) {
    std::string p = add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.8);
    add("B", "C", "r", 0.7);
    graph.add_node("lonely");

    nlohmann::json j = graph.to_json();
    EXPECT_EQ(j["metadata"]["node_count"], 4);
    EXPECT_EQ(j["metadata"]["edge_count"], 3);

    GraphStore restored;
    restored.import_json(j);

    EXPECT_EQ(restored.num_nodes(), 4);
    EXPECT_EQ(restored.num_edges(), 3);
    EXPECT_EQ(restored.conflict_zones().size(), 2);
    ASSERT_NE(restored.get_edge_by_id(p), nullptr);
    EXPECT_EQ(restored.get_edge_by_id(p)->confidence_by_context.count(GraphStore::RESTORED_CONTEXT), 1);
    EXPECT_EQ(restored.get_node("lonely")->weight_id, graph.get_node("lonely")->weight_id);
}

TEST_F(GraphStoreTest, ImportKeyedNodes) {
    nlohmann::json j = {
        {"nodes", {{"A", {{"type", "concept"}}}, {"B", nlohmann::json::object()}}},
        {"edges", {{{"source", "A"}, {"target", "B"}, {"meaning", "p"}}}}
    };
    graph.import_json(j);

    EXPECT_EQ(graph.num_nodes(), 2);
    EXPECT_EQ(graph.get_node("A")->type, "concept");
    EXPECT_EQ(graph.num_edges(), 1);
}

TEST_F(GraphStoreTest, ImportRejectsMalformedEdges) {
    nlohmann::json j = {{"edges", {{{"target", "B"}}}}};
    EXPECT_THROW(graph.import_json(j), ValidationError);
    EXPECT_THROW(graph.import_json(nlohmann::json::array()), ValidationError);
}

TEST_F(GraphStoreTest, FailedImportKeepsGraph) {
    std::string ab = add("A", "B", "p");
    add("B", "C", "q");

    nlohmann::json j = {
        {"nodes", {{{"id", "X"}}}},
        {"edges", {
            {{"source", "X"}, {"target", "Y"}, {"meaning", "ok"}},
            {{"target", "Z"}, {"meaning", "broken"}}
        }}
    };
    EXPECT_THROW(graph.import_json(j), ValidationError);

    EXPECT_EQ(graph.num_nodes(), 3);
    EXPECT_EQ(graph.num_edges(), 2);
    EXPECT_TRUE(graph.has_node("A"));
    EXPECT_FALSE(graph.has_node("X"));
    EXPECT_NE(graph.get_edge_by_id(ab), nullptr);
    EXPECT_EQ(graph.successors("B"), (std::vector<std::string>{"C"}));
}

TEST_F(GraphStoreTest, FileRoundTrip) {
    add("A", "B", "p");
    const std::string path = "test_graph_store_roundtrip.json";
    graph.export_to_json(path);

    GraphStore restored;
    restored.load_from_json(path);
    std::remove(path.c_str());

    EXPECT_EQ(restored.num_edges(), 1);
    EXPECT_THROW(restored.load_from_json("does/not/exist.json"), std::runtime_error);
}

// ==========================================
// Graph Algorithm Tests
// ==========================================

TEST_F(GraphStoreTest, DensityCountsDistinctPairs) {
    EXPECT_DOUBLE_EQ(density(graph), 0.0);

    add("A", "B", "p");
    add("A", "B", "q", 0.3);
    add("A", "A", "self");
    EXPECT_DOUBLE_EQ(density(graph), 0.5);
}

TEST_F(GraphStoreTest, WeaklyConnectedComponents) {
    add("A", "B", "p");
    add("C", "D", "q");
    graph.add_node("E");

    EXPECT_EQ(count_weakly_connected_components(graph), 3);
    EXPECT_EQ(isolated_nodes(graph), (std::vector<std::string>{"E"}));

    auto components = weakly_connected_components(graph);
    ASSERT_EQ(components.size(), 3);
    EXPECT_EQ(components[0], (std::vector<std::string>{"A", "B"}));
}

TEST_F(GraphStoreTest, JaccardIsSymmetric) {
    add("A", "C", "p");
    add("B", "C", "q");
    add("B", "D", "r");

    EXPECT_DOUBLE_EQ(jaccard_similarity(graph, "A", "B"), 0.5);
    EXPECT_DOUBLE_EQ(jaccard_similarity(graph, "B", "A"), 0.5);
    EXPECT_DOUBLE_EQ(jaccard_similarity(graph, "A", "Z"), 0.0);
}

TEST_F(GraphStoreTest, SimpleCycles) {
    add("A", "B", "p");
    add("B", "C", "q");
    add("C", "A", "r");
    add("C", "D", "s");

    auto result = enumerate_simple_cycles(graph);
    EXPECT_FALSE(result.truncated);
    ASSERT_EQ(result.cycles.size(), 1);
    EXPECT_EQ(result.cycles[0].size(), 3);
    EXPECT_EQ(graph.node_at(result.cycles[0][0]).id, "A");
}

TEST_F(GraphStoreTest, CycleSearchHonorsStepBudget) {
    add("A", "B", "p");
    add("B", "C", "q");
    add("C", "A", "r");

    CycleSearchBudget budget;
    budget.max_steps = 1;
    auto result = enumerate_simple_cycles(graph, budget);
    EXPECT_TRUE(result.truncated);
    EXPECT_TRUE(result.cycles.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
