#include <gtest/gtest.h>
#include "discovery/link_prediction.hpp"
#include "core/errors.hpp"

using namespace sdb;

class LinkPredictionTest : public ::testing::Test {
protected:
    GraphStore graph;
    LinkPredictionEngine engine{graph};

    void add(const std::string& source, const std::string& target, double confidence = 0.8) {
        graph.add_edge(EdgeRecord(source, target, RelationType::LAMBDA,
                                  source + " to " + target, confidence));
    }

    void expect_no_existing_edges(const std::vector<EdgeRecord>& suggestions) const {
        for (const auto& s : suggestions) {
            EXPECT_FALSE(graph.has_any_edge(s.source, s.target))
                << s.source << " -> " << s.target;
        }
    }
};

// ==========================================
// Strategy Tests
// ==========================================

TEST_F(LinkPredictionTest, StructuralHoles) {
    add("S", "X");
    add("S", "Y");
    add("S", "Z");

    auto suggestions = engine.generate_suggestions(10);
    ASSERT_EQ(suggestions.size(), 3);

    for (const auto& s : suggestions) {
        EXPECT_TRUE(s.suggested);
        EXPECT_EQ(s.type, RelationType::LAMBDA);
        EXPECT_EQ(s.meaning, "hypothesis: structural hole via S");
        EXPECT_EQ(s.intention, "dreaming: structural_hole");
        EXPECT_DOUBLE_EQ(s.confidence, 1.0);
        EXPECT_DOUBLE_EQ(s.tension, 0.1);
    }
    expect_no_existing_edges(suggestions);
    EXPECT_EQ(graph.num_edges(), 3);
}

TEST_F(LinkPredictionTest, RespectsMaximum) {
    add("S", "X");
    add("S", "Y");
    add("S", "Z");

    EXPECT_EQ(engine.generate_suggestions(2).size(), 2);
    EXPECT_TRUE(engine.generate_suggestions(0).empty());
}

TEST_F(LinkPredictionTest, NeighborSimilarityAfterHoles) {
    add("A", "C");
    add("B", "C");
    add("A", "D");
    add("B", "D");

    auto suggestions = engine.generate_suggestions(10);
    ASSERT_EQ(suggestions.size(), 2);

    EXPECT_EQ(suggestions[0].meaning, "hypothesis: structural hole via A");
    EXPECT_EQ(suggestions[1].source, "A");
    EXPECT_EQ(suggestions[1].target, "B");
    EXPECT_EQ(suggestions[1].meaning, "hypothesis: shared neighbors (J=1.00)");
    EXPECT_EQ(suggestions[1].intention, "dreaming: neighbor_similarity");
    EXPECT_DOUBLE_EQ(suggestions[1].tension, 0.05);
    expect_no_existing_edges(suggestions);
}

TEST_F(LinkPredictionTest, PathCompletion) {
    LinkPredictionConfig config;
    config.similarity_threshold = 1.0;
    engine.set_config(config);

    add("A", "B", 0.9);
    add("B", "C", 0.7);

    auto suggestions = engine.generate_suggestions(10);
    ASSERT_EQ(suggestions.size(), 1);
    EXPECT_EQ(suggestions[0].source, "A");
    EXPECT_EQ(suggestions[0].target, "C");
    EXPECT_EQ(suggestions[0].meaning, "hypothesis: path completion via B");
    EXPECT_NEAR(suggestions[0].confidence, 0.8, 1e-9);
}

TEST_F(LinkPredictionTest, WeakPathsAreNotCompleted) {
    LinkPredictionConfig config;
    config.similarity_threshold = 1.0;
    engine.set_config(config);

    add("A", "B", 0.3);
    add("B", "C", 0.3);

    EXPECT_TRUE(engine.generate_suggestions(10).empty());
}

TEST_F(LinkPredictionTest, NothingForConnectedPairs) {
    add("A", "B");
    add("B", "A");
    add("A", "C");
    add("C", "B");

    auto suggestions = engine.generate_suggestions(10);
    expect_no_existing_edges(suggestions);
    EXPECT_TRUE(suggestions.empty());
}

TEST_F(LinkPredictionTest, ProgressAndStats) {
    add("S", "X");
    add("S", "Y");

    int calls = 0;
    engine.set_progress_callback([&calls](const std::string& stage, int, int total) {
        EXPECT_EQ(stage, "Dreaming");
        EXPECT_EQ(total, 3);
        calls++;
    });

    EXPECT_FALSE(engine.last_run().has_value());
    engine.generate_suggestions(10);

    EXPECT_EQ(calls, 4);
    EXPECT_EQ(engine.total_suggestions(), 1);
    EXPECT_TRUE(engine.last_run().has_value());

    auto stats = engine.stats();
    EXPECT_EQ(stats["total_suggestions"], 1);
    EXPECT_EQ(stats["status"], "ready");
}

// ==========================================
// Dreaming Cycle Tests
// ==========================================

TEST_F(LinkPredictionTest, DreamingCycleNeedsThreeNodes) {
    add("A", "B");
    EXPECT_TRUE(engine.dreaming_cycle(10).empty());
    EXPECT_EQ(engine.stats()["status"], "waiting_for_data");
}

TEST_F(LinkPredictionTest, DreamingCycleFromQueue) {
    add("A", "C", 0.9);
    add("B", "C", 0.8);

    auto suggestions = engine.dreaming_cycle(10);
    ASSERT_EQ(suggestions.size(), 1);
    EXPECT_EQ(suggestions[0].source, "A");
    EXPECT_EQ(suggestions[0].target, "B");
    EXPECT_EQ(suggestions[0].meaning, "hypothesis: shared neighbors (1)");
    EXPECT_EQ(suggestions[0].intention, "dreaming: dreaming_cycle");
    EXPECT_DOUBLE_EQ(suggestions[0].tension, 0.1);
    EXPECT_TRUE(suggestions[0].suggested);
}

// ==========================================
// Acceptance Tests
// ==========================================

TEST_F(LinkPredictionTest, AcceptSuggestion) {
    add("S", "X");
    add("S", "Y");

    auto suggestions = engine.generate_suggestions(10);
    ASSERT_EQ(suggestions.size(), 1);

    std::string id = engine.accept_suggestion(suggestions[0]);
    const EdgeRecord* stored = graph.get_edge_by_id(id);
    ASSERT_NE(stored, nullptr);

    EXPECT_FALSE(stored->suggested);
    EXPECT_EQ(stored->meaning, "accepted hypothesis: structural hole via S");
    EXPECT_EQ(stored->confidence_by_context.count("dream_accepted"), 1);
    EXPECT_EQ(graph.num_edges(), 3);
    EXPECT_TRUE(graph.has_any_edge("X", "Y"));

    // Once accepted, the pair is no longer a candidate
    EXPECT_TRUE(engine.generate_suggestions(10).empty());
}

TEST_F(LinkPredictionTest, AcceptRejectsPlainRecords) {
    EdgeRecord plain("A", "B", RelationType::LAMBDA, "links");
    EXPECT_THROW(engine.accept_suggestion(plain), InvalidAcceptanceError);
    EXPECT_EQ(graph.num_edges(), 0);
}
