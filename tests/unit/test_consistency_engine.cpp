#include <gtest/gtest.h>
#include "diagnostics/consistency_engine.hpp"
#include <algorithm>
#include <cmath>

using namespace sdb;

class ConsistencyEngineTest : public ::testing::Test {
protected:
    GraphStore graph;
    ConsistencyEngine engine{graph};

    void add(const std::string& source, const std::string& target,
             const std::string& meaning, double confidence, double tension = 0.0) {
        graph.add_edge(EdgeRecord(source, target, RelationType::LAMBDA, meaning,
                                  confidence, tension));
    }

    static size_t count_kind(const std::vector<TensionFinding>& findings, TensionKind kind) {
        return std::count_if(findings.begin(), findings.end(),
                             [kind](const TensionFinding& f) { return f.kind == kind; });
    }

    static bool has_recommendation(const Diagnosis& diagnosis, const std::string& prefix) {
        return std::any_of(diagnosis.recommendations.begin(), diagnosis.recommendations.end(),
                           [&prefix](const std::string& r) { return r.rfind(prefix, 0) == 0; });
    }
};

// ==========================================
// Coherence Tests
// ==========================================

TEST_F(ConsistencyEngineTest, EmptyGraphIsPerfect) {
    auto report = engine.calculate_global_coherence();

    EXPECT_DOUBLE_EQ(report.global, 1.0);
    EXPECT_DOUBLE_EQ(report.structural, 1.0);
    EXPECT_DOUBLE_EQ(report.semantic, 1.0);
    EXPECT_EQ(report.status, CoherenceStatus::EMPTY);
    EXPECT_TRUE(engine.history().empty());
    EXPECT_DOUBLE_EQ(engine.current_coherence(), 1.0);
}

TEST_F(ConsistencyEngineTest, SingleRelation) {
    add("A", "B", "p", 0.9);
    auto report = engine.calculate_global_coherence();

    // density 0.5, one component
    EXPECT_NEAR(report.structural, 0.8, 1e-9);
    EXPECT_NEAR(report.semantic, 0.9, 1e-9);
    EXPECT_DOUBLE_EQ(report.tension_penalty, 0.0);
    EXPECT_NEAR(report.global, 0.89, 1e-9);
    EXPECT_EQ(report.status, CoherenceStatus::HEALTHY);
    EXPECT_EQ(engine.history().size(), 1);
    EXPECT_NEAR(engine.current_coherence(), 0.89, 1e-9);
}

TEST_F(ConsistencyEngineTest, HighTensionPenalty) {
    add("A", "B", "p", 0.9, 0.9);
    auto report = engine.calculate_global_coherence();

    EXPECT_EQ(report.metrics.high_tension_relations, 1);
    EXPECT_NEAR(report.tension_penalty, std::log1p(1.0) / 10.0, 1e-9);
    EXPECT_LT(report.global, 0.89);
}

TEST_F(ConsistencyEngineTest, ScoresStayInUnitInterval) {
    add("A", "B", "p", 0.0, 1.0);
    for (int i = 0; i < 20; ++i) {
        graph.add_node("isolated_" + std::to_string(i));
    }
    auto report = engine.calculate_global_coherence();

    EXPECT_GE(report.global, 0.0);
    EXPECT_LE(report.global, 1.0);
    EXPECT_GE(report.structural, 0.0);
    EXPECT_LT(report.global, 0.2);
    EXPECT_EQ(report.status, CoherenceStatus::COLLAPSE);
}

TEST_F(ConsistencyEngineTest, HistoryIsBounded) {
    ConsistencyConfig config;
    config.history_capacity = 4;
    config.history_retain = 2;
    engine.set_config(config);

    add("A", "B", "p", 0.9);
    for (int i = 0; i < 5; ++i) {
        engine.calculate_global_coherence();
    }
    EXPECT_EQ(engine.history().size(), 2);
}

// ==========================================
// Tension Detection Tests
// ==========================================

TEST_F(ConsistencyEngineTest, NoConflictsForDistinctTargets) {
    add("A", "B", "p", 0.9);
    add("A", "C", "q", 0.9);

    auto findings = engine.detect_tensions();
    EXPECT_EQ(count_kind(findings, TensionKind::MEANING_CONFLICT), 0);
}

TEST_F(ConsistencyEngineTest, DetectsMeaningConflict) {
    add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.8);

    auto findings = engine.detect_tensions();
    ASSERT_EQ(count_kind(findings, TensionKind::MEANING_CONFLICT), 1);

    const auto& finding = findings.front();
    EXPECT_EQ(finding.kind, TensionKind::MEANING_CONFLICT);
    EXPECT_EQ(finding.severity, Severity::HIGH);
    EXPECT_EQ(finding.source, "A");
    EXPECT_EQ(finding.target, "B");
    EXPECT_EQ(finding.record_ids.size(), 2);
    EXPECT_EQ(engine.tension_log().size(), findings.size());
}

TEST_F(ConsistencyEngineTest, ModerateConfidenceIsNotAConflict) {
    add("A", "B", "p", 0.6);
    add("A", "B", "q", 0.6);

    auto findings = engine.detect_tensions();
    EXPECT_EQ(count_kind(findings, TensionKind::MEANING_CONFLICT), 0);
}

TEST_F(ConsistencyEngineTest, DetectsTenseCycle) {
    add("A", "B", "p", 0.7, 0.8);
    add("B", "C", "q", 0.7, 0.8);
    add("C", "A", "r", 0.7, 0.8);

    auto findings = engine.detect_tensions();
    ASSERT_EQ(count_kind(findings, TensionKind::TENSE_CYCLE), 1);

    auto it = std::find_if(findings.begin(), findings.end(),
                           [](const TensionFinding& f) { return f.kind == TensionKind::TENSE_CYCLE; });
    EXPECT_EQ(it->severity, Severity::MEDIUM);
    EXPECT_EQ(it->cycle, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_NEAR(it->avg_tension, 0.8, 1e-9);
    EXPECT_FALSE(engine.last_cycle_search_truncated());
}

TEST_F(ConsistencyEngineTest, TwoNodeCyclesAreIgnored) {
    add("A", "B", "p", 0.7, 0.9);
    add("B", "A", "q", 0.7, 0.9);

    auto findings = engine.detect_tensions();
    EXPECT_EQ(count_kind(findings, TensionKind::TENSE_CYCLE), 0);
}

TEST_F(ConsistencyEngineTest, CalmCycleIsNotTense) {
    add("A", "B", "p", 0.7, 0.1);
    add("B", "C", "q", 0.7, 0.1);
    add("C", "A", "r", 0.7, 0.1);

    EXPECT_EQ(count_kind(engine.detect_tensions(), TensionKind::TENSE_CYCLE), 0);
}

TEST_F(ConsistencyEngineTest, ReportsIsolation) {
    add("A", "B", "p", 0.9);
    graph.add_node("lonely");

    auto findings = engine.detect_tensions();
    ASSERT_EQ(count_kind(findings, TensionKind::ISOLATION), 1);
    EXPECT_EQ(findings.back().count, 1);
    EXPECT_EQ(findings.back().severity, Severity::LOW);
}

TEST_F(ConsistencyEngineTest, TruncatedCycleSearch) {
    ConsistencyConfig config;
    config.cycle_budget.max_steps = 1;
    engine.set_config(config);

    add("A", "B", "p", 0.7, 0.8);
    add("B", "C", "q", 0.7, 0.8);
    add("C", "A", "r", 0.7, 0.8);

    auto diagnosis = engine.diagnose();
    EXPECT_TRUE(diagnosis.cycle_search_truncated);
    EXPECT_TRUE(engine.last_cycle_search_truncated());
    EXPECT_EQ(count_kind(diagnosis.tensions, TensionKind::TENSE_CYCLE), 0);
}

// ==========================================
// Trend Tests
// ==========================================

TEST_F(ConsistencyEngineTest, TrendNeedsTwoPoints) {
    EXPECT_EQ(engine.get_coherence_trend().trend, Trend::INSUFFICIENT_DATA);

    add("A", "B", "p", 0.9);
    engine.calculate_global_coherence();
    auto trend = engine.get_coherence_trend();
    EXPECT_EQ(trend.trend, Trend::INSUFFICIENT_DATA);
    EXPECT_EQ(trend.data_points, 1);
}

TEST_F(ConsistencyEngineTest, StableTrend) {
    add("A", "B", "p", 0.9);
    engine.calculate_global_coherence();
    engine.calculate_global_coherence();

    auto trend = engine.get_coherence_trend();
    EXPECT_EQ(trend.trend, Trend::STABLE);
    EXPECT_NEAR(trend.change, 0.0, 1e-12);
}

TEST_F(ConsistencyEngineTest, DegradingTrend) {
    add("A", "B", "p", 0.9);
    engine.calculate_global_coherence();

    for (const auto* id : {"C", "D", "E", "F"}) {
        graph.add_node(id);
    }
    engine.calculate_global_coherence();

    auto trend = engine.get_coherence_trend();
    EXPECT_EQ(trend.trend, Trend::DEGRADING);
    EXPECT_NEAR(trend.change, -0.2, 1e-9);
}

TEST_F(ConsistencyEngineTest, ImprovingTrend) {
    add("A", "B", "p", 0.9);
    for (const auto* id : {"C", "D", "E", "F"}) {
        graph.add_node(id);
    }
    engine.calculate_global_coherence();

    // Chain the isolated nodes into one component
    add("B", "C", "q", 0.9);
    add("C", "D", "r", 0.9);
    add("D", "E", "s", 0.9);
    add("E", "F", "t", 0.9);
    engine.calculate_global_coherence();

    auto trend = engine.get_coherence_trend();
    EXPECT_EQ(trend.trend, Trend::IMPROVING);
    EXPECT_GT(trend.change, 0.05);
    EXPECT_NEAR(trend.change, 0.16, 1e-9);
}

// ==========================================
// Diagnosis Tests
// ==========================================

TEST_F(ConsistencyEngineTest, DiagnoseRecommendations) {
    add("A", "B", "p", 0.0, 1.0);
    for (int i = 0; i < 20; ++i) {
        graph.add_node("isolated_" + std::to_string(i));
    }

    auto diagnosis = engine.diagnose();
    EXPECT_TRUE(has_recommendation(diagnosis, "Ω"));
    EXPECT_TRUE(has_recommendation(diagnosis, "Λ: create connections for 20"));
    EXPECT_FALSE(has_recommendation(diagnosis, "Φ"));
}

TEST_F(ConsistencyEngineTest, DiagnoseConflictsRecommendDialogue) {
    add("A", "B", "p", 0.8);
    add("A", "B", "q", 0.8);

    auto diagnosis = engine.diagnose();
    EXPECT_TRUE(has_recommendation(diagnosis, "Φ: resolve via dialogue (1"));

    auto j = diagnosis.to_json();
    EXPECT_EQ(j["coherence"]["status"], "healthy");
    EXPECT_EQ(j["tensions"][0]["type"], "meaning_conflict");
    EXPECT_EQ(j["trend"]["trend"], "insufficient_data");
}

TEST_F(ConsistencyEngineTest, DiagnoseDegradingRecommendsEnrichment) {
    add("A", "B", "p", 0.9);
    engine.calculate_global_coherence();
    for (const auto* id : {"C", "D", "E", "F"}) {
        graph.add_node(id);
    }

    auto diagnosis = engine.diagnose();
    EXPECT_EQ(diagnosis.trend.trend, Trend::DEGRADING);
    EXPECT_TRUE(has_recommendation(diagnosis, "∇"));
}
