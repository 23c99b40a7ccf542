#include <gtest/gtest.h>
#include "graph/edge_record.hpp"
#include "core/errors.hpp"

using namespace sdb;

class EdgeRecordTest : public ::testing::Test {
protected:
    EdgeRecord record{"water", "life", RelationType::LAMBDA, "enables", 0.8, 0.1};
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(EdgeRecordTest, SeedsGenesisContext) {
    EXPECT_EQ(record.confidence_by_context.size(), 1);
    EXPECT_DOUBLE_EQ(record.confidence_by_context.at("genesis"), 0.8);
    EXPECT_DOUBLE_EQ(record.tension_by_context.at("genesis"), 0.1);
    EXPECT_NEAR(record.coherence_contribution, 0.72, 1e-9);
    EXPECT_EQ(record.status, LifecycleStatus::ACTIVE);
    EXPECT_EQ(record.activation_count, 0);
}

TEST_F(EdgeRecordTest, WeightIdFormat) {
    EXPECT_EQ(record.weight_id.rfind("HW_", 0), 0);
    EXPECT_EQ(record.weight_id.size(), 15);

    EdgeRecord other("a", "b", RelationType::LAMBDA, "x");
    EXPECT_NE(other.weight_id, record.weight_id);
}

TEST_F(EdgeRecordTest, ClampsInitialValues) {
    EdgeRecord clamped("a", "b", RelationType::SIGMA, "x", 1.5, -0.2);
    EXPECT_DOUBLE_EQ(clamped.confidence, 1.0);
    EXPECT_DOUBLE_EQ(clamped.tension, 0.0);
}

TEST_F(EdgeRecordTest, HighTensionIsConflicted) {
    EdgeRecord tense("a", "b", RelationType::OMEGA, "x", 0.7, 0.9);
    EXPECT_TRUE(tense.is_conflicted());
    EXPECT_EQ(tense.status, LifecycleStatus::CONFLICTED);
}

// ==========================================
// Relation Type Tests
// ==========================================

TEST(RelationTypeTest, ParsesSymbolsAndNames) {
    EXPECT_EQ(string_to_relation_type("Λ"), RelationType::LAMBDA);
    EXPECT_EQ(string_to_relation_type("Σ"), RelationType::SIGMA);
    EXPECT_EQ(string_to_relation_type("∇"), RelationType::NABLA);
    EXPECT_EQ(string_to_relation_type("lambda"), RelationType::LAMBDA);
    EXPECT_EQ(string_to_relation_type("OMEGA"), RelationType::OMEGA);
    EXPECT_EQ(relation_type_to_string(RelationType::PHI), "Φ");
}

TEST(RelationTypeTest, UnknownGestureThrows) {
    EXPECT_THROW(string_to_relation_type("Ж"), UnknownGestureError);
    EXPECT_THROW(string_to_relation_type(""), UnknownGestureError);
}

// ==========================================
// Context Aggregation Tests
// ==========================================

TEST_F(EdgeRecordTest, ActivateBumpsAndAverages) {
    EdgeRecord r("a", "b", RelationType::LAMBDA, "x", 0.5);
    r.activate("ctx");

    EXPECT_EQ(r.activation_count, 1);
    EXPECT_NEAR(r.confidence_by_context.at("ctx"), 0.51, 1e-9);
    EXPECT_NEAR(r.confidence, 0.505, 1e-9);
}

TEST_F(EdgeRecordTest, ActivateDoesNotBumpAboveCap) {
    EdgeRecord r("a", "b", RelationType::LAMBDA, "x", 0.95);
    r.activate("ctx");
    EXPECT_NEAR(r.confidence, 0.95, 1e-9);
}

TEST_F(EdgeRecordTest, UpdateFromContext) {
    record.update_from_context("biology", 0.6, 0.3);

    EXPECT_EQ(record.activation_count, 1);
    EXPECT_NEAR(record.tension_by_context.at("biology"), 0.3, 1e-9);
    EXPECT_NEAR(record.tension, 0.3, 1e-9);
    // (0.6 + 0.714) / 2 in "biology", averaged with genesis 0.8
    EXPECT_NEAR(record.confidence_by_context.at("biology"), 0.657, 1e-9);
    EXPECT_NEAR(record.confidence, 0.7285, 1e-9);
}

TEST_F(EdgeRecordTest, UpdateNeverLowersTension) {
    record.update_from_context("biology", 0.6, 0.4);
    record.update_from_context("biology", 0.6, 0.1);
    EXPECT_NEAR(record.tension_by_context.at("biology"), 0.4, 1e-9);
}

TEST_F(EdgeRecordTest, RegisterContextDoesNotActivate) {
    record.register_context("global");
    EXPECT_EQ(record.activation_count, 0);
    EXPECT_DOUBLE_EQ(record.confidence_by_context.at("global"), 0.8);
    EXPECT_DOUBLE_EQ(record.tension_by_context.at("global"), 0.1);
}

TEST_F(EdgeRecordTest, ResolveTensionInAllContexts) {
    EdgeRecord tense("a", "b", RelationType::LAMBDA, "x", 0.8, 0.9);
    tense.resolve_tension("");

    EXPECT_DOUBLE_EQ(tense.tension, 0.0);
    EXPECT_EQ(tense.status, LifecycleStatus::ACTIVE);
}

TEST_F(EdgeRecordTest, ResolveTensionInOneContext) {
    EdgeRecord r("a", "b", RelationType::LAMBDA, "x", 0.8, 0.5);
    r.update_from_context("x", 0.7, 0.9);
    ASSERT_TRUE(r.is_conflicted());

    r.resolve_tension("x", 0.2);
    EXPECT_NEAR(r.tension, 0.5, 1e-9);
    EXPECT_FALSE(r.is_conflicted());

    // Resolution only ever lowers
    r.resolve_tension("genesis", 0.8);
    EXPECT_NEAR(r.tension_by_context.at("genesis"), 0.5, 1e-9);
}

// ==========================================
// Lineage Tests
// ==========================================

TEST_F(EdgeRecordTest, SplitCreatesVariantChild) {
    EdgeRecord child = record.split("nourishes", RelationType::NABLA);

    EXPECT_EQ(child.source, "water");
    EXPECT_EQ(child.target, "life");
    EXPECT_EQ(child.type, RelationType::NABLA);
    EXPECT_EQ(child.meaning, "variant: nourishes");
    EXPECT_NEAR(child.confidence, 0.64, 1e-9);
    ASSERT_EQ(child.parent_ids.size(), 1);
    EXPECT_EQ(child.parent_ids[0], record.weight_id);
    ASSERT_EQ(record.child_ids.size(), 1);
    EXPECT_EQ(record.child_ids[0], child.weight_id);
}

TEST_F(EdgeRecordTest, MergeWithCombinesContexts) {
    EdgeRecord other("water", "life", RelationType::LAMBDA, "sustains", 0.6, 0.4);
    EdgeRecord merged = record.merge_with(other);

    EXPECT_EQ(merged.meaning, "Σ(enables, sustains)");
    EXPECT_NEAR(merged.confidence_by_context.at("genesis"), 0.7, 1e-9);
    EXPECT_NEAR(merged.confidence, 0.7, 1e-9);
    EXPECT_NEAR(merged.tension, 0.4, 1e-9);
    EXPECT_EQ(merged.parent_ids, (std::vector<std::string>{record.weight_id, other.weight_id}));
}

TEST_F(EdgeRecordTest, MergeWithMissingContextCountsAsZero) {
    EdgeRecord other("water", "life", RelationType::LAMBDA, "sustains", 0.6);
    record.register_context("biology");
    EdgeRecord merged = record.merge_with(other);

    EXPECT_NEAR(merged.confidence_by_context.at("biology"), 0.4, 1e-9);
    EXPECT_NEAR(merged.confidence, 0.55, 1e-9);
}

TEST_F(EdgeRecordTest, MergeIncompatibleThrows) {
    EdgeRecord other_target("water", "rock", RelationType::LAMBDA, "erodes");
    EdgeRecord other_type("water", "life", RelationType::OMEGA, "enables");

    EXPECT_THROW(record.merge_with(other_target), IncompatibleMergeError);
    EXPECT_THROW(record.merge_with(other_type), IncompatibleMergeError);
}

// ==========================================
// Decay and Status Tests
// ==========================================

TEST_F(EdgeRecordTest, ShouldDecayNeedsAllThreeConditions) {
    EdgeRecord tense("a", "b", RelationType::LAMBDA, "x", 0.5, 0.95);
    Timestamp late = tense.created_at + std::chrono::hours(24 * 400);
    Timestamp early = tense.created_at + std::chrono::hours(24 * 100);

    EXPECT_TRUE(tense.should_decay(late));
    EXPECT_FALSE(tense.should_decay(early));
    EXPECT_FALSE(record.should_decay(late));
    EXPECT_FALSE(tense.should_decay());
}

TEST_F(EdgeRecordTest, IdleRecordSleeps) {
    nlohmann::json j = record.to_json();
    j["created_at"] = to_iso8601(Clock::now() - std::chrono::hours(24 * 40));
    j["activation_count"] = 0;

    EdgeRecord restored = EdgeRecord::from_json(j);
    EXPECT_EQ(restored.status, LifecycleStatus::SLEEPING);
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(EdgeRecordTest, JsonPreservesState) {
    record.update_from_context("biology", 0.9, 0.2);
    EdgeRecord restored = EdgeRecord::from_json(record.to_json());

    EXPECT_EQ(restored.weight_id, record.weight_id);
    EXPECT_EQ(restored.type, RelationType::LAMBDA);
    EXPECT_EQ(restored.meaning, "enables");
    EXPECT_EQ(restored.confidence_by_context.size(), 2);
    EXPECT_NEAR(restored.confidence, record.confidence, 1e-9);
    EXPECT_NEAR(restored.tension, record.tension, 1e-9);
    EXPECT_EQ(restored.activation_count, 1);
}

TEST_F(EdgeRecordTest, FromJsonSeedsGenesis) {
    nlohmann::json j = {{"source", "a"}, {"target", "b"}, {"confidence", 0.6}};
    EdgeRecord restored = EdgeRecord::from_json(j);

    EXPECT_DOUBLE_EQ(restored.confidence_by_context.at("genesis"), 0.6);
    EXPECT_DOUBLE_EQ(restored.tension_by_context.at("genesis"), 0.0);
    EXPECT_EQ(restored.type, RelationType::LAMBDA);
    EXPECT_FALSE(restored.weight_id.empty());
}

TEST_F(EdgeRecordTest, FromJsonClampsContextValues) {
    nlohmann::json j = {
        {"source", "a"}, {"target", "b"},
        {"confidence_by_context", {{"c", 5.0}, {"d", 0.4}}},
        {"tension_by_context", {{"c", -3.0}}}
    };
    EdgeRecord restored = EdgeRecord::from_json(j);

    EXPECT_DOUBLE_EQ(restored.confidence_by_context.at("c"), 1.0);
    EXPECT_DOUBLE_EQ(restored.confidence_by_context.at("d"), 0.4);
    EXPECT_DOUBLE_EQ(restored.tension_by_context.at("c"), 0.0);
    EXPECT_GE(restored.confidence, 0.0);
    EXPECT_LE(restored.confidence, 1.0);
    EXPECT_GE(restored.tension, 0.0);
}

TEST_F(EdgeRecordTest, FromJsonRejectsMalformedEndpoints) {
    EXPECT_THROW(EdgeRecord::from_json({{"target", "b"}}), ValidationError);
    EXPECT_THROW(EdgeRecord::from_json({{"source", 1}, {"target", "b"}}), ValidationError);
    EXPECT_THROW(EdgeRecord::from_json(nlohmann::json::array()), ValidationError);
}
