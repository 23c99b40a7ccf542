#include "discovery/link_prediction.hpp"
#include "graph/graph_algorithms.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sdb {

LinkPredictionEngine::LinkPredictionEngine(GraphStore& graph)
    : graph_(graph) {}

// ==========================================
// Suggestion generation
// ==========================================

std::vector<EdgeRecord> LinkPredictionEngine::generate_suggestions(size_t max_suggestions) {
    std::vector<EdgeRecord> suggestions;
    std::set<PairKey> processed;
    if (max_suggestions == 0) {
        return suggestions;
    }

    report_progress("Dreaming", 0, 3);
    find_structural_holes(suggestions, processed, max_suggestions);

    report_progress("Dreaming", 1, 3);
    if (suggestions.size() < max_suggestions) {
        find_similar_pairs(suggestions, processed, max_suggestions);
    }

    report_progress("Dreaming", 2, 3);
    if (suggestions.size() < max_suggestions) {
        find_path_completions(suggestions, processed, max_suggestions);
    }
    report_progress("Dreaming", 3, 3);

    total_suggestions_ += suggestions.size();
    last_run_ = Clock::now();

    if (config_.verbose) {
        std::cout << "Dreaming produced " << suggestions.size() << " suggestions over "
                  << graph_.num_nodes() << " nodes" << std::endl;
    }

    return suggestions;
}

std::vector<EdgeRecord> LinkPredictionEngine::dreaming_cycle(size_t max_suggestions) {
    std::vector<EdgeRecord> suggestions;
    if (graph_.num_nodes() < config_.dreaming_min_nodes) {
        return suggestions;
    }

    auto neighborhood = [this](const std::string& id) {
        std::set<std::string> result;
        for (const auto& n : graph_.successors(id)) result.insert(n);
        for (const auto& n : graph_.predecessors(id)) result.insert(n);
        return result;
    };

    auto node_ids = graph_.node_ids();
    std::set<std::string> used_seeds;
    std::set<PairKey> processed;

    for (const auto& entry : graph_.dreaming_queue()) {
        for (const auto& seed : {entry.source, entry.target}) {
            if (suggestions.size() >= max_suggestions) {
                break;
            }
            if (!used_seeds.insert(seed).second) {
                continue;
            }

            for (const auto& other : node_ids) {
                if (suggestions.size() >= max_suggestions) {
                    break;
                }
                if (other == seed || graph_.has_any_edge(seed, other)) {
                    continue;
                }
                auto key = make_pair_key(seed, other);
                if (processed.count(key) > 0) {
                    continue;
                }
                processed.insert(key);

                double similarity = jaccard_similarity(graph_, seed, other);
                if (similarity > config_.dreaming_similarity_threshold) {
                    auto seed_neighbors = neighborhood(seed);
                    size_t shared = 0;
                    for (const auto& n : neighborhood(other)) {
                        shared += seed_neighbors.count(n);
                    }

                    suggestions.push_back(make_suggestion(
                        seed, other,
                        std::string(HYPOTHESIS_PREFIX) + " shared neighbors (" + std::to_string(shared) + ")",
                        "dreaming_cycle",
                        similarity,
                        config_.dreaming_tension));
                }
            }
        }
        if (suggestions.size() >= max_suggestions) {
            break;
        }
    }

    total_suggestions_ += suggestions.size();
    last_run_ = Clock::now();
    return suggestions;
}

std::string LinkPredictionEngine::accept_suggestion(EdgeRecord record, const std::string& context_id) {
    if (!record.suggested) {
        throw InvalidAcceptanceError(record.weight_id);
    }

    record.suggested = false;
    record.status = LifecycleStatus::ACTIVE;

    const std::string prefix = HYPOTHESIS_PREFIX;
    if (record.meaning.compare(0, prefix.size(), prefix) == 0) {
        record.meaning = ACCEPTED_PREFIX + record.meaning.substr(prefix.size());
    }

    return graph_.add_edge(record, context_id);
}

nlohmann::json LinkPredictionEngine::stats() const {
    nlohmann::json j;
    j["total_suggestions"] = total_suggestions_;
    j["last_run"] = last_run_ ? nlohmann::json(to_iso8601(*last_run_)) : nlohmann::json(nullptr);
    j["graph_size"] = {
        {"nodes", graph_.num_nodes()},
        {"edges", graph_.num_edges()}
    };
    j["status"] = graph_.num_nodes() >= config_.dreaming_min_nodes ? "ready" : "waiting_for_data";
    return j;
}

// ==========================================
// Strategies
// ==========================================

void LinkPredictionEngine::find_structural_holes(std::vector<EdgeRecord>& out,
                                                 std::set<PairKey>& processed,
                                                 size_t limit) const {
    for (const auto& broker : graph_.node_ids()) {
        auto successors = graph_.successors(broker);
        if (successors.size() < 2) {
            continue;
        }

        double score = structural_hole_score(successors);
        if (score <= config_.structural_hole_threshold) {
            continue;
        }

        for (size_t i = 0; i < successors.size(); ++i) {
            for (size_t k = i + 1; k < successors.size(); ++k) {
                const auto& a = successors[i];
                const auto& b = successors[k];
                auto key = make_pair_key(a, b);
                if (processed.count(key) > 0 || graph_.has_any_edge(a, b)) {
                    continue;
                }

                out.push_back(make_suggestion(
                    a, b,
                    std::string(HYPOTHESIS_PREFIX) + " structural hole via " + broker,
                    "structural_hole",
                    score,
                    config_.structural_hole_tension));
                processed.insert(key);

                if (out.size() >= limit) {
                    return;
                }
            }
        }
    }
}

void LinkPredictionEngine::find_similar_pairs(std::vector<EdgeRecord>& out,
                                              std::set<PairKey>& processed,
                                              size_t limit) const {
    auto nodes = graph_.node_ids();
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t k = i + 1; k < nodes.size(); ++k) {
            const auto& a = nodes[i];
            const auto& b = nodes[k];
            auto key = make_pair_key(a, b);
            if (processed.count(key) > 0 || graph_.has_any_edge(a, b)) {
                continue;
            }

            double similarity = jaccard_similarity(graph_, a, b);
            if (similarity > config_.similarity_threshold) {
                std::ostringstream meaning;
                meaning << HYPOTHESIS_PREFIX << " shared neighbors (J="
                        << std::fixed << std::setprecision(2) << similarity << ")";

                out.push_back(make_suggestion(
                    a, b, meaning.str(), "neighbor_similarity",
                    similarity, config_.similarity_tension));
                processed.insert(key);

                if (out.size() >= limit) {
                    return;
                }
            }
        }
    }
}

void LinkPredictionEngine::find_path_completions(std::vector<EdgeRecord>& out,
                                                 std::set<PairKey>& processed,
                                                 size_t limit) const {
    for (const auto& start : graph_.node_ids()) {
        for (const auto& mid : graph_.successors(start)) {
            for (const auto& end : graph_.successors(mid)) {
                if (start == end || graph_.has_any_edge(start, end)) {
                    continue;
                }
                auto key = make_pair_key(start, end);
                if (processed.count(key) > 0) {
                    continue;
                }

                double confidence = (hop_confidence(start, mid) + hop_confidence(mid, end)) / 2.0;
                if (confidence <= config_.path_completion_threshold) {
                    continue;
                }

                out.push_back(make_suggestion(
                    start, end,
                    std::string(HYPOTHESIS_PREFIX) + " path completion via " + mid,
                    "path_completion",
                    confidence,
                    config_.path_completion_tension));
                processed.insert(key);

                if (out.size() >= limit) {
                    return;
                }
            }
        }
    }
}

// ==========================================
// Helpers
// ==========================================

double LinkPredictionEngine::structural_hole_score(const std::vector<std::string>& successors) const {
    size_t total_pairs = 0;
    size_t connected_pairs = 0;
    for (size_t i = 0; i < successors.size(); ++i) {
        for (size_t k = i + 1; k < successors.size(); ++k) {
            total_pairs++;
            if (graph_.has_any_edge(successors[i], successors[k])) {
                connected_pairs++;
            }
        }
    }

    if (total_pairs == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(connected_pairs) / static_cast<double>(total_pairs);
}

double LinkPredictionEngine::hop_confidence(const std::string& from, const std::string& to) const {
    auto records = graph_.edges_between(from, to);
    return records.empty() ? config_.default_hop_confidence : records.front()->confidence;
}

void LinkPredictionEngine::report_progress(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

LinkPredictionEngine::PairKey LinkPredictionEngine::make_pair_key(const std::string& a,
                                                                  const std::string& b) {
    return a < b ? PairKey{a, b} : PairKey{b, a};
}

EdgeRecord LinkPredictionEngine::make_suggestion(const std::string& source,
                                                 const std::string& target,
                                                 const std::string& meaning,
                                                 const std::string& strategy,
                                                 double confidence,
                                                 double tension) {
    EdgeRecord suggestion(source, target, RelationType::LAMBDA, meaning,
                          confidence, tension, "dreaming: " + strategy);
    suggestion.suggested = true;
    return suggestion;
}

} // namespace sdb
