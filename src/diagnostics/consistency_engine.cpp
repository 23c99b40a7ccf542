#include "diagnostics/consistency_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace sdb {

namespace {

double clamp_unit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // namespace

// ==========================================
// Enum conversions
// ==========================================

std::string coherence_status_to_string(CoherenceStatus status) {
    switch (status) {
        case CoherenceStatus::EMPTY: return "empty";
        case CoherenceStatus::HEALTHY: return "healthy";
        case CoherenceStatus::WARNING: return "warning";
        case CoherenceStatus::CRISIS: return "crisis";
        case CoherenceStatus::COLLAPSE: return "collapse";
        default: return "unknown";
    }
}

std::string tension_kind_to_string(TensionKind kind) {
    switch (kind) {
        case TensionKind::MEANING_CONFLICT: return "meaning_conflict";
        case TensionKind::TENSE_CYCLE: return "tense_cycle";
        case TensionKind::ISOLATION: return "isolation";
        default: return "unknown";
    }
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        default: return "unknown";
    }
}

std::string trend_to_string(Trend trend) {
    switch (trend) {
        case Trend::IMPROVING: return "improving";
        case Trend::STABLE: return "stable";
        case Trend::DEGRADING: return "degrading";
        case Trend::INSUFFICIENT_DATA: return "insufficient_data";
        default: return "unknown";
    }
}

// ==========================================
// Report serialization
// ==========================================

nlohmann::json CoherenceReport::to_json() const {
    nlohmann::json j;
    j["global"] = global;
    j["structural"] = structural;
    j["semantic"] = semantic;
    j["tension_penalty"] = tension_penalty;
    j["metrics"] = {
        {"nodes", metrics.nodes},
        {"edges", metrics.edges},
        {"isolated_nodes", metrics.isolated_nodes},
        {"high_tension_relations", metrics.high_tension_relations},
        {"avg_confidence", metrics.avg_confidence}
    };
    j["status"] = coherence_status_to_string(status);
    j["timestamp"] = to_iso8601(timestamp);
    return j;
}

nlohmann::json TensionFinding::to_json() const {
    nlohmann::json j;
    j["type"] = tension_kind_to_string(kind);
    j["severity"] = severity_to_string(severity);
    switch (kind) {
        case TensionKind::MEANING_CONFLICT:
            j["source"] = source;
            j["target"] = target;
            j["record_ids"] = record_ids;
            break;
        case TensionKind::TENSE_CYCLE:
            j["cycle"] = cycle;
            j["avg_tension"] = avg_tension;
            break;
        case TensionKind::ISOLATION:
            j["count"] = count;
            break;
    }
    return j;
}

nlohmann::json TrendReport::to_json() const {
    nlohmann::json j;
    j["trend"] = trend_to_string(trend);
    j["change"] = change;
    j["data_points"] = data_points;
    if (data_points >= 2) {
        j["first"] = first;
        j["last"] = last;
    }
    j["window_hours"] = window_hours;
    return j;
}

nlohmann::json Diagnosis::to_json() const {
    nlohmann::json j;
    j["coherence"] = coherence.to_json();

    nlohmann::json tensions_json = nlohmann::json::array();
    for (const auto& finding : tensions) {
        tensions_json.push_back(finding.to_json());
    }
    j["tensions"] = tensions_json;
    j["trend"] = trend.to_json();
    j["recommendations"] = recommendations;
    j["cycle_search_truncated"] = cycle_search_truncated;
    j["diagnosis_timestamp"] = to_iso8601(timestamp);
    return j;
}

// ==========================================
// ConsistencyEngine Implementation
// ==========================================

ConsistencyEngine::ConsistencyEngine(const GraphStore& graph)
    : graph_(graph) {}

CoherenceReport ConsistencyEngine::calculate_global_coherence() {
    CoherenceReport report;
    report.timestamp = Clock::now();

    if (graph_.empty()) {
        return report;
    }

    report.structural = structural_coherence();

    double total_confidence = 0.0;
    size_t high_tension = 0;
    for (const auto* record : graph_.all_edges()) {
        total_confidence += record->confidence;
        if (record->tension > config_.high_tension) {
            high_tension++;
        }
    }

    size_t edge_count = graph_.num_edges();
    report.semantic = edge_count > 0 ? total_confidence / static_cast<double>(edge_count) : 1.0;
    report.tension_penalty = high_tension > 0
        ? std::min(1.0, std::log1p(static_cast<double>(high_tension)) / 10.0)
        : 0.0;

    report.global = clamp_unit(report.structural * 0.3 +
                               report.semantic * 0.5 +
                               (1.0 - report.tension_penalty) * 0.2);

    report.metrics.nodes = graph_.num_nodes();
    report.metrics.edges = edge_count;
    report.metrics.isolated_nodes = isolated_nodes(graph_).size();
    report.metrics.high_tension_relations = high_tension;
    report.metrics.avg_confidence = report.semantic;
    report.status = status_for(report.global);

    append_bounded(history_, std::make_pair(report.timestamp, report.global));

    if (config_.verbose) {
        std::cout << "Coherence: " << report.global
                  << " (" << coherence_status_to_string(report.status) << ")" << std::endl;
    }

    return report;
}

std::vector<TensionFinding> ConsistencyEngine::detect_tensions() {
    std::vector<TensionFinding> findings;

    find_meaning_conflicts(findings);
    find_tense_cycles(findings);

    size_t isolated = isolated_nodes(graph_).size();
    if (isolated > 0) {
        TensionFinding finding;
        finding.kind = TensionKind::ISOLATION;
        finding.severity = Severity::LOW;
        finding.count = isolated;
        findings.push_back(finding);
    }

    for (const auto& finding : findings) {
        append_bounded(tension_log_, finding);
    }

    return findings;
}

TrendReport ConsistencyEngine::get_coherence_trend(double window_hours) const {
    TrendReport report;
    report.window_hours = window_hours;

    auto window = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::ratio<3600>>(window_hours));
    Timestamp cutoff = Clock::now() - window;

    std::vector<double> recent;
    for (const auto& [when, score] : history_) {
        if (when >= cutoff) {
            recent.push_back(score);
        }
    }

    report.data_points = recent.size();
    if (recent.size() < 2) {
        report.trend = Trend::INSUFFICIENT_DATA;
        return report;
    }

    report.first = recent.front();
    report.last = recent.back();
    report.change = report.last - report.first;

    if (report.change > 0.05) {
        report.trend = Trend::IMPROVING;
    } else if (report.change < -0.05) {
        report.trend = Trend::DEGRADING;
    } else {
        report.trend = Trend::STABLE;
    }

    return report;
}

Diagnosis ConsistencyEngine::diagnose() {
    Diagnosis diagnosis;
    diagnosis.coherence = calculate_global_coherence();
    diagnosis.tensions = detect_tensions();
    diagnosis.trend = get_coherence_trend();
    diagnosis.cycle_search_truncated = last_cycle_truncated_;
    diagnosis.timestamp = Clock::now();

    auto status = diagnosis.coherence.status;
    if (status == CoherenceStatus::CRISIS || status == CoherenceStatus::COLLAPSE) {
        diagnosis.recommendations.push_back(
            "Ω: acknowledge a boundary, coherence is " + coherence_status_to_string(status));
    }

    size_t isolated = diagnosis.coherence.metrics.isolated_nodes;
    if (isolated > config_.isolation_recommendation) {
        diagnosis.recommendations.push_back(
            "Λ: create connections for " + std::to_string(isolated) + " isolated entities");
    }

    size_t high = std::count_if(diagnosis.tensions.begin(), diagnosis.tensions.end(),
                                [](const TensionFinding& t) { return t.severity == Severity::HIGH; });
    if (high > 0) {
        diagnosis.recommendations.push_back(
            "Φ: resolve via dialogue (" + std::to_string(high) + " high-severity conflicts)");
    }

    if (diagnosis.trend.trend == Trend::DEGRADING) {
        diagnosis.recommendations.push_back("∇: enrich with an invariant, coherence is degrading");
    }

    return diagnosis;
}

double ConsistencyEngine::current_coherence() const {
    return history_.empty() ? 1.0 : history_.back().second;
}

// ==========================================
// Internal Helpers
// ==========================================

double ConsistencyEngine::structural_coherence() const {
    double component_score = 1.0 / static_cast<double>(
        std::max<size_t>(1, count_weakly_connected_components(graph_)));
    return clamp_unit(density(graph_) * 0.4 + component_score * 0.6);
}

CoherenceStatus ConsistencyEngine::status_for(double score) const {
    if (score >= config_.healthy_threshold) return CoherenceStatus::HEALTHY;
    if (score >= config_.warning_threshold) return CoherenceStatus::WARNING;
    if (score >= config_.crisis_threshold) return CoherenceStatus::CRISIS;
    return CoherenceStatus::COLLAPSE;
}

void ConsistencyEngine::find_meaning_conflicts(std::vector<TensionFinding>& out) const {
    for (NodeHandle u = 0; u < graph_.num_nodes(); ++u) {
        for (NodeHandle v : graph_.successor_handles(u)) {
            if (u == v) {
                continue;
            }
            const auto* handles = graph_.pair_edges(u, v);
            if (!handles) {
                continue;
            }

            for (size_t i = 0; i < handles->size(); ++i) {
                for (size_t k = i + 1; k < handles->size(); ++k) {
                    const auto& a = graph_.edge_at((*handles)[i]);
                    const auto& b = graph_.edge_at((*handles)[k]);
                    if (a.type == b.type && a.meaning != b.meaning &&
                        a.confidence > config_.conflict_confidence &&
                        b.confidence > config_.conflict_confidence) {
                        TensionFinding finding;
                        finding.kind = TensionKind::MEANING_CONFLICT;
                        finding.severity = Severity::HIGH;
                        finding.source = graph_.node_at(u).id;
                        finding.target = graph_.node_at(v).id;
                        finding.record_ids = {a.weight_id, b.weight_id};
                        out.push_back(finding);
                    }
                }
            }
        }
    }
}

void ConsistencyEngine::find_tense_cycles(std::vector<TensionFinding>& out) {
    last_cycle_truncated_ = false;

    try {
        auto search = enumerate_simple_cycles(graph_, config_.cycle_budget);
        last_cycle_truncated_ = search.truncated;

        if (search.truncated && config_.verbose) {
            std::cerr << "Warning: cycle search stopped after " << search.steps
                      << " steps, reporting partial results" << std::endl;
        }

        std::vector<TensionFinding> tense;
        for (const auto& cycle : search.cycles) {
            if (cycle.size() <= 2) {
                continue;
            }

            double total_tension = 0.0;
            size_t count = 0;
            for (size_t i = 0; i < cycle.size(); ++i) {
                NodeHandle u = cycle[i];
                NodeHandle v = cycle[(i + 1) % cycle.size()];
                if (const auto* handles = graph_.pair_edges(u, v)) {
                    for (EdgeHandle h : *handles) {
                        total_tension += graph_.edge_at(h).tension;
                        count++;
                    }
                }
            }

            if (count == 0) {
                continue;
            }
            double avg = total_tension / static_cast<double>(count);
            if (avg > config_.tense_cycle_threshold) {
                TensionFinding finding;
                finding.kind = TensionKind::TENSE_CYCLE;
                finding.severity = Severity::MEDIUM;
                finding.avg_tension = avg;
                for (NodeHandle h : cycle) {
                    finding.cycle.push_back(graph_.node_at(h).id);
                }
                tense.push_back(finding);
            }
        }
        out.insert(out.end(), tense.begin(), tense.end());
    } catch (const std::exception& e) {
        // Diagnostics must still report the remaining findings
        if (config_.verbose) {
            std::cerr << "Warning: cycle enumeration failed: " << e.what() << std::endl;
        }
    }
}

} // namespace sdb
