#include "config/engine_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

bool parse_bool_env(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

bool in_unit_interval(double value) {
    return value >= 0.0 && value <= 1.0;
}

}  // namespace

namespace sdb {

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    config.operator_id = j.value("operator_id", config.operator_id);
    config.data_directory = j.value("data_directory", config.data_directory);
    config.verbose = j.value("verbose", config.verbose);

    config.default_context = j.value("default_context", config.default_context);
    config.conflict_confidence = j.value("conflict_confidence", config.conflict_confidence);

    config.history_capacity = j.value("history_capacity", config.history_capacity);
    config.history_retain = j.value("history_retain", config.history_retain);
    config.cycle_max_length = j.value("cycle_max_length", config.cycle_max_length);
    config.cycle_step_budget = j.value("cycle_step_budget", config.cycle_step_budget);
    config.cycle_time_budget_ms = j.value("cycle_time_budget_ms", config.cycle_time_budget_ms);

    config.max_suggestions = j.value("max_suggestions", config.max_suggestions);
    config.structural_hole_threshold =
        j.value("structural_hole_threshold", config.structural_hole_threshold);
    config.similarity_threshold = j.value("similarity_threshold", config.similarity_threshold);
    config.dreaming_similarity_threshold =
        j.value("dreaming_similarity_threshold", config.dreaming_similarity_threshold);
    config.path_completion_threshold =
        j.value("path_completion_threshold", config.path_completion_threshold);

    return config;
}

json EngineConfig::to_json() const {
    json j;

    j["operator_id"] = operator_id;
    j["data_directory"] = data_directory;
    j["verbose"] = verbose;

    j["default_context"] = default_context;
    j["conflict_confidence"] = conflict_confidence;

    j["history_capacity"] = history_capacity;
    j["history_retain"] = history_retain;
    j["cycle_max_length"] = cycle_max_length;
    j["cycle_step_budget"] = cycle_step_budget;
    j["cycle_time_budget_ms"] = cycle_time_budget_ms;

    j["max_suggestions"] = max_suggestions;
    j["structural_hole_threshold"] = structural_hole_threshold;
    j["similarity_threshold"] = similarity_threshold;
    j["dreaming_similarity_threshold"] = dreaming_similarity_threshold;
    j["path_completion_threshold"] = path_completion_threshold;

    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* op = std::getenv("SDB_OPERATOR");
    if (op) config.operator_id = op;

    const char* data_dir = std::getenv("SDB_DATA_DIR");
    if (data_dir) config.data_directory = data_dir;

    const char* verbose = std::getenv("SDB_VERBOSE");
    if (verbose) config.verbose = parse_bool_env(verbose);

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (operator_id.empty()) {
        error_message = "Operator id must not be empty";
        return false;
    }

    if (default_context.empty()) {
        error_message = "Default context must not be empty";
        return false;
    }

    if (!in_unit_interval(conflict_confidence) ||
        !in_unit_interval(structural_hole_threshold) ||
        !in_unit_interval(similarity_threshold) ||
        !in_unit_interval(dreaming_similarity_threshold) ||
        !in_unit_interval(path_completion_threshold)) {
        error_message = "Thresholds must be between 0.0 and 1.0";
        return false;
    }

    if (history_capacity <= 0 || history_retain <= 0 || history_retain > history_capacity) {
        error_message = "History retain must be positive and not exceed history capacity";
        return false;
    }

    if (cycle_max_length < 2 || cycle_step_budget <= 0 || cycle_time_budget_ms <= 0) {
        error_message = "Cycle search limits must be positive (max length at least 2)";
        return false;
    }

    if (max_suggestions < 0) {
        error_message = "Max suggestions must not be negative";
        return false;
    }

    return true;
}

ConsistencyConfig EngineConfig::consistency_config() const {
    ConsistencyConfig config;
    config.history_capacity = static_cast<size_t>(history_capacity);
    config.history_retain = static_cast<size_t>(history_retain);
    config.cycle_budget.max_cycle_length = static_cast<size_t>(cycle_max_length);
    config.cycle_budget.max_steps = static_cast<size_t>(cycle_step_budget);
    config.cycle_budget.time_budget = std::chrono::milliseconds(cycle_time_budget_ms);
    config.verbose = verbose;
    return config;
}

LinkPredictionConfig EngineConfig::link_prediction_config() const {
    LinkPredictionConfig config;
    config.max_suggestions = static_cast<size_t>(max_suggestions);
    config.structural_hole_threshold = structural_hole_threshold;
    config.similarity_threshold = similarity_threshold;
    config.dreaming_similarity_threshold = dreaming_similarity_threshold;
    config.path_completion_threshold = path_completion_threshold;
    config.verbose = verbose;
    return config;
}

} // namespace sdb
