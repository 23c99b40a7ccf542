#include "query/query_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace sdb {

namespace {

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

// ASCII letters, digits, '_' and any UTF-8 byte
bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

size_t utf8_length(const std::string& s) {
    return std::count_if(s.begin(), s.end(),
                         [](unsigned char c) { return (c & 0xC0) != 0x80; });
}

const std::set<std::string>& stop_words() {
    static const std::set<std::string> words = {
        "about", "also", "been", "does", "from", "have", "into", "just", "more",
        "should", "some", "than", "that", "their", "them", "then", "there",
        "these", "they", "this", "those", "very", "what", "when", "where",
        "which", "while", "with", "would", "could", "your"
    };
    return words;
}

} // namespace

// ==========================================
// Result serialization
// ==========================================

nlohmann::json PhiResult::to_json() const {
    nlohmann::json j;
    j["type"] = "phi_resonance";
    j["intention"] = intention;
    j["context"] = context;
    j["keywords"] = keywords;
    j["relevant_entities"] = relevant_entities;
    j["blind_spots"] = blind_spots;
    j["insight"] = insight;
    j["coherence_at_query"] = coherence_at_query;
    return j;
}

nlohmann::json PathMatch::to_json() const {
    return {
        {"path", nodes},
        {"record_ids", record_ids},
        {"mean_confidence", mean_confidence}
    };
}

nlohmann::json PathResult::to_json() const {
    nlohmann::json j;
    j["type"] = "semantic_path";
    j["source"] = source;
    j["target"] = target;
    j["paths_found"] = paths_found;

    nlohmann::json paths_json = nlohmann::json::array();
    for (const auto& path : paths) {
        paths_json.push_back(path.to_json());
    }
    j["paths"] = paths_json;
    j["coherence_threshold"] = coherence_threshold;
    return j;
}

nlohmann::json ExploreResult::to_json() const {
    nlohmann::json j;
    j["type"] = "exploration";
    j["entity"] = entity;
    j["found"] = found;
    if (!found) {
        j["error"] = message;
        return j;
    }
    j["neighbors"] = neighbors;
    j["neighbor_count"] = neighbors.size();
    j["depth"] = depth;
    return j;
}

nlohmann::json ContextMatch::to_json() const {
    if (is_entity) {
        return {{"type", "entity"}, {"name", name}};
    }
    return {
        {"type", "relation"},
        {"source", source},
        {"target", target},
        {"meaning", meaning}
    };
}

nlohmann::json ContextResult::to_json() const {
    nlohmann::json j;
    j["type"] = "context_search";
    j["keyword"] = keyword;

    nlohmann::json matches_json = nlohmann::json::array();
    for (const auto& match : matches) {
        matches_json.push_back(match.to_json());
    }
    j["matches"] = matches_json;
    j["match_count"] = match_count;
    return j;
}

// ==========================================
// QueryEngine Implementation
// ==========================================

QueryEngine::QueryEngine(const GraphStore& graph, ConsistencyEngine& coherence)
    : graph_(graph), coherence_(coherence) {}

nlohmann::json QueryEngine::run(const std::string& text) {
    return execute(parse(text));
}

nlohmann::json QueryEngine::execute(const RqlQuery& query) {
    switch (query.type) {
        case QueryType::PHI: return execute_phi(query).to_json();
        case QueryType::PATH: return execute_path(query).to_json();
        case QueryType::EXPLORE: return execute_explore(query).to_json();
        case QueryType::CONTEXT: return execute_context(query).to_json();
        default: throw UnknownQueryTypeError(query_type_to_string(query.type));
    }
}

PhiResult QueryEngine::execute_phi(const RqlQuery& query) {
    PhiResult result;
    result.intention = query.intention;
    result.context = query.context;
    result.blind_spots = query.blind_spots;
    result.keywords = extract_keywords(query.intention);

    for (const auto& id : graph_.node_ids()) {
        std::string lowered = to_lower_ascii(id);
        bool matches = std::any_of(result.keywords.begin(), result.keywords.end(),
                                   [&lowered](const std::string& kw) {
                                       return lowered.find(kw) != std::string::npos;
                                   });
        if (matches) {
            result.relevant_entities.push_back(id);
        }
    }

    result.insight = "Φ-resonance: intention '" + query.intention + "' activates " +
                     std::to_string(result.relevant_entities.size()) + " entities.";
    if (!result.relevant_entities.empty()) {
        result.insight += " Closest: ";
        size_t shown = std::min<size_t>(3, result.relevant_entities.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) result.insight += ", ";
            result.insight += result.relevant_entities[i];
        }
        result.insight += ".";
    }

    result.coherence_at_query = coherence_.calculate_global_coherence().global;
    return result;
}

PathResult QueryEngine::execute_path(const RqlQuery& query) const {
    if (!query.source || !query.target) {
        throw MissingParameterError("QUERY", !query.source ? "from" : "to");
    }

    PathResult result;
    result.source = *query.source;
    result.target = *query.target;
    result.coherence_threshold = query.min_coherence;

    for (const auto& nodes : graph_.find_paths(result.source, result.target, query.max_length)) {
        PathMatch match;
        match.nodes = nodes;

        double total = 0.0;
        for (size_t i = 0; i + 1 < nodes.size(); ++i) {
            std::string record_id;
            total += hop_confidence(nodes[i], nodes[i + 1], record_id);
            match.record_ids.push_back(record_id);
        }
        size_t hops = nodes.size() - 1;
        match.mean_confidence = hops > 0 ? total / static_cast<double>(hops) : 0.0;

        if (match.mean_confidence >= query.min_coherence) {
            result.paths_found++;
            if (result.paths.size() < MAX_PATHS) {
                result.paths.push_back(std::move(match));
            }
        }
    }

    return result;
}

ExploreResult QueryEngine::execute_explore(const RqlQuery& query) const {
    if (!query.entity) {
        throw MissingParameterError("EXPLORE", "entity");
    }

    ExploreResult result;
    result.entity = *query.entity;
    result.depth = query.max_length;

    if (!graph_.has_node(result.entity)) {
        result.found = false;
        result.message = "Entity '" + result.entity + "' not found";
        return result;
    }
    result.found = true;

    auto direct = graph_.successors(result.entity);
    result.neighbors.insert(direct.begin(), direct.end());

    if (query.max_length > 1) {
        for (const auto& n : direct) {
            for (const auto& nn : graph_.successors(n)) {
                if (nn != result.entity) {
                    result.neighbors.insert(nn);
                }
            }
        }
    }

    return result;
}

ContextResult QueryEngine::execute_context(const RqlQuery& query) const {
    ContextResult result;
    result.keyword = query.context;

    std::vector<ContextMatch> all;
    for (const auto& id : graph_.node_ids()) {
        if (contains_ci(id, query.context)) {
            ContextMatch match;
            match.is_entity = true;
            match.name = id;
            all.push_back(match);
        }
    }

    for (const auto* record : graph_.all_edges()) {
        if (contains_ci(record->meaning, query.context)) {
            ContextMatch match;
            match.is_entity = false;
            match.source = record->source;
            match.target = record->target;
            match.meaning = record->meaning;
            all.push_back(match);
        }
    }

    result.match_count = all.size();
    if (all.size() > MAX_CONTEXT_MATCHES) {
        all.resize(MAX_CONTEXT_MATCHES);
    }
    result.matches = std::move(all);
    return result;
}

std::vector<std::string> QueryEngine::extract_keywords(const std::string& text) {
    std::vector<std::string> keywords;
    std::string lowered = to_lower_ascii(text);

    auto flush = [&keywords](std::string& word) {
        if (utf8_length(word) > 3 &&
            stop_words().count(word) == 0 &&
            std::find(keywords.begin(), keywords.end(), word) == keywords.end() &&
            keywords.size() < MAX_KEYWORDS) {
            keywords.push_back(word);
        }
        word.clear();
    };

    std::string word;
    for (char c : lowered) {
        if (is_word_byte(static_cast<unsigned char>(c))) {
            word += c;
        } else if (!word.empty()) {
            flush(word);
        }
    }
    if (!word.empty()) {
        flush(word);
    }

    return keywords;
}

double QueryEngine::hop_confidence(const std::string& from, const std::string& to,
                                   std::string& record_id) const {
    auto records = graph_.edges_between(from, to);
    if (records.empty()) {
        record_id.clear();
        return 0.7;
    }
    record_id = records.front()->weight_id;
    return records.front()->confidence;
}

} // namespace sdb
