#include "query/rql_parser.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sdb {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_upper_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool is_quoted(const std::string& token) {
    return token.size() >= 2 &&
           (token.front() == '"' || token.front() == '\'') &&
           token.back() == token.front();
}

std::string unquote(const std::string& token) {
    return is_quoted(token) ? token.substr(1, token.size() - 2) : token;
}

} // namespace

std::string query_type_to_string(QueryType type) {
    switch (type) {
        case QueryType::PHI: return "phi";
        case QueryType::PATH: return "path";
        case QueryType::EXPLORE: return "explore";
        case QueryType::CONTEXT: return "context";
        default: return "unknown";
    }
}

nlohmann::json RqlQuery::to_json() const {
    nlohmann::json j;
    j["query_type"] = query_type_to_string(type);
    j["intention"] = intention;
    j["context"] = context;
    j["source"] = source ? nlohmann::json(*source) : nlohmann::json(nullptr);
    j["target"] = target ? nlohmann::json(*target) : nlohmann::json(nullptr);
    j["entity"] = entity ? nlohmann::json(*entity) : nlohmann::json(nullptr);
    j["max_length"] = max_length;
    j["min_coherence"] = min_coherence;
    j["blind_spots"] = blind_spots;
    j["phi_meta"] = phi_meta;
    j["flags"] = flags;
    j["timestamp"] = to_iso8601(timestamp);
    return j;
}

// ==========================================
// RqlParser Implementation
// ==========================================

RqlQuery RqlParser::parse(const std::string& text) const {
    std::string expr = trim(text);
    if (expr.size() < 2 || expr.front() != '(' || expr.back() != ')') {
        throw ValidationError("RQL query must be wrapped in parentheses: (QUERY ...)");
    }

    auto tokens = tokenize(expr.substr(1, expr.size() - 2));
    if (tokens.empty()) {
        throw ValidationError("empty RQL query");
    }

    std::string keyword = tokens.front();
    Params params = collect_params(tokens);

    RqlQuery query;
    query.timestamp = Clock::now();
    query.flags = params.flags;

    std::string upper = to_upper_ascii(keyword);
    if (keyword == "Φ" || upper == "PHI") {
        query.type = QueryType::PHI;
        query.intention = params.get("intention", "намерение").value_or("");
        query.context = params.get("context", "контекст").value_or("");
        if (auto spots = params.get("blind_spots", "слепые_пятна")) {
            query.blind_spots = split_list(*spots);
        }
        if (auto meta = params.get("phi_meta")) {
            query.phi_meta = split_list(*meta);
        }
    } else if (upper == "QUERY") {
        query.type = QueryType::PATH;
        query.source = params.get("from");
        query.target = params.get("to");
        if (!query.source || query.source->empty()) {
            throw MissingParameterError("QUERY", "from");
        }
        if (!query.target || query.target->empty()) {
            throw MissingParameterError("QUERY", "to");
        }
        query.max_length = 3;
    } else if (upper == "EXPLORE") {
        query.type = QueryType::EXPLORE;
        query.entity = params.get("entity");
        if (!query.entity || query.entity->empty()) {
            throw MissingParameterError("EXPLORE", "entity");
        }
        query.max_length = 2;
    } else if (upper == "CONTEXT") {
        query.type = QueryType::CONTEXT;
        query.context = params.get("keyword").value_or(params.get("context", "контекст").value_or(""));
    } else {
        throw UnknownQueryTypeError(keyword);
    }

    if (auto value = params.get("max_length")) {
        query.max_length = parse_int("max_length", *value);
    }
    if (auto value = params.get("depth")) {
        query.max_length = parse_int("depth", *value);
    }
    if (auto value = params.get("min_coherence")) {
        query.min_coherence = parse_double("min_coherence", *value);
    }

    return query;
}

std::vector<std::string> RqlParser::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    char quote = 0;

    for (char c : text) {
        if (quote == 0 && (c == '"' || c == '\'')) {
            quote = c;
            current += c;
        } else if (quote != 0 && c == quote) {
            quote = 0;
            current += c;
            tokens.push_back(current);
            current.clear();
        } else if (quote == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (quote != 0) {
        throw ValidationError("unterminated quote in RQL query");
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::optional<std::string> RqlParser::Params::get(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> RqlParser::Params::get(const std::string& key,
                                                 const std::string& alias) const {
    auto value = get(key);
    return value ? value : get(alias);
}

RqlParser::Params RqlParser::collect_params(const std::vector<std::string>& tokens) {
    Params params;

    size_t i = 1;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (token.size() < 2 || token.front() != ':') {
            // Stray values are ignored
            ++i;
            continue;
        }

        std::string key = token.substr(1);
        bool has_value = i + 1 < tokens.size() && tokens[i + 1].front() != ':';
        if (has_value) {
            params.values[key] = unquote(tokens[i + 1]);
            params.flags.erase(key);
            i += 2;
        } else {
            params.flags.insert(key);
            params.values.erase(key);
            i += 1;
        }
    }

    return params;
}

int RqlParser::parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ValidationError(":" + key + " expects an integer, got '" + value + "'");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ValidationError(":" + key + " expects an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError(":" + key + " is out of range: " + value);
    }
}

double RqlParser::parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ValidationError(":" + key + " expects a number, got '" + value + "'");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ValidationError(":" + key + " expects a number, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError(":" + key + " is out of range: " + value);
    }
}

std::vector<std::string> RqlParser::split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace sdb
