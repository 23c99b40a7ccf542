#ifndef RQL_PARSER_HPP
#define RQL_PARSER_HPP

#include "core/time_util.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdb {

enum class QueryType {
    PHI,        // (Φ :intention ... :context ...)
    PATH,       // (QUERY :from A :to B)
    EXPLORE,    // (EXPLORE :entity X :depth 2)
    CONTEXT     // (CONTEXT :keyword k)
};

std::string query_type_to_string(QueryType type);

/**
 * @brief A parsed RQL expression
 */
struct RqlQuery {
    QueryType type = QueryType::PHI;
    std::string intention;
    std::string context;
    std::optional<std::string> source;
    std::optional<std::string> target;
    std::optional<std::string> entity;
    int max_length = 3;
    double min_coherence = 0.5;
    std::vector<std::string> blind_spots;
    std::vector<std::string> phi_meta;
    std::set<std::string> flags;                       // keys given without a value
    Timestamp timestamp;

    nlohmann::json to_json() const;
};

/**
 * @brief Parser for the parenthesized RQL grammar
 *
 *   (<KEYWORD> :<key> <value> :<key> <value> ...)
 *
 * Values are bare tokens or quoted with ' or " (no escapes). A key that is
 * followed by another key or by the end of the expression is a flag.
 */
class RqlParser {
public:
    /**
     * @brief Parse one expression
     * @throws ValidationError on malformed input or non-numeric numbers
     * @throws MissingParameterError when a required key is absent
     * @throws UnknownQueryTypeError for an unrecognized keyword
     */
    RqlQuery parse(const std::string& text) const;

    /**
     * @brief Split on whitespace outside quotes; quoted tokens keep their quotes
     */
    static std::vector<std::string> tokenize(const std::string& text);

private:
    struct Params {
        std::map<std::string, std::string> values;
        std::set<std::string> flags;

        std::optional<std::string> get(const std::string& key) const;

        // First of an English key and its Russian alias
        std::optional<std::string> get(const std::string& key, const std::string& alias) const;
    };

    static Params collect_params(const std::vector<std::string>& tokens);
    static int parse_int(const std::string& key, const std::string& value);
    static double parse_double(const std::string& key, const std::string& value);
    static std::vector<std::string> split_list(const std::string& value);
};

} // namespace sdb

#endif // RQL_PARSER_HPP
