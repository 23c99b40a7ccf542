#pragma once

#include <stdexcept>
#include <string>

namespace sdb {

/**
 * @brief Base class for every recoverable error raised by the graph core
 */
class SemanticDBError : public std::runtime_error {
public:
    explicit SemanticDBError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed node/edge input or query parameters
 */
class ValidationError : public SemanticDBError {
public:
    explicit ValidationError(const std::string& message)
        : SemanticDBError("Validation failed: " + message) {}
};

/**
 * @brief A required query field is absent
 */
class MissingParameterError : public ValidationError {
public:
    MissingParameterError(const std::string& query_type, const std::string& parameter)
        : ValidationError(query_type + " requires :" + parameter),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

/**
 * @brief Merge attempted across differing source/target/type
 */
class IncompatibleMergeError : public SemanticDBError {
public:
    explicit IncompatibleMergeError(const std::string& message)
        : SemanticDBError("Incompatible merge: " + message) {}
};

class UnknownQueryTypeError : public SemanticDBError {
public:
    explicit UnknownQueryTypeError(const std::string& keyword)
        : SemanticDBError("Unknown RQL query type: " + keyword) {}
};

class UnknownGestureError : public SemanticDBError {
public:
    explicit UnknownGestureError(const std::string& gesture)
        : SemanticDBError("Unknown gesture: " + gesture +
                          " (expected one of Α, Λ, Σ, Ω, ∇, Φ)") {}
};

/**
 * @brief Accepting a record that was not produced by link prediction
 */
class InvalidAcceptanceError : public SemanticDBError {
public:
    explicit InvalidAcceptanceError(const std::string& weight_id)
        : SemanticDBError("Only suggested records can be accepted: " + weight_id) {}
};

} // namespace sdb
