#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace sdb {

// ============================================================================
// Document Mirror Interface
// ============================================================================

/**
 * @brief Secondary store holding whole export documents
 *
 * Implementations surface their failures verbatim.
 */
class DocumentMirror {
public:
    virtual ~DocumentMirror() = default;

    virtual void write(const nlohmann::json& document, const std::string& path) = 0;
    virtual nlohmann::json read(const std::string& path) const = 0;

    /**
     * @brief Backend name for logs
     */
    virtual std::string get_name() const = 0;
};

/**
 * @brief Mirror writing pretty-printed JSON files
 */
class JsonFileMirror : public DocumentMirror {
public:
    explicit JsonFileMirror(int indent = 2) : indent_(indent) {}

    void write(const nlohmann::json& document, const std::string& path) override;
    nlohmann::json read(const std::string& path) const override;
    std::string get_name() const override { return "json-file"; }

private:
    int indent_;
};

} // namespace sdb
