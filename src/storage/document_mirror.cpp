#include "storage/document_mirror.hpp"
#include <fstream>
#include <stdexcept>

namespace sdb {

void JsonFileMirror::write(const nlohmann::json& document, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << document.dump(indent_);
}

nlohmann::json JsonFileMirror::read(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    nlohmann::json document;
    file >> document;
    return document;
}

} // namespace sdb
