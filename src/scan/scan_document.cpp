#include <pbi_scan/scan/scan_document.hpp>

namespace pbi_scan {

nlohmann::json Field(const nlohmann::json& node, const char* key) {
    if (!node.is_object()) {
        return nullptr;
    }
    auto it = node.find(key);
    if (it == node.end()) {
        return nullptr;
    }
    return *it;
}

const nlohmann::json& Children(const nlohmann::json& node, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (!node.is_object()) {
        return kEmpty;
    }
    auto it = node.find(key);
    if (it == node.end() || !it->is_array()) {
        return kEmpty;
    }
    return *it;
}

std::string StringOr(const nlohmann::json& node, const char* key,
                     const std::string& fallback) {
    if (!node.is_object()) {
        return fallback;
    }
    auto it = node.find(key);
    if (it == node.end()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    return fallback;
}

} // namespace pbi_scan
