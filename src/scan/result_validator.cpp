#include <pbi_scan/scan/result_validator.hpp>

#include <pbi_scan/scan/scan_document.hpp>

#include <unordered_set>

namespace pbi_scan {

namespace {

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

std::string DisplayName(const nlohmann::json& node) {
    auto name = StringOr(node, "name");
    return name.empty() ? StringOr(node, "id", "<unnamed>") : name;
}

} // anonymous namespace

std::vector<std::string> ValidateScanResult(const nlohmann::json& document,
                                            const std::vector<std::string>& expected_ids,
                                            bool schema_requested) {
    std::vector<std::string> issues;
    const auto& workspaces = Children(document, "workspaces");

    std::unordered_set<std::string> returned;
    for (const auto& ws : workspaces) {
        returned.insert(WorkspaceIdOf(ws));
    }

    std::vector<std::string> missing;
    for (const auto& id : expected_ids) {
        if (returned.count(id) == 0) {
            missing.push_back(id);
        }
    }
    if (!missing.empty()) {
        issues.push_back(std::to_string(missing.size()) + " of " +
                         std::to_string(expected_ids.size()) +
                         " requested workspace(s) missing from scan result: " +
                         Join(missing));
    }

    int without_datasets = 0;
    std::vector<std::string> without_schema;
    for (const auto& ws : workspaces) {
        const auto& datasets = Children(ws, "datasets");
        if (datasets.empty()) {
            ++without_datasets;
            continue;
        }
        if (!schema_requested) {
            continue;
        }
        for (const auto& ds : datasets) {
            if (Children(ds, "tables").empty()) {
                without_schema.push_back(DisplayName(ws) + "/" + DisplayName(ds));
            }
        }
    }

    if (without_datasets > 0) {
        issues.push_back(std::to_string(without_datasets) +
                         " workspace(s) returned with no datasets");
    }
    if (!without_schema.empty()) {
        issues.push_back(std::to_string(without_schema.size()) +
                         " dataset(s) returned without schema (no tables): " +
                         Join(without_schema));
    }
    return issues;
}

} // namespace pbi_scan
