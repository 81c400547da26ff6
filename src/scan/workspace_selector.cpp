#include <pbi_scan/scan/workspace_selector.hpp>

#include <pbi_scan/core/log.hpp>

#include <cctype>

namespace pbi_scan {

namespace {

bool EqualsIgnoreCase(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

Error NothingToScan(const std::string& message) {
    return Error{"SelectWorkspaces", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::NothingToScan};
}

} // anonymous namespace

bool WildcardMatch(std::string_view pattern, std::string_view text) {
    // Iterative matcher with single-star backtracking.
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t star_text = 0;

    while (t < text.size()) {
        if (p < pattern.size() &&
            (pattern[p] == '?' || (pattern[p] != '*' && EqualsIgnoreCase(pattern[p], text[t])))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_text = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++star_text;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

Result<std::vector<std::string>, Error> SelectWorkspaces(
    const std::vector<WorkspaceRef>& all,
    const std::optional<std::string>& name_filter,
    const WorkspacePicker& picker) {
    std::vector<WorkspaceRef> candidates;
    for (const auto& ws : all) {
        if (ws.state != "Active" || ws.type != "Workspace") {
            continue;
        }
        if (name_filter.has_value() && !WildcardMatch(*name_filter, ws.name)) {
            continue;
        }
        candidates.push_back(ws);
    }
    LogInfo("select", std::to_string(candidates.size()) + " of " +
                          std::to_string(all.size()) + " workspace(s) eligible" +
                          (name_filter ? " for filter '" + *name_filter + "'" : ""));

    if (candidates.empty()) {
        return Result<std::vector<std::string>, Error>::Err(NothingToScan(
            name_filter ? "No active workspace matches '" + *name_filter + "'"
                        : "No active workspaces to scan"));
    }

    std::vector<std::string> ids;
    std::vector<size_t> picked;
    if (picker) {
        picked = picker(candidates);
    }
    if (picked.empty()) {
        for (const auto& ws : candidates) {
            ids.push_back(ws.id);
        }
    } else {
        for (auto index : picked) {
            if (index < candidates.size()) {
                ids.push_back(candidates[index].id);
            }
        }
        if (ids.empty()) {
            return Result<std::vector<std::string>, Error>::Err(
                NothingToScan("No valid workspace picked"));
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(ids));
}

} // namespace pbi_scan
