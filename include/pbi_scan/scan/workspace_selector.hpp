#pragma once

#include <pbi_scan/api/workspaces.hpp>
#include <pbi_scan/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pbi_scan {

/// Glob match: '*' matches any run of characters, '?' exactly one.
/// ASCII case-insensitive; the whole text must match.
[[nodiscard]] bool WildcardMatch(std::string_view pattern, std::string_view text);

/// Interactive multi-select over the candidates. Returns the indices the
/// operator picked; an empty pick means "all shown".
using WorkspacePicker =
    std::function<std::vector<size_t>(const std::vector<WorkspaceRef>& candidates)>;

// ---------------------------------------------------------------------------
// SelectWorkspaces: narrow the enumerated workspaces to scan targets.
//
// Keeps state == "Active" and type == "Workspace", then applies the name
// filter if one is given, then the picker if one is given. Returns the ids
// in enumeration order. An empty result is an Err with category
// NothingToScan.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<std::string>, Error> SelectWorkspaces(
    const std::vector<WorkspaceRef>& all,
    const std::optional<std::string>& name_filter,
    const WorkspacePicker& picker = nullptr);

} // namespace pbi_scan
