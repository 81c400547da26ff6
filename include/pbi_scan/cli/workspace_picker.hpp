#pragma once

#include <pbi_scan/api/workspaces.hpp>

#include <vector>

namespace pbi_scan {

// Interactive FTXUI checkbox list over the candidate workspaces.
// Returns the indices that were checked; nothing checked means "all shown".
// Requires a terminal on stdin.
std::vector<size_t> RunWorkspacePicker(const std::vector<WorkspaceRef>& candidates);

} // namespace pbi_scan
