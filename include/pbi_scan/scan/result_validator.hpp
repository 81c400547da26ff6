#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// ValidateScanResult: sanity checks on one fetched scan document.
//
// Returns human-readable issues; an empty list means nothing looked off.
// Never fails and never throws: issues are reported, not acted upon.
//
//   - requested workspace ids absent from the document (one issue listing
//     every missing id)
//   - workspaces returned with zero datasets (one issue with the count)
//   - when schema collection was requested, datasets with zero tables (one
//     issue with the count naming each "workspace/dataset" pair)
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> ValidateScanResult(
    const nlohmann::json& document,
    const std::vector<std::string>& expected_ids,
    bool schema_requested);

} // namespace pbi_scan
