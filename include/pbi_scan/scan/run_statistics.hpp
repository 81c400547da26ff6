#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// RunStatistics: counters and the ordered error list for one run.
//
// Passed by reference through the pipeline; each stage updates the fields it
// owns. Serialized once at the end, even when every batch failed.
// ---------------------------------------------------------------------------
struct RunStatistics {
    std::string started_at;      // ISO 8601 UTC
    std::string finished_at;

    int workspaces_enumerated = 0;
    int workspaces_selected = 0;
    int batches_total = 0;
    int batches_succeeded = 0;
    int batches_failed = 0;

    int workspaces = 0;          // in the merged document
    int datasets = 0;
    int datasets_with_schema = 0;
    int tables = 0;
    int columns = 0;
    int measures = 0;
    int refresh_history_hits = 0;

    std::vector<std::string> errors;

    void AddError(std::string message) { errors.push_back(std::move(message)); }

    [[nodiscard]] nlohmann::json ToJson() const;
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string UtcNowIso8601();

} // namespace pbi_scan
