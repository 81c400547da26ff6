#pragma once

#include <pbi_scan/export/refresh_history.hpp>
#include <pbi_scan/scan/run_statistics.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// FlatTable: one exported entity family. Every row has columns.size()
// cells; a cell is a JSON scalar or null.
// ---------------------------------------------------------------------------
struct FlatTable {
    std::string name;
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    [[nodiscard]] bool Empty() const noexcept { return rows.empty(); }

    /// Index of a column, or columns.size() if there is none by that name.
    [[nodiscard]] size_t ColumnIndex(const std::string& column) const;
};

// Family names, in export order.
inline constexpr const char* kWorkspacesFamily = "Workspaces";
inline constexpr const char* kReportsFamily = "Reports";
inline constexpr const char* kDatasetsFamily = "Datasets";
inline constexpr const char* kTablesFamily = "Tables";
inline constexpr const char* kColumnsFamily = "Columns";
inline constexpr const char* kMeasuresFamily = "Measures";
inline constexpr const char* kDatasourcesFamily = "Datasources";
inline constexpr const char* kLineageFamily = "Lineage";
inline constexpr const char* kRefreshHistoryFamily = "RefreshHistory";

struct FlattenOptions {
    // Query refresh history per dataset (summary top 1, detail top N).
    bool refresh_history = false;
    int refresh_summary_top = 1;
    int refresh_detail_top = 5;
};

// ---------------------------------------------------------------------------
// Flattener: walk a merged scan document and emit one FlatTable per family.
//
// Parent keys (workspace id and name, dataset id and name, table name) are
// carried down to every child record. Absent or null collections at any
// level are skipped; absent fields become null cells. Nothing in the
// document can make flattening fail.
//
// With refresh history enabled, each dataset gets two lookups through the
// IRefreshHistorySource: top 1 for the summary columns on the Datasets row
// and top N for the RefreshHistory family. Counters in RunStatistics are
// updated as records are produced.
// ---------------------------------------------------------------------------
class Flattener {
public:
    Flattener(FlattenOptions options, IRefreshHistorySource* refresh_source);

    /// All nine families in export order; some may be empty.
    [[nodiscard]] std::vector<FlatTable> Flatten(const nlohmann::json& merged,
                                                 RunStatistics& stats);

private:
    FlattenOptions options_;
    IRefreshHistorySource* refresh_source_;
};

} // namespace pbi_scan
