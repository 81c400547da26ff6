#pragma once

#include <pbi_scan/core/result.hpp>
#include <pbi_scan/export/flattener.hpp>
#include <pbi_scan/scan/run_statistics.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace pbi_scan {

enum class ExportFormat {
    Csv,
    Json,
};

/// "csv" or "json" (case-sensitive); anything else is an Err.
[[nodiscard]] Result<ExportFormat, Error> ParseExportFormat(const std::string& text);

/// Write `path` through "<path>.tmp" and rename it into place. The temp file
/// is removed on every failure, including a writer that throws (the
/// exception is rethrown).
[[nodiscard]] Result<void, Error> WriteFileAtomically(
    const std::string& path, const std::function<void(std::ostream&)>& write);

/// Local time as "YYYYMMDD_HHMMSS", used for the run directory and file names.
[[nodiscard]] std::string RunTimestamp();

// ---------------------------------------------------------------------------
// RunOutput: the per-run output directory.
//
//   <base>/scan_<ts>/
//       scan_result_<ts>.json      merged scan document
//       <Family>_<ts>.csv|.json    one per non-empty family
//       statistics_<ts>.json       RunStatistics
//
// Every file is written to "<name>.tmp" and renamed into place, so a failed
// write never leaves a half-written table behind.
// ---------------------------------------------------------------------------
class RunOutput {
public:
    /// Create <base>/scan_<timestamp> (and any missing parents).
    [[nodiscard]] static Result<RunOutput, Error> Create(const std::string& base_directory,
                                                         ExportFormat format,
                                                         const std::string& timestamp);

    [[nodiscard]] const std::string& Directory() const noexcept { return directory_; }

    [[nodiscard]] Result<std::string, Error> WriteMergedDocument(const nlohmann::json& merged) const;

    /// Writes each non-empty table; returns the paths written, in order.
    [[nodiscard]] Result<std::vector<std::string>, Error> WriteTables(
        const std::vector<FlatTable>& tables) const;

    [[nodiscard]] Result<std::string, Error> WriteStatistics(const RunStatistics& stats) const;

private:
    RunOutput(std::string directory, ExportFormat format, std::string timestamp)
        : directory_(std::move(directory)), format_(format),
          timestamp_(std::move(timestamp)) {}

    std::string PathFor(const std::string& stem, const char* extension) const;

    std::string directory_;
    ExportFormat format_;
    std::string timestamp_;
};

} // namespace pbi_scan
