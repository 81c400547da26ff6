#pragma once

#include <pbi_scan/core/result.hpp>
#include <pbi_scan/scan/run_statistics.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for the CLI.
//
// Constructor takes booleans for json mode and color mode, plus optional
// ostream references. When color_mode is true and json_mode is false, uses
// FTXUI tables and ANSI escape codes for richer terminal output.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Print a table with headers and rows. JSON mode prints an array of
    // objects; color mode renders an FTXUI table.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // End-of-run summary: counters, written files and the error list.
    void PrintRunSummary(const RunStatistics& stats,
                         const std::string& output_directory,
                         const std::vector<std::string>& files) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace pbi_scan
