#include <pbi_scan/cli/output_formatter.hpp>
#include <pbi_scan/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace pbi_scan {

namespace {

using namespace pbi_scan::ansi;

std::vector<std::vector<std::string>> SummaryRows(const RunStatistics& stats) {
    return {
        {"Workspaces enumerated", std::to_string(stats.workspaces_enumerated)},
        {"Workspaces selected", std::to_string(stats.workspaces_selected)},
        {"Batches succeeded", std::to_string(stats.batches_succeeded) + "/" +
                                  std::to_string(stats.batches_total)},
        {"Batches failed", std::to_string(stats.batches_failed)},
        {"Workspaces", std::to_string(stats.workspaces)},
        {"Datasets", std::to_string(stats.datasets)},
        {"Datasets with schema", std::to_string(stats.datasets_with_schema)},
        {"Tables", std::to_string(stats.tables)},
        {"Columns", std::to_string(stats.columns)},
        {"Measures", std::to_string(stats.measures)},
        {"Refresh history hits", std::to_string(stats.refresh_history_hits)},
    };
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto records = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json record = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                record[headers[c]] = row[c];
            }
            records.push_back(std::move(record));
        }
        out_ << records.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintRunSummary(const RunStatistics& stats,
                                      const std::string& output_directory,
                                      const std::vector<std::string>& files) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = stats.errors.empty();
        j["outputDirectory"] = output_directory;
        j["files"] = files;
        j["statistics"] = stats.ToJson();
        out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    PrintTable({"Metric", "Value"}, SummaryRows(stats));

    if (!output_directory.empty()) {
        out_ << (color_mode_ ? kBold : "") << "Output: " << (color_mode_ ? kReset : "")
             << output_directory << " (" << files.size() << " file(s))\n";
    }
    if (stats.errors.empty()) {
        if (color_mode_) {
            out_ << kGreen << "OK" << kReset << " run completed without errors\n";
        } else {
            out_ << "Run completed without errors\n";
        }
        return;
    }

    out_ << (color_mode_ ? kYellow : "") << stats.errors.size() << " error(s):"
         << (color_mode_ ? kReset : "") << "\n";
    for (const auto& e : stats.errors) {
        out_ << "  - " << e << "\n";
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.endpoint.empty()) {
            err_ << "  " << kDim << "Endpoint: " << kReset << error.endpoint << "\n";
        }
        if (error.service_error.has_value() && !error.service_error->empty()) {
            err_ << "  " << kDim << "Service: " << kReset
                 << error.service_error.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.endpoint.empty()) {
        err_ << "  Endpoint: " << error.endpoint << "\n";
    }
    if (error.service_error.has_value() && !error.service_error->empty()) {
        err_ << "  Service: " << error.service_error.value() << "\n";
    }
}

} // namespace pbi_scan
