#include <pbi_scan/export/run_output.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/export/csv_writer.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace pbi_scan {

namespace fs = std::filesystem;

namespace {

Error MakeOutputError(const std::string& operation, const std::string& path,
                      const std::string& message) {
    return Error{operation, path, std::nullopt, message, std::nullopt,
                 ErrorCategory::Output};
}

// Invalid UTF-8 (user input echoed into messages) becomes U+FFFD instead of throwing.
std::string DumpPretty(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

Result<void, Error> WriteFileAtomically(const std::string& path,
                                        const std::function<void(std::ostream&)>& write) {
    const auto tmp = path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return Result<void, Error>::Err(
                MakeOutputError("WriteFile", tmp, "Failed to open file for writing"));
        }
        try {
            write(ofs);
        } catch (...) {
            // No partial .tmp survives a throwing writer.
            ofs.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw;
        }
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return Result<void, Error>::Err(
                MakeOutputError("WriteFile", tmp, "Write failed"));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void, Error>::Err(
            MakeOutputError("WriteFile", path, "Rename failed: " + ec.message()));
    }
    return Result<void, Error>::Ok();
}

Result<ExportFormat, Error> ParseExportFormat(const std::string& text) {
    if (text == "csv") return Result<ExportFormat, Error>::Ok(ExportFormat::Csv);
    if (text == "json") return Result<ExportFormat, Error>::Ok(ExportFormat::Json);
    return Result<ExportFormat, Error>::Err(Error{
        "ParseExportFormat", "", std::nullopt,
        "Unknown output format '" + text + "' (expected csv or json)", std::nullopt,
        ErrorCategory::Config});
}

std::string RunTimestamp() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

Result<RunOutput, Error> RunOutput::Create(const std::string& base_directory,
                                           ExportFormat format,
                                           const std::string& timestamp) {
    const auto base = base_directory.empty() ? fs::path(".") : fs::path(base_directory);
    const auto dir = base / ("scan_" + timestamp);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<RunOutput, Error>::Err(MakeOutputError(
            "CreateOutputDirectory", dir.string(), ec.message()));
    }
    LogInfo("export", "Output directory: " + dir.string());
    return Result<RunOutput, Error>::Ok(RunOutput(dir.string(), format, timestamp));
}

std::string RunOutput::PathFor(const std::string& stem, const char* extension) const {
    return (fs::path(directory_) / (stem + "_" + timestamp_ + extension)).string();
}

Result<std::string, Error> RunOutput::WriteMergedDocument(const nlohmann::json& merged) const {
    const auto path = PathFor("scan_result", ".json");
    auto written =
        WriteFileAtomically(path, [&](std::ostream& out) { out << DumpPretty(merged); });
    if (written.IsErr()) {
        return Result<std::string, Error>::Err(std::move(written).Error());
    }
    return Result<std::string, Error>::Ok(path);
}

Result<std::vector<std::string>, Error> RunOutput::WriteTables(
    const std::vector<FlatTable>& tables) const {
    std::vector<std::string> paths;
    for (const auto& table : tables) {
        if (table.Empty()) {
            LogDebug("export", table.name + ": no records, skipped");
            continue;
        }

        std::string path;
        Result<void, Error> written = Result<void, Error>::Ok();
        if (format_ == ExportFormat::Csv) {
            path = PathFor(table.name, ".csv");
            written = WriteFileAtomically(path, [&](std::ostream& out) { WriteCsv(out, table); });
        } else {
            path = PathFor(table.name, ".json");
            written = WriteFileAtomically(path, [&](std::ostream& out) {
                out << DumpPretty(TableToJson(table));
            });
        }
        if (written.IsErr()) {
            return Result<std::vector<std::string>, Error>::Err(std::move(written).Error());
        }
        LogInfo("export", "Wrote " + std::to_string(table.rows.size()) + " " +
                              table.name + " record(s) to " + path);
        paths.push_back(std::move(path));
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(paths));
}

Result<std::string, Error> RunOutput::WriteStatistics(const RunStatistics& stats) const {
    const auto path = PathFor("statistics", ".json");
    auto written = WriteFileAtomically(path, [&](std::ostream& out) {
        out << DumpPretty(stats.ToJson()) << '\n';
    });
    if (written.IsErr()) {
        return Result<std::string, Error>::Err(std::move(written).Error());
    }
    return Result<std::string, Error>::Ok(path);
}

} // namespace pbi_scan
