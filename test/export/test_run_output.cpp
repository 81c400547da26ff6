#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/export/run_output.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace pbi_scan;
namespace fs = std::filesystem;

namespace {

// Fresh scratch directory removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    [[nodiscard]] std::string Path() const { return path_.string(); }

private:
    fs::path path_;
};

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<FlatTable> SampleTables() {
    FlatTable ws{kWorkspacesFamily, {"workspaceId", "workspaceName"}, {}};
    ws.rows.push_back({"w-1", "Sales"});
    FlatTable reports{kReportsFamily, {"reportId"}, {}};
    return {ws, reports};
}

} // anonymous namespace

TEST_CASE("ParseExportFormat", "[export][output]") {
    CHECK(ParseExportFormat("csv").Value() == ExportFormat::Csv);
    CHECK(ParseExportFormat("json").Value() == ExportFormat::Json);
    auto bad = ParseExportFormat("xlsx");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::Config);
}

TEST_CASE("RunTimestamp: YYYYMMDD_HHMMSS", "[export][output]") {
    auto ts = RunTimestamp();
    REQUIRE(ts.size() == 15);
    CHECK(ts[8] == '_');
}

TEST_CASE("RunOutput: creates the timestamped run directory", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_create");
    auto out = RunOutput::Create(tmp.Path() + "/nested", ExportFormat::Csv, "20240301_120000");
    REQUIRE(out.IsOk());
    CHECK(fs::is_directory(out.Value().Directory()));
    CHECK(fs::path(out.Value().Directory()).filename() == "scan_20240301_120000");
}

TEST_CASE("RunOutput: CSV tables skip empty families", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_csv");
    auto out = RunOutput::Create(tmp.Path(), ExportFormat::Csv, "20240301_120000").Value();

    auto written = out.WriteTables(SampleTables());
    REQUIRE(written.IsOk());
    REQUIRE(written.Value().size() == 1);
    CHECK(fs::path(written.Value()[0]).filename() == "Workspaces_20240301_120000.csv");
    CHECK(ReadFile(written.Value()[0]) == "workspaceId,workspaceName\r\nw-1,Sales\r\n");
    CHECK_FALSE(fs::exists(fs::path(out.Directory()) / "Reports_20240301_120000.csv"));
    CHECK_FALSE(fs::exists(written.Value()[0] + ".tmp"));
}

TEST_CASE("RunOutput: JSON tables", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_json");
    auto out = RunOutput::Create(tmp.Path(), ExportFormat::Json, "20240301_120000").Value();

    auto written = out.WriteTables(SampleTables());
    REQUIRE(written.IsOk());
    REQUIRE(written.Value().size() == 1);
    CHECK(fs::path(written.Value()[0]).extension() == ".json");
    auto j = nlohmann::json::parse(ReadFile(written.Value()[0]));
    CHECK(j[0]["workspaceName"] == "Sales");
}

TEST_CASE("RunOutput: merged document and statistics", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_docs");
    auto out = RunOutput::Create(tmp.Path(), ExportFormat::Csv, "20240301_120000").Value();

    auto merged = out.WriteMergedDocument({{"workspaces", nlohmann::json::array()}});
    REQUIRE(merged.IsOk());
    CHECK(fs::path(merged.Value()).filename() == "scan_result_20240301_120000.json");

    RunStatistics stats;
    stats.batches_total = 3;
    stats.batches_failed = 1;
    stats.AddError("Batch 2 (100 workspaces) failed");
    auto written = out.WriteStatistics(stats);
    REQUIRE(written.IsOk());
    auto j = nlohmann::json::parse(ReadFile(written.Value()));
    CHECK(j["batches"]["total"] == 3);
    CHECK(j["batches"]["failed"] == 1);
    CHECK(j["errors"].size() == 1);
}

TEST_CASE("RunOutput: base path that is a file is an Output error", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_blocked");
    fs::create_directories(tmp.Path());
    const auto blocker = tmp.Path() + "/blocker";
    std::ofstream(blocker) << "x";

    auto out = RunOutput::Create(blocker, ExportFormat::Csv, "20240301_120000");
    REQUIRE(out.IsErr());
    CHECK(out.Error().category == ErrorCategory::Output);
    CHECK(out.Error().ExitCode() == 6);
}

TEST_CASE("RunOutput: statistics with non-UTF-8 error text are still written",
          "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_latin1");
    auto out = RunOutput::Create(tmp.Path(), ExportFormat::Csv, "20240301_120000").Value();

    RunStatistics stats;
    stats.AddError("No workspace matches filter 'Caf\xe9*'");
    auto written = out.WriteStatistics(stats);
    REQUIRE(written.IsOk());
    CHECK_FALSE(fs::exists(written.Value() + ".tmp"));

    auto j = nlohmann::json::parse(ReadFile(written.Value()));
    REQUIRE(j["errors"].size() == 1);
    CHECK(j["errors"][0].get<std::string>().find("Caf\xEF\xBF\xBD*") != std::string::npos);
}

TEST_CASE("WriteFileAtomically: throwing writer leaves no temp file", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_throw");
    fs::create_directories(tmp.Path());
    const auto path = tmp.Path() + "/table.csv";

    CHECK_THROWS_AS(WriteFileAtomically(path,
                                        [](std::ostream& out) {
                                            out << "partial";
                                            throw std::runtime_error("writer failed");
                                        }),
                    std::runtime_error);
    CHECK_FALSE(fs::exists(path));
    CHECK_FALSE(fs::exists(path + ".tmp"));
}

TEST_CASE("WriteFileAtomically: unopenable path is an Output error", "[export][output]") {
    TempDir tmp("pbi_scan_test_run_output_noparent");
    auto written = WriteFileAtomically(tmp.Path() + "/missing/dir/file.csv",
                                       [](std::ostream& out) { out << "x"; });
    REQUIRE(written.IsErr());
    CHECK(written.Error().category == ErrorCategory::Output);
}
