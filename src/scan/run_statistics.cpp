#include <pbi_scan/scan/run_statistics.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pbi_scan {

std::string UtcNowIso8601() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json RunStatistics::ToJson() const {
    nlohmann::json j;
    j["startedAt"] = started_at;
    j["finishedAt"] = finished_at;
    j["workspacesEnumerated"] = workspaces_enumerated;
    j["workspacesSelected"] = workspaces_selected;
    j["batches"] = {
        {"total", batches_total},
        {"succeeded", batches_succeeded},
        {"failed", batches_failed},
    };
    j["workspaces"] = workspaces;
    j["datasets"] = datasets;
    j["datasetsWithSchema"] = datasets_with_schema;
    j["tables"] = tables;
    j["columns"] = columns;
    j["measures"] = measures;
    j["refreshHistoryHits"] = refresh_history_hits;
    j["errors"] = errors;
    return j;
}

} // namespace pbi_scan
