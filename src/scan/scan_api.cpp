#include <pbi_scan/scan/scan_api.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/core/url.hpp>

namespace pbi_scan {

namespace {

const char* kWorkspacesAdminBase = "/v1.0/myorg/admin/workspaces/";

} // anonymous namespace

ScanStatus ParseScanStatus(const std::string& text) {
    if (text == "NotStarted") return ScanStatus::NotStarted;
    if (text == "Running")    return ScanStatus::Running;
    if (text == "Succeeded")  return ScanStatus::Succeeded;
    if (text == "Failed")     return ScanStatus::Failed;
    return ScanStatus::Unknown;
}

const char* ScanStatusName(ScanStatus status) {
    switch (status) {
        case ScanStatus::NotStarted: return "NotStarted";
        case ScanStatus::Running:    return "Running";
        case ScanStatus::Succeeded:  return "Succeeded";
        case ScanStatus::Failed:     return "Failed";
        case ScanStatus::Unknown:    return "Unknown";
    }
    return "Unknown";
}

std::string SubmitScanPath(const ScanOptions& options) {
    std::vector<std::pair<std::string, std::string>> query;
    if (options.lineage)             query.emplace_back("lineage", "True");
    if (options.datasource_details)  query.emplace_back("datasourceDetails", "True");
    if (options.dataset_schema)      query.emplace_back("datasetSchema", "True");
    if (options.dataset_expressions) query.emplace_back("datasetExpressions", "True");
    return WithQuery(std::string(kWorkspacesAdminBase) + "getInfo", query);
}

// ---------------------------------------------------------------------------
// SubmitScan
// ---------------------------------------------------------------------------
Result<ScanJob, Error> SubmitScan(AdminGateway& gateway, const ScanRequest& request) {
    const auto path = SubmitScanPath(request.options);
    if (request.workspace_ids.empty() ||
        request.workspace_ids.size() > kMaxWorkspacesPerScan) {
        return Result<ScanJob, Error>::Err(Error{
            "SubmitScan", path, std::nullopt,
            "A scan request must name 1.." + std::to_string(kMaxWorkspacesPerScan) +
                " workspaces, got " + std::to_string(request.workspace_ids.size()),
            std::nullopt, ErrorCategory::Internal});
    }

    nlohmann::json body;
    body["workspaces"] = request.workspace_ids;

    auto response = gateway.PostJson(path, body);
    if (response.IsErr()) {
        return Result<ScanJob, Error>::Err(std::move(response).Error());
    }

    const auto& doc = response.Value();
    auto id_it = doc.find("id");
    if (id_it == doc.end() || !id_it->is_string()) {
        return Result<ScanJob, Error>::Err(Error{
            "SubmitScan", path, std::nullopt,
            "Submit response did not contain a scan id", std::nullopt,
            ErrorCategory::ScanFailed});
    }
    auto scan_id = ScanId::Create(id_it->get<std::string>());
    if (scan_id.IsErr()) {
        return Result<ScanJob, Error>::Err(Error{
            "SubmitScan", path, std::nullopt,
            "Invalid scan id in submit response: " + scan_id.Error(),
            std::nullopt, ErrorCategory::ScanFailed});
    }

    auto status = ScanStatus::NotStarted;
    auto status_it = doc.find("status");
    if (status_it != doc.end() && status_it->is_string()) {
        status = ParseScanStatus(status_it->get<std::string>());
    }

    LogInfo("scan", "Batch " + std::to_string(request.batch_id) + ": submitted scan " +
                        scan_id.Value().Value() + " for " +
                        std::to_string(request.workspace_ids.size()) + " workspace(s)");
    return Result<ScanJob, Error>::Ok(
        ScanJob{std::move(scan_id).Value(), status, request});
}

// ---------------------------------------------------------------------------
// GetScanStatus
// ---------------------------------------------------------------------------
Result<ScanStatus, Error> GetScanStatus(AdminGateway& gateway, const ScanId& scan_id) {
    const auto path = std::string(kWorkspacesAdminBase) + "scanStatus/" + scan_id.Value();
    auto response = gateway.GetJson(path);
    if (response.IsErr()) {
        return Result<ScanStatus, Error>::Err(std::move(response).Error());
    }
    const auto& doc = response.Value();
    auto it = doc.find("status");
    if (it == doc.end() || !it->is_string()) {
        return Result<ScanStatus, Error>::Err(Error{
            "GetScanStatus", path, std::nullopt,
            "Status response did not contain a status", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<ScanStatus, Error>::Ok(ParseScanStatus(it->get<std::string>()));
}

// ---------------------------------------------------------------------------
// FetchScanResult
// ---------------------------------------------------------------------------
Result<std::string, Error> FetchScanResult(AdminGateway& gateway, const ScanId& scan_id) {
    return gateway.GetText(std::string(kWorkspacesAdminBase) + "scanResult/" +
                           scan_id.Value());
}

} // namespace pbi_scan
