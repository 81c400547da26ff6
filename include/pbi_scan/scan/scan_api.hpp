#pragma once

#include <pbi_scan/api/admin_gateway.hpp>
#include <pbi_scan/core/result.hpp>
#include <pbi_scan/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// ScanOptions: which optional sections the scan should materialize.
// ---------------------------------------------------------------------------
struct ScanOptions {
    bool lineage = false;
    bool datasource_details = false;
    bool dataset_schema = false;
    bool dataset_expressions = false;
};

// ---------------------------------------------------------------------------
// ScanRequest: one batch of at most kMaxWorkspacesPerScan workspace ids.
// ---------------------------------------------------------------------------
struct ScanRequest {
    int batch_id = 0;            // 1-based ordinal within the run
    std::vector<std::string> workspace_ids;
    ScanOptions options;
};

/// The platform rejects getInfo requests naming more workspaces than this.
constexpr size_t kMaxWorkspacesPerScan = 100;

// ---------------------------------------------------------------------------
// ScanStatus: server-side scan job status.
// ---------------------------------------------------------------------------
enum class ScanStatus {
    NotStarted,
    Running,
    Succeeded,
    Failed,
    Unknown,     // any status string not listed above; treated as terminal
};

[[nodiscard]] ScanStatus ParseScanStatus(const std::string& text);
[[nodiscard]] const char* ScanStatusName(ScanStatus status);

/// NotStarted and Running are the only non-terminal states.
[[nodiscard]] inline bool IsTerminal(ScanStatus status) {
    return status != ScanStatus::NotStarted && status != ScanStatus::Running;
}

// ---------------------------------------------------------------------------
// ScanJob: a submitted scan. Created by SubmitScan, mutated only by polling.
// ---------------------------------------------------------------------------
struct ScanJob {
    ScanId scan_id;
    ScanStatus status = ScanStatus::NotStarted;
    ScanRequest request;
};

// ---------------------------------------------------------------------------
// SubmitScan: start an asynchronous metadata scan for one batch.
//
// Endpoint: POST /v1.0/myorg/admin/workspaces/getInfo?lineage=True&...
// Body:     {"workspaces": ["<id>", ...]}
//
// Each enabled option becomes a "=True" query flag; disabled options are
// omitted. A response without a usable "id" is an error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ScanJob, Error> SubmitScan(AdminGateway& gateway,
                                                const ScanRequest& request);

// ---------------------------------------------------------------------------
// GetScanStatus: read the job status.
//
// Endpoint: GET /v1.0/myorg/admin/workspaces/scanStatus/{scanId}
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ScanStatus, Error> GetScanStatus(AdminGateway& gateway,
                                                      const ScanId& scan_id);

// ---------------------------------------------------------------------------
// FetchScanResult: download the raw scan document (unparsed JSON text).
//
// Endpoint: GET /v1.0/myorg/admin/workspaces/scanResult/{scanId}
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::string, Error> FetchScanResult(AdminGateway& gateway,
                                                         const ScanId& scan_id);

/// Path (with query string) used by SubmitScan; exposed for tests and logs.
[[nodiscard]] std::string SubmitScanPath(const ScanOptions& options);

} // namespace pbi_scan
