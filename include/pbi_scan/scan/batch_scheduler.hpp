#pragma once

#include <pbi_scan/scan/run_statistics.hpp>
#include <pbi_scan/scan/scan_api.hpp>
#include <pbi_scan/scan/scan_job.hpp>

#include <string>
#include <vector>

namespace pbi_scan {

/// Split ids into consecutive chunks of at most `cap` ids, preserving order.
/// A cap of 0 or above kMaxWorkspacesPerScan is clamped to the platform cap.
[[nodiscard]] std::vector<std::vector<std::string>> PartitionIds(
    const std::vector<std::string>& ids,
    size_t cap = kMaxWorkspacesPerScan);

// ---------------------------------------------------------------------------
// BatchResult: the raw scan document of one succeeded batch.
// ---------------------------------------------------------------------------
struct BatchResult {
    int batch_id = 0;
    std::vector<std::string> workspace_ids;
    std::string raw_result;
};

// ---------------------------------------------------------------------------
// BatchScheduler: run one scan job per batch, strictly one after another.
//
// A failed batch (submit error, non-Succeeded terminal status, or fetch
// error) is logged, counted and recorded as one error string naming the
// batch; the scheduler then moves on. RunScans itself never fails.
// ---------------------------------------------------------------------------
class BatchScheduler {
public:
    BatchScheduler(AdminGateway& gateway, ScanJobOptions job_options, SleepFn sleep);

    [[nodiscard]] std::vector<BatchResult> RunScans(
        const std::vector<std::string>& workspace_ids,
        const ScanOptions& options,
        RunStatistics& stats);

private:
    ScanJobRunner runner_;
};

} // namespace pbi_scan
