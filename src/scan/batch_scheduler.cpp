#include <pbi_scan/scan/batch_scheduler.hpp>

#include <pbi_scan/core/log.hpp>

#include <algorithm>

namespace pbi_scan {

std::vector<std::vector<std::string>> PartitionIds(const std::vector<std::string>& ids,
                                                   size_t cap) {
    if (cap == 0 || cap > kMaxWorkspacesPerScan) {
        cap = kMaxWorkspacesPerScan;
    }
    std::vector<std::vector<std::string>> batches;
    batches.reserve((ids.size() + cap - 1) / cap);
    for (size_t offset = 0; offset < ids.size(); offset += cap) {
        const auto end = std::min(ids.size(), offset + cap);
        batches.emplace_back(ids.begin() + static_cast<std::ptrdiff_t>(offset),
                             ids.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

BatchScheduler::BatchScheduler(AdminGateway& gateway, ScanJobOptions job_options,
                               SleepFn sleep)
    : runner_(gateway, job_options, std::move(sleep)) {}

std::vector<BatchResult> BatchScheduler::RunScans(
    const std::vector<std::string>& workspace_ids,
    const ScanOptions& options,
    RunStatistics& stats) {
    auto batches = PartitionIds(workspace_ids);
    stats.batches_total += static_cast<int>(batches.size());
    LogInfo("scan", "Scanning " + std::to_string(workspace_ids.size()) +
                        " workspace(s) in " + std::to_string(batches.size()) +
                        " batch(es)");

    std::vector<BatchResult> results;
    int batch_id = 0;
    for (auto& ids : batches) {
        ++batch_id;
        ScanRequest request{batch_id, std::move(ids), options};

        auto completed = runner_.Run(request);
        if (completed.IsErr()) {
            ++stats.batches_failed;
            auto message = "Batch " + std::to_string(batch_id) + " (" +
                           std::to_string(request.workspace_ids.size()) +
                           " workspaces) failed: " + completed.Error().ToString();
            LogError("scan", message);
            stats.AddError(std::move(message));
            continue;
        }

        ++stats.batches_succeeded;
        LogInfo("scan", "Batch " + std::to_string(batch_id) + "/" +
                            std::to_string(batches.size()) + " succeeded");
        results.push_back(BatchResult{batch_id, std::move(request.workspace_ids),
                                      std::move(completed).Value().raw_result});
    }
    return results;
}

} // namespace pbi_scan
