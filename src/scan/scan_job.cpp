#include <pbi_scan/scan/scan_job.hpp>

#include <pbi_scan/core/log.hpp>

namespace pbi_scan {

ScanJobRunner::ScanJobRunner(AdminGateway& gateway, ScanJobOptions options,
                             SleepFn sleep)
    : gateway_(gateway), options_(options), sleep_(std::move(sleep)) {}

Result<ScanJob, Error> ScanJobRunner::AwaitTerminal(ScanJob job, int& polls) {
    const auto prefix = "Batch " + std::to_string(job.request.batch_id) +
                        " scan " + job.scan_id.Value();

    while (!IsTerminal(job.status)) {
        if (options_.max_polls > 0 && polls >= options_.max_polls) {
            return Result<ScanJob, Error>::Err(Error{
                "AwaitScan", job.scan_id.Value(), std::nullopt,
                "Scan still " + std::string(ScanStatusName(job.status)) +
                    " after " + std::to_string(polls) + " polls",
                std::nullopt, ErrorCategory::Timeout});
        }
        if (sleep_) {
            sleep_(options_.poll_interval);
        }

        auto status = GetScanStatus(gateway_, job.scan_id);
        if (status.IsErr()) {
            return Result<ScanJob, Error>::Err(std::move(status).Error());
        }
        ++polls;
        if (status.Value() != job.status) {
            LogInfo("scan", prefix + ": " + ScanStatusName(job.status) + " -> " +
                                ScanStatusName(status.Value()));
        }
        job.status = status.Value();
    }
    return Result<ScanJob, Error>::Ok(std::move(job));
}

Result<CompletedScan, Error> ScanJobRunner::Run(const ScanRequest& request) {
    auto submitted = SubmitScan(gateway_, request);
    if (submitted.IsErr()) {
        return Result<CompletedScan, Error>::Err(std::move(submitted).Error());
    }

    int polls = 0;
    auto terminal = AwaitTerminal(std::move(submitted).Value(), polls);
    if (terminal.IsErr()) {
        return Result<CompletedScan, Error>::Err(std::move(terminal).Error());
    }
    auto job = std::move(terminal).Value();

    if (job.status != ScanStatus::Succeeded) {
        return Result<CompletedScan, Error>::Err(Error{
            "AwaitScan", job.scan_id.Value(), std::nullopt,
            "Scan finished with status " + std::string(ScanStatusName(job.status)),
            std::nullopt, ErrorCategory::ScanFailed});
    }

    auto raw = FetchScanResult(gateway_, job.scan_id);
    if (raw.IsErr()) {
        return Result<CompletedScan, Error>::Err(std::move(raw).Error());
    }
    LogDebug("scan", "Batch " + std::to_string(request.batch_id) + ": fetched " +
                         std::to_string(raw.Value().size()) + " bytes after " +
                         std::to_string(polls) + " poll(s)");
    return Result<CompletedScan, Error>::Ok(
        CompletedScan{std::move(job), std::move(raw).Value(), polls});
}

} // namespace pbi_scan
