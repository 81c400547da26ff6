#pragma once

#include <pbi_scan/api/admin_gateway.hpp>
#include <pbi_scan/scan/scan_api.hpp>

#include <chrono>
#include <string>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// ScanJobOptions: polling behaviour of a single scan job.
// ---------------------------------------------------------------------------
struct ScanJobOptions {
    std::chrono::milliseconds poll_interval{std::chrono::seconds{5}};
    // Upper bound on status polls; 0 polls forever. A job stuck in Running
    // then blocks its batch until the operator interrupts the process.
    int max_polls = 0;
};

// ---------------------------------------------------------------------------
// CompletedScan: a Succeeded job and its downloaded result.
// ---------------------------------------------------------------------------
struct CompletedScan {
    ScanJob job;
    std::string raw_result;
    int polls = 0;
};

// ---------------------------------------------------------------------------
// ScanJobRunner: drives one batch through
//
//     Submitted -> {NotStarted | Running}* -> {Succeeded | Failed}
//
// Submit, then sleep-and-poll while the status is non-terminal. Succeeded
// fetches the raw result; every other terminal status (Failed or an
// unrecognised value) fails the batch. Errors from the gateway have
// already been retried by it and end the job.
// ---------------------------------------------------------------------------
class ScanJobRunner {
public:
    ScanJobRunner(AdminGateway& gateway, ScanJobOptions options, SleepFn sleep);

    [[nodiscard]] Result<CompletedScan, Error> Run(const ScanRequest& request);

private:
    Result<ScanJob, Error> AwaitTerminal(ScanJob job, int& polls);

    AdminGateway& gateway_;
    ScanJobOptions options_;
    SleepFn sleep_;
};

} // namespace pbi_scan
