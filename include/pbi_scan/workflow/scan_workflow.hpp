#pragma once

#include <pbi_scan/api/admin_gateway.hpp>
#include <pbi_scan/api/i_http_session.hpp>
#include <pbi_scan/config/app_config.hpp>
#include <pbi_scan/core/result.hpp>
#include <pbi_scan/scan/run_statistics.hpp>
#include <pbi_scan/scan/workspace_selector.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pbi_scan {

class RunOutput;

// ---------------------------------------------------------------------------
// StepOutcome: outcome for each phase of the workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Failed,
};

// ---------------------------------------------------------------------------
// StepResult: outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// ScanRunResult: everything a run produced.
//
// fatal_error is set when the run stopped early (no token accepted, nothing
// to scan, output directory unusable, an unexpected exception). Batch
// failures are not fatal; they show up in stats.batches_failed and
// stats.errors.
// ---------------------------------------------------------------------------
struct ScanRunResult {
    std::vector<StepResult> steps;
    RunStatistics stats;
    std::string output_directory;
    std::vector<std::string> files;
    std::optional<Error> fatal_error;
    std::chrono::milliseconds total_duration{0};

    /// No fatal error and at least one batch came back.
    [[nodiscard]] bool Success() const {
        return !fatal_error.has_value() &&
               (stats.batches_total == 0 || stats.batches_succeeded > 0);
    }
};

// ---------------------------------------------------------------------------
// ScanWorkflow: enumerate -> select -> scan -> merge -> flatten -> export.
//
// The output directory is created first so that the statistics file can be
// written on every exit path after it; a run that gets that far always
// leaves a statistics summary behind. An exception thrown by a later step is
// caught, recorded as an Internal fatal error against that step, and the
// statistics are still written.
//
// Takes ownership of nothing: session and config must outlive the workflow.
// ---------------------------------------------------------------------------
class ScanWorkflow {
public:
    ScanWorkflow(IHttpSession& session,
                 const AppConfig& config,
                 SleepFn sleep,
                 WorkspacePicker picker = nullptr);

    // Non-copyable, non-movable.
    ScanWorkflow(const ScanWorkflow&) = delete;
    ScanWorkflow& operator=(const ScanWorkflow&) = delete;
    ScanWorkflow(ScanWorkflow&&) = delete;
    ScanWorkflow& operator=(ScanWorkflow&&) = delete;

    /// Fixed timestamp for directory and file names (tests); default is now.
    void SetRunTimestamp(std::string timestamp) { timestamp_ = std::move(timestamp); }

    [[nodiscard]] ScanRunResult Run();

private:
    // Steps after the output directory exists. Returns early on a fatal error.
    void RunSteps(const RunOutput& output, ScanRunResult& result);

    const AppConfig& config_;
    AdminGateway gateway_;
    SleepFn sleep_;
    WorkspacePicker picker_;
    std::string timestamp_;
    std::string current_step_;
};

} // namespace pbi_scan
