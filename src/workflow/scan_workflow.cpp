#include <pbi_scan/workflow/scan_workflow.hpp>

#include <pbi_scan/api/workspaces.hpp>
#include <pbi_scan/core/log.hpp>
#include <pbi_scan/export/flattener.hpp>
#include <pbi_scan/export/refresh_history.hpp>
#include <pbi_scan/export/run_output.hpp>
#include <pbi_scan/scan/batch_scheduler.hpp>
#include <pbi_scan/scan/result_merger.hpp>
#include <pbi_scan/scan/result_validator.hpp>

#include <exception>

namespace pbi_scan {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

RetryPolicy PolicyFrom(const RetryConfig& retry) {
    return RetryPolicy{retry.max_retries, std::chrono::seconds{retry.delay_seconds}};
}

ScanOptions ScanOptionsFrom(const ScanConfig& scan) {
    return ScanOptions{scan.lineage, scan.datasource_details, scan.dataset_schema,
                       scan.dataset_expressions};
}

void RecordFatal(ScanRunResult& result, const std::string& step,
                 Clock::time_point start, Error error) {
    LogError("workflow", error.ToString());
    result.steps.push_back(
        StepResult{step, StepOutcome::Failed, error.ToString(), Elapsed(start)});
    result.stats.AddError(error.ToString());
    result.fatal_error = std::move(error);
}

} // anonymous namespace

ScanWorkflow::ScanWorkflow(IHttpSession& session,
                           const AppConfig& config,
                           SleepFn sleep,
                           WorkspacePicker picker)
    : config_(config),
      gateway_(session, PolicyFrom(config.retry), sleep),
      sleep_(std::move(sleep)),
      picker_(std::move(picker)) {}

ScanRunResult ScanWorkflow::Run() {
    const auto total_start = Clock::now();
    ScanRunResult result;
    result.stats.started_at = UtcNowIso8601();

    // Step 1: output directory.
    current_step_ = "prepare-output";
    auto step_start = Clock::now();
    auto format = ParseExportFormat(config_.output.format);
    if (format.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(format).Error());
        result.stats.finished_at = UtcNowIso8601();
        result.total_duration = Elapsed(total_start);
        return result;
    }
    auto output = RunOutput::Create(config_.output.directory, format.Value(),
                                    timestamp_.empty() ? RunTimestamp() : timestamp_);
    if (output.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(output).Error());
        result.stats.finished_at = UtcNowIso8601();
        result.total_duration = Elapsed(total_start);
        return result;
    }
    const auto run_output = std::move(output).Value();
    result.output_directory = run_output.Directory();
    result.steps.push_back(StepResult{current_step_, StepOutcome::Completed,
                                      run_output.Directory(), Elapsed(step_start)});

    const auto& policy = gateway_.Policy();
    LogInfo("workflow", "Retry policy: up to " + std::to_string(policy.max_retries) +
                            " retries, " + std::to_string(policy.delay.count()) +
                            " ms between attempts");

    step_start = Clock::now();
    try {
        RunSteps(run_output, result);
    } catch (const std::exception& e) {
        RecordFatal(result, current_step_, step_start,
                    Error{"ScanWorkflow", "", std::nullopt,
                          std::string("Unexpected failure: ") + e.what(), std::nullopt,
                          ErrorCategory::Internal});
    }

    // Every path from here on ends with the statistics file.
    result.stats.finished_at = UtcNowIso8601();
    auto written = run_output.WriteStatistics(result.stats);
    if (written.IsErr()) {
        LogError("workflow", written.Error().ToString());
        if (!result.fatal_error) {
            result.fatal_error = std::move(written).Error();
        }
    } else {
        result.files.push_back(std::move(written).Value());
    }
    result.total_duration = Elapsed(total_start);
    return result;
}

void ScanWorkflow::RunSteps(const RunOutput& run_output, ScanRunResult& result) {
    auto& stats = result.stats;

    // Step 2: enumerate.
    current_step_ = "enumerate";
    auto step_start = Clock::now();
    auto all = ListAllWorkspaces(gateway_, config_.scan.page_size);
    if (all.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(all).Error());
        return;
    }
    stats.workspaces_enumerated = static_cast<int>(all.Value().size());
    result.steps.push_back(StepResult{
        current_step_, StepOutcome::Completed,
        std::to_string(all.Value().size()) + " workspace(s)", Elapsed(step_start)});

    // Step 3: select.
    current_step_ = "select";
    step_start = Clock::now();
    WorkspacePicker picker;
    if (config_.scan.interactive) {
        picker = picker_;
    }
    auto selected = SelectWorkspaces(all.Value(), config_.scan.workspace_filter, picker);
    if (selected.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(selected).Error());
        return;
    }
    const auto ids = std::move(selected).Value();
    stats.workspaces_selected = static_cast<int>(ids.size());
    result.steps.push_back(StepResult{
        current_step_, StepOutcome::Completed,
        std::to_string(ids.size()) + " workspace(s)", Elapsed(step_start)});

    // Step 4: scan, one batch at a time.
    current_step_ = "scan";
    step_start = Clock::now();
    const auto options = ScanOptionsFrom(config_.scan);
    BatchScheduler scheduler(
        gateway_,
        ScanJobOptions{std::chrono::seconds{config_.scan.poll_interval_seconds},
                       config_.scan.max_polls},
        sleep_);
    auto batches = scheduler.RunScans(ids, options, stats);
    result.steps.push_back(StepResult{
        current_step_,
        batches.empty() ? StepOutcome::Failed : StepOutcome::Completed,
        std::to_string(stats.batches_succeeded) + " of " +
            std::to_string(stats.batches_total) + " batch(es) succeeded",
        Elapsed(step_start)});
    if (batches.empty()) {
        LogError("workflow", "No batch succeeded; nothing to export");
        return;
    }

    // Step 5: validate + merge. Each document is validated against the ids
    // its batch requested as the merger parses it.
    current_step_ = "merge";
    step_start = Clock::now();
    std::vector<std::string> raw_documents;
    raw_documents.reserve(batches.size());
    for (const auto& batch : batches) {
        raw_documents.push_back(batch.raw_result);
    }
    const auto merged = MergeScanResults(
        raw_documents, stats, [&](size_t index, const nlohmann::json& doc) {
            const auto& batch = batches[index];
            for (auto& issue : ValidateScanResult(doc, batch.workspace_ids,
                                                  options.dataset_schema)) {
                auto message = "Batch " + std::to_string(batch.batch_id) + ": " + issue;
                LogWarn("validate", message);
                stats.AddError(std::move(message));
            }
        });
    result.steps.push_back(StepResult{
        current_step_, StepOutcome::Completed,
        std::to_string(merged["workspaces"].size()) + " workspace(s) merged",
        Elapsed(step_start)});

    current_step_ = "export";
    auto merged_path = run_output.WriteMergedDocument(merged);
    if (merged_path.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(merged_path).Error());
        return;
    }
    result.files.push_back(std::move(merged_path).Value());

    // Step 6: flatten (with optional refresh-history lookups).
    current_step_ = "flatten";
    step_start = Clock::now();
    RefreshHistoryClient refresh_client(gateway_);
    FlattenOptions flatten_options;
    flatten_options.refresh_history = config_.scan.refresh_history;
    Flattener flattener(flatten_options, &refresh_client);
    const auto tables = flattener.Flatten(merged, stats);
    result.steps.push_back(StepResult{
        current_step_, StepOutcome::Completed,
        std::to_string(stats.datasets) + " dataset(s), " +
            std::to_string(stats.tables) + " table(s)",
        Elapsed(step_start)});

    // Step 7: write tables.
    current_step_ = "export";
    step_start = Clock::now();
    auto written = run_output.WriteTables(tables);
    if (written.IsErr()) {
        RecordFatal(result, current_step_, step_start, std::move(written).Error());
        return;
    }
    for (auto& path : std::move(written).Value()) {
        result.files.push_back(std::move(path));
    }
    result.steps.push_back(StepResult{current_step_, StepOutcome::Completed,
                                      std::to_string(result.files.size()) + " file(s)",
                                      Elapsed(step_start)});
}

} // namespace pbi_scan
