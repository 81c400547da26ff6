#include <pbi_scan/api/http_session.hpp>
#include <pbi_scan/cli/output_formatter.hpp>
#include <pbi_scan/cli/workspace_picker.hpp>
#include <pbi_scan/config/config_loader.hpp>
#include <pbi_scan/core/log.hpp>
#include <pbi_scan/core/terminal.hpp>
#include <pbi_scan/export/run_output.hpp>
#include <pbi_scan/workflow/scan_workflow.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace pbi_scan;

constexpr int kExitSuccess = 0;

LogLevel LogLevelFor(const AppConfig& config) {
    if (config.quiet) return LogLevel::Error;
    if (config.verbosity >= 2) return LogLevel::Debug;
    if (config.verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

bool ResolveColor(const std::optional<bool>& requested, bool is_tty) {
    if (requested.has_value()) {
        return *requested;
    }
    return !NoColorEnvSet() && is_tty;
}

void InitLogging(const AppConfig& config, const std::string& run_id) {
    auto console = std::make_unique<ColorConsoleSink>(
        ResolveColor(config.color, IsStderrTty()));
    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), LogLevelFor(config));
        return;
    }

    auto file = std::make_unique<FileSink>(*config.log_file, run_id);
    const bool file_ok = file->IsOpen();
    auto sinks = std::make_unique<MultiSink>();
    sinks->Add(std::move(console));
    if (file_ok) {
        sinks->Add(std::move(file));
    }
    InitGlobalLogger(std::move(sinks), LogLevelFor(config));
    if (!file_ok) {
        LogWarn("main", "Cannot open log file " + *config.log_file +
                            ", logging to the console only");
    }
}

int RunMain(int argc, char* argv[]) {
    // Step 1: CLI.
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        OutputFormatter(false).PrintError(cli.Error());
        return cli.Error().ExitCode();
    }
    auto args = std::move(cli).Value();
    if (args.help_requested) {
        return kExitSuccess;
    }

    // Step 2: YAML config, overridden by CLI flags.
    AppConfig base;
    if (args.config_path.has_value()) {
        auto yaml = LoadFromYaml(*args.config_path);
        if (yaml.IsErr()) {
            OutputFormatter(args.overrides.json_output.value_or(false)).PrintError(yaml.Error());
            return yaml.Error().ExitCode();
        }
        base = std::move(yaml).Value();
    }
    AppConfig config = MergeConfigs(base, args.overrides);

    // Step 3: logging. Log lines and the output directory share the run id.
    const auto run_id = RunTimestamp();
    InitLogging(config, run_id);
    OutputFormatter formatter(config.json_output,
                              ResolveColor(config.color, IsStdoutTty()));

    // Step 4: token + validation.
    auto resolved = ResolveTokenEnv(config);
    if (resolved.IsErr()) {
        formatter.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 5: session and workflow.
    HttpSessionOptions session_opts;
    session_opts.connect_timeout = std::chrono::seconds(config.api.connect_timeout_seconds);
    session_opts.read_timeout = std::chrono::seconds(config.api.read_timeout_seconds);
    session_opts.disable_tls_verify = config.api.insecure;
    auto session = std::make_unique<HttpSession>(config.api.base_url, config.api.token,
                                                 session_opts);

    WorkspacePicker picker;
    if (config.scan.interactive) {
        if (IsStdinTty()) {
            picker = RunWorkspacePicker;
        } else {
            LogWarn("main", "--interactive needs a terminal on stdin; scanning all "
                            "matching workspaces");
        }
    }

    ScanWorkflow workflow(*session, config, RealSleep(), picker);
    workflow.SetRunTimestamp(run_id);
    auto result = workflow.Run();

    // Step 6: report.
    if (!config.quiet || config.json_output) {
        formatter.PrintRunSummary(result.stats, result.output_directory, result.files);
    }
    if (result.fatal_error.has_value()) {
        formatter.PrintError(*result.fatal_error);
        return result.fatal_error->ExitCode();
    }
    if (!result.Success()) {
        // Every batch failed.
        return Error{"ScanWorkflow", "", std::nullopt, "", std::nullopt,
                     ErrorCategory::ScanFailed}.ExitCode();
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        return RunMain(argc, argv);
    } catch (const std::exception& e) {
        const Error error{"main", "", std::nullopt,
                          std::string("Unhandled exception: ") + e.what(), std::nullopt,
                          ErrorCategory::Internal};
        LogError("main", error.ToString());
        std::cerr << error.ToString() << "\n";
        return error.ExitCode();
    }
}
