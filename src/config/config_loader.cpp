#include <pbi_scan/config/config_loader.hpp>

#include <pbi_scan/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <iostream>

namespace pbi_scan {

namespace {

constexpr const char* kDefaultTokenEnv = "PBI_ACCESS_TOKEN";

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

template <typename T>
void ReadScalar(const YAML::Node& parent, const char* key, T& out) {
    if (parent[key]) {
        out = parent[key].as<T>();
    }
}

// Boolean switches carry a fixed meaning; record it only when the flag was given.
void SetIfGiven(const argparse::ArgumentParser& program, const char* flag, bool value,
                std::optional<bool>& out) {
    if (program.get<bool>(flag)) {
        out = value;
    }
}

template <typename T>
void Apply(const std::optional<T>& override_value, T& out) {
    if (override_value) {
        out = *override_value;
    }
}

template <typename T>
void ReadOptional(const YAML::Node& parent, const char* key, std::optional<T>& out) {
    if (parent[key]) {
        out = parent[key].as<T>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        // -- API --
        if (const auto api = root["api"]) {
            ReadScalar(api, "base_url", config.api.base_url);
            ReadScalar(api, "token", config.api.token);
            ReadOptional(api, "token_env", config.api.token_env);
            ReadScalar(api, "connect_timeout", config.api.connect_timeout_seconds);
            ReadScalar(api, "read_timeout", config.api.read_timeout_seconds);
            ReadScalar(api, "insecure", config.api.insecure);
        }

        // -- Retry --
        if (const auto retry = root["retry"]) {
            ReadScalar(retry, "max_retries", config.retry.max_retries);
            ReadScalar(retry, "delay_seconds", config.retry.delay_seconds);
        }

        // -- Scan --
        if (const auto scan = root["scan"]) {
            ReadScalar(scan, "lineage", config.scan.lineage);
            ReadScalar(scan, "datasource_details", config.scan.datasource_details);
            ReadScalar(scan, "dataset_schema", config.scan.dataset_schema);
            ReadScalar(scan, "dataset_expressions", config.scan.dataset_expressions);
            ReadScalar(scan, "refresh_history", config.scan.refresh_history);
            ReadOptional(scan, "workspace_filter", config.scan.workspace_filter);
            ReadScalar(scan, "interactive", config.scan.interactive);
            ReadScalar(scan, "page_size", config.scan.page_size);
            ReadScalar(scan, "poll_interval_seconds", config.scan.poll_interval_seconds);
            ReadScalar(scan, "max_polls", config.scan.max_polls);
        }

        // -- Output --
        if (const auto output = root["output"]) {
            ReadScalar(output, "directory", config.output.directory);
            ReadScalar(output, "format", config.output.format);
        }

        // -- Options --
        ReadOptional(root, "log_file", config.log_file);
        ReadScalar(root, "json_output", config.json_output);
        if (root["verbose"] && root["verbose"].as<bool>()) {
            config.verbosity = 1;
        }
        ReadScalar(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("pbi-scan", kVersion, argparse::default_arguments::none);
    program.add_description(
        "Harvest workspace metadata through the admin scanner API and export "
        "it as flat tables.");

    program.add_argument("-h", "--help")
        .help("Show help and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Show version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // API
    program.add_argument("--base-url")
        .help("Admin API base URL");
    program.add_argument("--token")
        .help("Bearer access token");
    program.add_argument("--token-env")
        .help("Environment variable holding the access token");
    program.add_argument("--connect-timeout")
        .help("Connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--read-timeout")
        .help("Read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    // Retry
    program.add_argument("--max-retries")
        .help("Retries per API call (not-found is never retried)")
        .scan<'i', int>();
    program.add_argument("--retry-delay")
        .help("Seconds between retries")
        .scan<'i', int>();

    // Scan
    program.add_argument("--no-lineage")
        .help("Do not request lineage")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-datasource-details")
        .help("Do not request datasource details")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-schema")
        .help("Do not request dataset schema (tables, columns, measures)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-expressions")
        .help("Do not request DAX/M expressions")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--refresh-history")
        .help("Look up refresh history for every dataset")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-f", "--filter")
        .help("Workspace name wildcard (* and ?, case-insensitive)");
    program.add_argument("-i", "--interactive")
        .help("Pick workspaces interactively")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--page-size")
        .help("Workspaces per listing page")
        .scan<'i', int>();
    program.add_argument("--poll-interval")
        .help("Seconds between scan status polls")
        .scan<'i', int>();
    program.add_argument("--max-polls")
        .help("Give up on a scan after this many polls (0 = never)")
        .scan<'i', int>();

    // Output
    program.add_argument("-o", "--output-dir")
        .help("Directory for the run output");
    program.add_argument("--format")
        .help("Export format: csv or json");
    program.add_argument("--json")
        .help("Print the run summary as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");

    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Only print errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliArgs, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliArgs args;
    if (program.get<bool>("--help")) {
        std::cout << program;
        args.help_requested = true;
        return Result<CliArgs, Error>::Ok(std::move(args));
    }
    if (program.get<bool>("--version")) {
        std::cout << "pbi-scan " << kVersion << "\n";
        args.help_requested = true;
        return Result<CliArgs, Error>::Ok(std::move(args));
    }

    args.config_path = program.present("--config");
    auto& cli = args.overrides;

    // API
    cli.base_url = program.present("--base-url");
    cli.token = program.present("--token");
    cli.token_env = program.present("--token-env");
    cli.connect_timeout_seconds = program.present<int>("--connect-timeout");
    cli.read_timeout_seconds = program.present<int>("--read-timeout");
    SetIfGiven(program, "--insecure", true, cli.insecure);

    // Retry
    cli.max_retries = program.present<int>("--max-retries");
    cli.retry_delay_seconds = program.present<int>("--retry-delay");

    // Scan
    SetIfGiven(program, "--no-lineage", false, cli.lineage);
    SetIfGiven(program, "--no-datasource-details", false, cli.datasource_details);
    SetIfGiven(program, "--no-schema", false, cli.dataset_schema);
    SetIfGiven(program, "--no-expressions", false, cli.dataset_expressions);
    SetIfGiven(program, "--refresh-history", true, cli.refresh_history);
    cli.workspace_filter = program.present("--filter");
    SetIfGiven(program, "--interactive", true, cli.interactive);
    cli.page_size = program.present<int>("--page-size");
    cli.poll_interval_seconds = program.present<int>("--poll-interval");
    cli.max_polls = program.present<int>("--max-polls");

    // Output
    cli.output_directory = program.present("--output-dir");
    cli.format = program.present("--format");
    SetIfGiven(program, "--json", true, cli.json_output);
    cli.log_file = program.present("--log-file");
    if (verbosity > 0) {
        cli.verbosity = verbosity;
    }
    SetIfGiven(program, "--quiet", true, cli.quiet);
    SetIfGiven(program, "--color", true, cli.color);
    SetIfGiven(program, "--no-color", false, cli.color);

    return Result<CliArgs, Error>::Ok(std::move(args));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& cli) {
    AppConfig merged = base;

    // API
    Apply(cli.base_url, merged.api.base_url);
    Apply(cli.token, merged.api.token);
    if (cli.token_env) {
        merged.api.token_env = cli.token_env;
    }
    Apply(cli.connect_timeout_seconds, merged.api.connect_timeout_seconds);
    Apply(cli.read_timeout_seconds, merged.api.read_timeout_seconds);
    Apply(cli.insecure, merged.api.insecure);

    // Retry
    Apply(cli.max_retries, merged.retry.max_retries);
    Apply(cli.retry_delay_seconds, merged.retry.delay_seconds);

    // Scan
    Apply(cli.lineage, merged.scan.lineage);
    Apply(cli.datasource_details, merged.scan.datasource_details);
    Apply(cli.dataset_schema, merged.scan.dataset_schema);
    Apply(cli.dataset_expressions, merged.scan.dataset_expressions);
    Apply(cli.refresh_history, merged.scan.refresh_history);
    if (cli.workspace_filter) {
        merged.scan.workspace_filter = cli.workspace_filter;
    }
    Apply(cli.interactive, merged.scan.interactive);
    Apply(cli.page_size, merged.scan.page_size);
    Apply(cli.poll_interval_seconds, merged.scan.poll_interval_seconds);
    Apply(cli.max_polls, merged.scan.max_polls);

    // Output
    Apply(cli.output_directory, merged.output.directory);
    Apply(cli.format, merged.output.format);

    // Options
    if (cli.log_file) {
        merged.log_file = cli.log_file;
    }
    Apply(cli.json_output, merged.json_output);
    Apply(cli.verbosity, merged.verbosity);
    Apply(cli.quiet, merged.quiet);
    if (cli.color) {
        merged.color = cli.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveTokenEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveTokenEnv(AppConfig config) {
    if (!config.api.token.empty()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    const std::string env_var = config.api.token_env.value_or(kDefaultTokenEnv);
    const char* env_val = std::getenv(env_var.c_str());
    if (env_val == nullptr || *env_val == '\0') {
        return Result<AppConfig, Error>::Err(Error{
            "ConfigLoader", "", std::nullopt,
            "No access token: pass --token or set environment variable '" + env_var + "'",
            std::nullopt, ErrorCategory::Authentication});
    }
    config.api.token = env_val;
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.api.base_url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: api.base_url"));
    }
    if (config.api.base_url.rfind("http://", 0) != 0 &&
        config.api.base_url.rfind("https://", 0) != 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "api.base_url must start with http:// or https://, got '" +
            config.api.base_url + "'"));
    }
    if (config.api.token.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing access token"));
    }
    if (config.api.connect_timeout_seconds <= 0 || config.api.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.retry.max_retries < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "retry.max_retries must be >= 0, got " + std::to_string(config.retry.max_retries)));
    }
    if (config.retry.delay_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "retry.delay_seconds must be >= 0, got " +
            std::to_string(config.retry.delay_seconds)));
    }
    if (config.scan.page_size <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "scan.page_size must be positive, got " + std::to_string(config.scan.page_size)));
    }
    if (config.scan.poll_interval_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "scan.poll_interval_seconds must be >= 0, got " +
            std::to_string(config.scan.poll_interval_seconds)));
    }
    if (config.scan.max_polls < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "scan.max_polls must be >= 0, got " + std::to_string(config.scan.max_polls)));
    }
    if (config.output.format != "csv" && config.output.format != "json") {
        return Result<void, Error>::Err(MakeConfigError(
            "output.format must be csv or json, got '" + config.output.format + "'"));
    }
    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace pbi_scan
