#pragma once

#include <pbi_scan/config/app_config.hpp>
#include <pbi_scan/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pbi_scan {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Values given on the command line. An unset field leaves the base config
// alone; a set one always wins, even when it equals the built-in default.
struct ConfigOverrides {
    // API
    std::optional<std::string> base_url;
    std::optional<std::string> token;
    std::optional<std::string> token_env;
    std::optional<int> connect_timeout_seconds;
    std::optional<int> read_timeout_seconds;
    std::optional<bool> insecure;

    // Retry
    std::optional<int> max_retries;
    std::optional<int> retry_delay_seconds;

    // Scan
    std::optional<bool> lineage;
    std::optional<bool> datasource_details;
    std::optional<bool> dataset_schema;
    std::optional<bool> dataset_expressions;
    std::optional<bool> refresh_history;
    std::optional<std::string> workspace_filter;
    std::optional<bool> interactive;
    std::optional<int> page_size;
    std::optional<int> poll_interval_seconds;
    std::optional<int> max_polls;

    // Output
    std::optional<std::string> output_directory;
    std::optional<std::string> format;

    // Options
    std::optional<std::string> log_file;
    std::optional<bool> json_output;
    std::optional<int> verbosity;
    std::optional<bool> quiet;
    std::optional<bool> color;
};

// Parsed command line: the overrides plus the path given by --config, if any.
struct CliArgs {
    ConfigOverrides overrides;
    std::optional<std::string> config_path;
    bool help_requested = false;            // --help / --version already printed
};

// Parse CLI arguments. Only flags that were actually given are set in
// `overrides`.
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv);

// Apply every present CLI override on top of base (the YAML config, or the
// defaults when no file was given).
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& cli_overrides);

// Resolve token_env: if token is empty, read it from the named environment
// variable (PBI_ACCESS_TOKEN when token_env is unset).
Result<AppConfig, Error> ResolveTokenEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace pbi_scan
