#pragma once

#include <optional>
#include <string>

namespace pbi_scan {

struct ApiConfig {
    std::string base_url = "https://api.powerbi.com";
    std::string token;
    std::optional<std::string> token_env;   // env var name to read the token from
    int connect_timeout_seconds = 30;
    int read_timeout_seconds = 300;
    bool insecure = false;                  // skip TLS certificate verification
};

struct RetryConfig {
    int max_retries = 3;
    int delay_seconds = 5;
};

struct ScanConfig {
    bool lineage = true;
    bool datasource_details = true;
    bool dataset_schema = true;
    bool dataset_expressions = true;
    bool refresh_history = false;
    std::optional<std::string> workspace_filter;
    bool interactive = false;
    int page_size = 5000;
    int poll_interval_seconds = 5;
    int max_polls = 0;                      // 0 = poll until terminal
};

struct OutputConfig {
    std::string directory = ".";
    std::string format = "csv";
};

struct AppConfig {
    ApiConfig api;
    RetryConfig retry;
    ScanConfig scan;
    OutputConfig output;
    std::optional<std::string> log_file;
    bool json_output = false;
    int verbosity = 0;                      // -v = 1 (info), -vv = 2 (debug)
    bool quiet = false;
    std::optional<bool> color;              // --color / --no-color; unset = auto
};

} // namespace pbi_scan
