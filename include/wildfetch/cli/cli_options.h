#pragma once

#include <wildfetch/config/config_loader.h>
#include <wildfetch/downloader/downloader.hpp>

#include <CLI/CLI.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wildfetch::cli {

/**
 * Command-line surface. Unset options leave the config value untouched.
 */
struct CliOptions {
    std::string config_path; // positional; empty = $WILDFETCH_CONFIG or ./wildfetch.toml

    // Download
    std::optional<std::string> url_template;
    std::optional<std::string> output_dir;
    std::optional<int> concurrency;
    std::optional<std::size_t> chunk_size;
    bool no_resume{false};

    // Retry
    std::optional<int> retries;
    std::optional<int> retry_delay_ms;
    bool no_retry{false};

    // HTTP
    std::optional<double> timeout_s;
    std::optional<double> connect_timeout_s;
    std::vector<std::string> headers;
    std::optional<std::string> proxy;
    bool tls_insecure{false};
    std::optional<std::string> tls_ca;
    bool no_follow_redirects{false};

    // Output / UX
    std::string progress{"human"}; // "human" | "json" | "none"
    bool emit_json{false};
    bool verbose{false};
    bool quiet{false};
    bool dry_run{false};
};

void register_options(CLI::App& app, CliOptions& opts);

/**
 * "Name: value" -> Header. Empty names are rejected.
 */
std::optional<downloader::Header> parse_header(std::string_view raw);

/**
 * Apply command-line values over the loaded config (InvalidArgument on a bad header).
 */
downloader::Expected<void> apply_overrides(const CliOptions& opts, config::AppConfig& cfg);

} // namespace wildfetch::cli
