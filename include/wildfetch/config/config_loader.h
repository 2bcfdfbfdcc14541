#pragma once

#include <wildfetch/config/config_helpers.h>
#include <wildfetch/downloader/downloader.hpp>

#include <filesystem>
#include <string>

namespace wildfetch::config {

struct LoggingConfig {
    std::string level{"info"};
    std::filesystem::path file; // empty = console only
};

struct AppConfig {
    downloader::DownloadSpec download;
    LoggingConfig logging;
};

/**
 * Map parsed key/values onto defaults. Type errors are InvalidArgument naming the key;
 * unknown keys are logged and ignored.
 */
downloader::Expected<AppConfig> config_from_map(const ConfigMap& values);

/**
 * Load a config file. A missing file yields defaults unless it is required.
 */
downloader::Expected<AppConfig> load_config(const std::filesystem::path& path, bool required);

} // namespace wildfetch::config
