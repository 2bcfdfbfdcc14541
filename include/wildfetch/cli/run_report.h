#pragma once

#include <wildfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace wildfetch::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailures = 1;    // some file failed, or the run was cancelled
inline constexpr int kExitConfigError = 2; // bad config, options or template

int exit_code_for(const downloader::RunSummary& summary);
int exit_code_for(const downloader::Error& error);

nlohmann::json summary_to_json(const downloader::RunSummary& summary);

// Multi-line human summary, failures listed with truncated messages
std::string format_summary(const downloader::RunSummary& summary, bool colors);

} // namespace wildfetch::cli
