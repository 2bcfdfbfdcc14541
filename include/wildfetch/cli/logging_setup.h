#pragma once

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>

namespace wildfetch::cli {

// "trace", "debug", "info", "warn"/"warning", "error"/"err", "critical"/"crit", "off"/"none"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

/**
 * Effective level. Precedence: $WILDFETCH_LOG_LEVEL > --verbose/--quiet > config value.
 * Unrecognized names fall through to the next source; the final fallback is info.
 */
spdlog::level::level_enum resolve_log_level(const std::string& configLevel, bool verbose,
                                            bool quiet);

/**
 * Install the default logger: colored stderr, plus a rotating file (10 MiB x 5) when
 * logFile is non-empty.
 */
void setup_logging(spdlog::level::level_enum level, const std::filesystem::path& logFile = {});

} // namespace wildfetch::cli
