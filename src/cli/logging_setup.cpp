#include <wildfetch/cli/logging_setup.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <system_error>
#include <vector>

namespace wildfetch::cli {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum resolve_log_level(const std::string& configLevel, bool verbose,
                                            bool quiet) {
    if (const char* envLvl = std::getenv("WILDFETCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parse_log_level(envLvl)) {
            return *lvl;
        }
    }
    if (verbose) {
        return spdlog::level::debug;
    }
    if (quiet) {
        return spdlog::level::err;
    }
    if (auto lvl = parse_log_level(configLevel)) {
        return *lvl;
    }
    return spdlog::level::info;
}

void setup_logging(spdlog::level::level_enum level, const std::filesystem::path& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string fileError;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            std::error_code ec;
            if (logFile.has_parent_path()) {
                std::filesystem::create_directories(logFile.parent_path(), ec);
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;               // Keep 5 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("wildfetch", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);

    if (!fileError.empty()) {
        spdlog::warn("Could not open log file {}: {}", logFile.string(), fileError);
    }
}

} // namespace wildfetch::cli
