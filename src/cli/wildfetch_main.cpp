/*
 * wildfetch/src/cli/wildfetch_main.cpp
 *
 * Entry point: options -> config -> logging -> orchestrator run -> summary.
 * SIGINT/SIGTERM request cooperative cancellation; a second signal terminates immediately.
 */

#include <wildfetch/cli/cli_options.h>
#include <wildfetch/cli/logging_setup.h>
#include <wildfetch/cli/progress_renderer.h>
#include <wildfetch/cli/run_report.h>
#include <wildfetch/cli/stop_signal.h>
#include <wildfetch/cli/ui_helpers.hpp>
#include <wildfetch/config/config_loader.h>
#include <wildfetch/downloader/orchestrator.hpp>
#include <wildfetch/downloader/range_expander.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>

namespace {

void print_json_error(const wildfetch::downloader::Error& err) {
    nlohmann::json j;
    j["success"] = false;
    j["error"] = {{"code", std::string(wildfetch::downloader::errorCodeName(err.code))},
                  {"message", err.message}};
    fmt::print("{}\n", j.dump(2));
}

int run(const wildfetch::cli::CliOptions& opts) {
    using namespace wildfetch;
    namespace dl = wildfetch::downloader;

    // Console logging first so config warnings respect --verbose/--quiet
    cli::setup_logging(cli::resolve_log_level("info", opts.verbose, opts.quiet));

    const char* envConfig = std::getenv("WILDFETCH_CONFIG");
    const bool configRequired = !opts.config_path.empty() || (envConfig && *envConfig);
    const auto configPath = config::get_config_path(opts.config_path);

    auto loaded = config::load_config(configPath, configRequired);
    if (!loaded) {
        spdlog::error("{}", loaded.error().message);
        if (opts.emit_json)
            print_json_error(loaded.error());
        return cli::kExitConfigError;
    }
    auto cfg = std::move(loaded).value();

    auto applied = cli::apply_overrides(opts, cfg);
    if (!applied) {
        spdlog::error("{}", applied.error().message);
        if (opts.emit_json)
            print_json_error(applied.error());
        return cli::kExitConfigError;
    }

    cli::setup_logging(cli::resolve_log_level(cfg.logging.level, opts.verbose, opts.quiet),
                       cfg.logging.file);
    if (!cli::parse_log_level(cfg.logging.level)) {
        spdlog::warn("Unknown logging.level '{}' in {}; using info", cfg.logging.level,
                     configPath.string());
    }

    if (cfg.download.urlTemplate.empty()) {
        dl::Error err{dl::ErrorCode::InvalidArgument,
                      "No URL template: pass -t/--template or set download.url_template in " +
                          configPath.string()};
        spdlog::error("{}", err.message);
        if (opts.emit_json)
            print_json_error(err);
        return cli::kExitConfigError;
    }

    auto valid = dl::validateSpec(cfg.download);
    if (!valid) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        if (opts.emit_json)
            print_json_error(valid.error());
        return cli::kExitConfigError;
    }

    auto urls = dl::expandUrlTemplate(cfg.download.urlTemplate);
    if (!urls) {
        spdlog::error("{}", urls.error().message);
        if (opts.emit_json)
            print_json_error(urls.error());
        return cli::exit_code_for(urls.error());
    }

    if (opts.dry_run) {
        const auto targets = dl::makeTargets(urls.value(), cfg.download.outputDir);
        if (!targets) {
            spdlog::error("{}", targets.error().message);
            if (opts.emit_json)
                print_json_error(targets.error());
            return cli::exit_code_for(targets.error());
        }
        for (const auto& t : targets.value()) {
            fmt::print("{} -> {}\n", t.url, t.localPath.string());
        }
        return cli::kExitOk;
    }

    cli::install_stop_handlers();

    auto mode = cli::parse_progress_mode(opts.progress).value_or(cli::ProgressMode::Human);
    if (opts.quiet)
        mode = cli::ProgressMode::None;
    cli::ProgressRenderer renderer(mode, urls.value().size());

    dl::DownloadOrchestrator orchestrator;
    auto result = orchestrator.run(cfg.download, renderer.observer(), [] { return cli::stop_requested(); });
    renderer.finish();

    if (!result) {
        spdlog::error("Download failed: {}", result.error().message);
        if (opts.emit_json)
            print_json_error(result.error());
        return cli::exit_code_for(result.error());
    }

    const auto& summary = result.value();
    if (cli::stop_requested()) {
        spdlog::warn("Interrupted: partial files were kept and will resume on the next run");
    }
    if (opts.emit_json) {
        fmt::print("{}\n", cli::summary_to_json(summary).dump(2));
    } else if (!opts.quiet || !summary.allSucceeded()) {
        fmt::print("{}", cli::format_summary(summary, cli::ui::colors_enabled(stdout)));
    }
    return cli::exit_code_for(summary);
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"wildfetch - concurrent bulk downloader for numbered URL ranges"};

    wildfetch::cli::CliOptions opts;
    wildfetch::cli::register_options(app, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? wildfetch::cli::kExitOk : wildfetch::cli::kExitConfigError;
    }

    try {
        return run(opts);
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled error: {}", e.what());
        return wildfetch::cli::kExitFailures;
    }
}
