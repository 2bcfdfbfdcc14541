#include <wildfetch/config/config_loader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <functional>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

namespace wildfetch::config {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;
using downloader::kMaxDuration;

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Error bad_value(const std::string& key, const std::string& value, const std::string& expected) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + key + ": '" + value + "' (expected " + expected + ")"};
}

std::optional<bool> parse_bool(const std::string& raw) {
    const auto v = to_lower(raw);
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<long long> parse_int(const std::string& raw) {
    long long v{0};
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), v);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size())
        return std::nullopt;
    return v;
}

// Seconds in [0, kMaxDuration], fractional allowed ("1.5")
std::optional<std::chrono::milliseconds> parse_seconds(const std::string& raw) {
    if (raw.empty())
        return std::nullopt;
    try {
        size_t used = 0;
        const double secs = std::stod(raw, &used);
        if (used != raw.size() || !std::isfinite(secs) || secs < 0.0 ||
            secs > static_cast<double>(kMaxDuration.count()))
            return std::nullopt;
        return std::chrono::milliseconds(static_cast<long long>(std::llround(secs * 1000.0)));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

using Setter = std::function<Expected<void>(AppConfig&, const std::string& key,
                                            const std::string& value)>;

Setter string_setter(std::function<void(AppConfig&, const std::string&)> assign) {
    return [assign = std::move(assign)](AppConfig& cfg, const std::string&,
                                        const std::string& value) -> Expected<void> {
        assign(cfg, value);
        return {};
    };
}

Setter bool_setter(std::function<void(AppConfig&, bool)> assign) {
    return [assign = std::move(assign)](AppConfig& cfg, const std::string& key,
                                        const std::string& value) -> Expected<void> {
        auto b = parse_bool(value);
        if (!b)
            return bad_value(key, value, "true or false");
        assign(cfg, *b);
        return {};
    };
}

Setter positive_setter(std::function<void(AppConfig&, long long)> assign) {
    return [assign = std::move(assign)](AppConfig& cfg, const std::string& key,
                                        const std::string& value) -> Expected<void> {
        auto n = parse_int(value);
        if (!n || *n < 1)
            return bad_value(key, value, "a positive integer");
        assign(cfg, *n);
        return {};
    };
}

Setter seconds_setter(std::function<void(AppConfig&, std::chrono::milliseconds)> assign) {
    return [assign = std::move(assign)](AppConfig& cfg, const std::string& key,
                                        const std::string& value) -> Expected<void> {
        auto d = parse_seconds(value);
        if (!d)
            return bad_value(key, value,
                             "a number of seconds between 0 and " +
                                 std::to_string(kMaxDuration.count()));
        assign(cfg, *d);
        return {};
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"download.url_template",
         string_setter([](AppConfig& c, const std::string& v) { c.download.urlTemplate = v; })},
        {"download.output_dir", string_setter([](AppConfig& c, const std::string& v) {
             c.download.outputDir = expand_tilde(v);
         })},
        {"download.max_concurrent", positive_setter([](AppConfig& c, long long v) {
             c.download.maxConcurrent = static_cast<int>(std::min<long long>(v, 1 << 16));
         })},
        {"download.chunk_size", positive_setter([](AppConfig& c, long long v) {
             c.download.chunkSizeBytes = static_cast<std::size_t>(v);
         })},
        {"download.resume", bool_setter([](AppConfig& c, bool v) { c.download.resume = v; })},

        {"http.follow_redirects",
         bool_setter([](AppConfig& c, bool v) { c.download.followRedirects = v; })},
        {"http.proxy", string_setter([](AppConfig& c, const std::string& v) {
             if (v.empty())
                 c.download.proxy.reset();
             else
                 c.download.proxy = v;
         })},
        {"http.tls_insecure",
         bool_setter([](AppConfig& c, bool v) { c.download.tls.insecure = v; })},
        {"http.ca_path", string_setter([](AppConfig& c, const std::string& v) {
             c.download.tls.caPath = v.empty() ? std::string{} : expand_tilde(v).string();
         })},
        {"http.user_agent",
         string_setter([](AppConfig& c, const std::string& v) { c.download.userAgent = v; })},

        {"http.timeout.total", seconds_setter([](AppConfig& c, std::chrono::milliseconds v) {
             c.download.timeout.total = v;
         })},
        {"http.timeout.connect", seconds_setter([](AppConfig& c, std::chrono::milliseconds v) {
             c.download.timeout.connect = v;
         })},

        {"http.retries.enabled",
         bool_setter([](AppConfig& c, bool v) { c.download.retry.enabled = v; })},
        {"http.retries.max_attempts", positive_setter([](AppConfig& c, long long v) {
             c.download.retry.maxAttempts = static_cast<int>(std::min<long long>(v, 1000));
         })},
        {"http.retries.delay", seconds_setter([](AppConfig& c, std::chrono::milliseconds v) {
             c.download.retry.delay = v;
         })},

        {"logging.level",
         string_setter([](AppConfig& c, const std::string& v) { c.logging.level = to_lower(v); })},
        {"logging.file", string_setter([](AppConfig& c, const std::string& v) {
             c.logging.file = v.empty() ? std::filesystem::path{} : expand_tilde(v);
         })},
    };
    return table;
}

} // namespace

Expected<AppConfig> config_from_map(const ConfigMap& values) {
    AppConfig cfg;
    const auto& table = setters();
    for (const auto& [key, value] : values) {
        auto it = table.find(key);
        if (it == table.end()) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
            continue;
        }
        auto r = it->second(cfg, key, value);
        if (!r)
            return r.error();
    }
    return cfg;
}

Expected<AppConfig> load_config(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::InvalidArgument, "Config file not found: " + path.string()};
        }
        spdlog::debug("No config file at {}; using defaults", path.string());
        return AppConfig{};
    }

    auto values = parse_config_file(path);
    if (!values) {
        return Error{ErrorCode::IoError, "Failed to read config file: " + path.string()};
    }
    spdlog::debug("Loaded {} setting(s) from {}", values->size(), path.string());
    return config_from_map(*values);
}

} // namespace wildfetch::config
