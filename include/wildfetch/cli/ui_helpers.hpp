#pragma once

// Console helpers for wildfetch
// - ANSI color enablement (TTY/NO_COLOR/TERM=dumb)
// - Byte formatting and progress bar rendering
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#if defined(_WIN32)
#include <io.h>
#define WILDFETCH_UI_ISATTY _isatty
#define WILDFETCH_UI_FILENO _fileno
#else
#include <unistd.h>
#define WILDFETCH_UI_ISATTY isatty
#define WILDFETCH_UI_FILENO fileno
#endif

namespace wildfetch::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* DIM = "\x1b[2m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* YELLOW = "\x1b[33m";
    static constexpr const char* CYAN = "\x1b[36m";
};

inline bool stream_is_tty(std::FILE* stream) {
    return stream != nullptr && WILDFETCH_UI_ISATTY(WILDFETCH_UI_FILENO(stream)) != 0;
}

// Colors only on an interactive stream, honoring NO_COLOR and TERM=dumb
inline bool colors_enabled(std::FILE* stream = stderr) {
    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stream_is_tty(stream);
}

inline std::string colorize(std::string_view s, const char* code, bool enabled) {
    if (!enabled || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 16);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

inline std::string format_bytes(std::uint64_t bytes, int precision = 1) {
    if (bytes == 0)
        return "0 B";

    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    int unit_idx = 0;

    while (value >= 1024.0 && unit_idx < 5) {
        value /= 1024.0;
        ++unit_idx;
    }

    std::ostringstream oss;
    if (unit_idx == 0) {
        oss << bytes << " B";
    } else {
        int prec = (value < 10.0) ? precision : 0;
        oss << std::fixed << std::setprecision(prec) << value << " " << units[unit_idx];
    }
    return oss.str();
}

inline std::string format_percentage(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::clamp(fraction, 0.0, 1.0) * 100.0 << "%";
    return oss.str();
}

inline std::string progress_bar(double fraction, int width = 30, bool show_percentage = true) {
    double clamped = std::clamp(fraction, 0.0, 1.0);
    int filled = static_cast<int>(std::llround(clamped * static_cast<double>(width)));

    std::string bar = "[";
    bar += std::string(static_cast<size_t>(filled), '=');
    bar += std::string(static_cast<size_t>(width - filled), ' ');
    bar += "]";

    if (show_percentage) {
        bar += " " + format_percentage(clamped);
    }
    return bar;
}

} // namespace wildfetch::cli::ui
