#include <fstream>
#include <istream>
#include <wildfetch/config/config_helpers.h>

namespace wildfetch::config {

namespace {

// Cut a trailing "# comment" that is not inside a quoted string
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

ConfigMap parse_config_stream(std::istream& in) {
    ConfigMap values;
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        k = unquote(k);
        if (k.empty()) {
            continue;
        }

        // Support both "http.timeout.total = 30" and "[http.timeout] total = 30"
        const std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }

    return values;
}

std::optional<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }
    return parse_config_stream(file);
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("WILDFETCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return std::filesystem::path("wildfetch.toml");
}

} // namespace wildfetch::config
