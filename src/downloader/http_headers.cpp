#include <wildfetch/downloader/http_headers.hpp>

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>

namespace wildfetch::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v{0};
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

void parseContentRange(std::string_view value, ResponseHeaders& headers) {
    auto sv = trim(value);
    if (sv.size() < 6 || to_lower(sv.substr(0, 6)) != "bytes ")
        return;
    sv.remove_prefix(6);
    auto slash = sv.find('/');
    if (slash == std::string_view::npos)
        return;
    auto span = trim(sv.substr(0, slash));
    auto total = trim(sv.substr(slash + 1));
    if (total != "*")
        headers.contentRangeTotal = parse_u64(total);
    auto dash = span.find('-');
    if (dash != std::string_view::npos)
        headers.contentRangeStart = parse_u64(span.substr(0, dash));
}

void consumeHeaderLine(std::string_view line, ResponseHeaders& headers) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // New response in a redirect chain
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        headers = ResponseHeaders{};
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        headers.acceptRangesBytes = to_lower(val) == "bytes";
    } else if (key == "content-length") {
        headers.contentLength = parse_u64(val);
    } else if (key == "content-range") {
        parseContentRange(val, headers);
    }
}

} // namespace wildfetch::downloader
