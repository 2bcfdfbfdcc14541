/*
 * wildfetch/src/downloader/range_expander.cpp
 *
 * Wildcard template expansion: "{start..end}" -> one URL per integer in [start, end].
 * Zero padding follows the start literal ("{001..010}" renders width 3).
 */

#include <wildfetch/downloader/range_expander.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <string>
#include <system_error>
#include <unordered_map>

namespace wildfetch::downloader {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Length of the "{<digits>..<digits>}" match starting at pos, or 0.
std::size_t matchTokenAt(std::string_view s, std::size_t pos) {
    if (pos >= s.size() || s[pos] != '{')
        return 0;
    std::size_t i = pos + 1;
    const std::size_t firstDigits = i;
    while (i < s.size() && isDigit(s[i]))
        ++i;
    if (i == firstDigits || s.substr(i, 2) != "..")
        return 0;
    i += 2;
    const std::size_t secondDigits = i;
    while (i < s.size() && isDigit(s[i]))
        ++i;
    if (i == secondDigits || i >= s.size() || s[i] != '}')
        return 0;
    return i + 1 - pos;
}

bool parseBound(std::string_view digits, std::uint64_t& out) {
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return res.ec == std::errc() && res.ptr == digits.data() + digits.size();
}

std::string renderNumber(std::uint64_t value, std::size_t width) {
    std::string s = std::to_string(value);
    if (s.size() < width) {
        s.insert(0, width - s.size(), '0');
    }
    return s;
}

} // namespace

Expected<RangeToken> parseRangeToken(std::string_view urlTemplate) {
    std::optional<RangeToken> found;
    for (std::size_t pos = urlTemplate.find('{'); pos != std::string_view::npos;
         pos = urlTemplate.find('{', pos + 1)) {
        const auto len = matchTokenAt(urlTemplate, pos);
        if (len == 0)
            continue;
        if (found) {
            return Error{ErrorCode::InvalidTemplate,
                         "Template must contain exactly one {start..end} range"};
        }
        RangeToken tok;
        tok.position = pos;
        tok.length = len;
        found = tok;
        pos += len - 1;
    }
    if (!found) {
        return Error{ErrorCode::InvalidTemplate,
                     "Template must contain a {start..end} range, e.g. {1..10}"};
    }

    auto body = urlTemplate.substr(found->position + 1, found->length - 2);
    const auto dots = body.find("..");
    const auto startLiteral = body.substr(0, dots);
    const auto endLiteral = body.substr(dots + 2);

    if (!parseBound(startLiteral, found->start) || !parseBound(endLiteral, found->end)) {
        return Error{ErrorCode::InvalidRange,
                     "Range bound does not fit in 64 bits: " + std::string(body)};
    }
    if (found->start > found->end) {
        return Error{ErrorCode::InvalidRange, "Range start " + std::string(startLiteral) +
                                                  " is greater than end " +
                                                  std::string(endLiteral)};
    }
    found->width =
        (startLiteral.size() > 1 && startLiteral.front() == '0') ? startLiteral.size() : 0;
    return *found;
}

Expected<std::vector<std::string>> expandUrlTemplate(std::string_view urlTemplate) {
    auto parsed = parseRangeToken(urlTemplate);
    if (!parsed.ok())
        return parsed.error();
    const auto& tok = parsed.value();

    const auto prefix = urlTemplate.substr(0, tok.position);
    const auto suffix = urlTemplate.substr(tok.position + tok.length);

    std::vector<std::string> urls;
    urls.reserve(static_cast<std::size_t>(tok.end - tok.start) + 1);
    for (std::uint64_t i = tok.start;; ++i) {
        std::string url;
        url.reserve(urlTemplate.size() + tok.width);
        url.append(prefix);
        url.append(renderNumber(i, tok.width));
        url.append(suffix);
        urls.push_back(std::move(url));
        if (i == tok.end)
            break; // also guards against wrap-around at UINT64_MAX
    }
    return urls;
}

namespace {

// Query string of a URL without the leading '?' and any fragment; empty if there is none.
std::string_view queryOf(std::string_view url) {
    auto hash = url.find('#');
    if (hash != std::string_view::npos)
        url = url.substr(0, hash);
    auto q = url.find('?');
    if (q == std::string_view::npos)
        return {};
    return url.substr(q + 1);
}

// Keep characters that are safe in a file name, map the rest to '_'
std::string sanitizeForFilename(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0 || c == '.' || c == '-' || c == '_' || c == '=') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    return out;
}

} // namespace

std::string filenameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);

    // Ignore the authority part so "http://host" does not yield "host"
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return {};
        url = url.substr(pathStart);
    }

    auto slash = url.rfind('/');
    auto name = (slash == std::string_view::npos) ? url : url.substr(slash + 1);
    if (name == "." || name == "..")
        return {};
    return std::string(name);
}

std::string queryQualifiedFilename(std::string_view url) {
    auto base = filenameFromUrl(url);
    const auto query = queryOf(url);
    if (base.empty() || query.empty())
        return base;
    return base + "_" + sanitizeForFilename(query);
}

Expected<std::vector<ExpandedTarget>> makeTargets(const std::vector<std::string>& urls,
                                                  const std::filesystem::path& outputDir) {
    std::vector<std::string> names;
    names.reserve(urls.size());
    for (const auto& url : urls) {
        names.push_back(filenameFromUrl(url));
    }

    // Numbered query strings ("get?id={1..3}") strip to the same segment; keep the query then
    std::unordered_map<std::string, std::size_t> seen;
    for (const auto& name : names) {
        if (!name.empty())
            ++seen[name];
    }
    const bool clash =
        std::any_of(seen.begin(), seen.end(), [](const auto& kv) { return kv.second > 1; });
    if (clash) {
        for (std::size_t i = 0; i < urls.size(); ++i) {
            names[i] = queryQualifiedFilename(urls[i]);
        }
    }

    std::vector<ExpandedTarget> targets;
    targets.reserve(urls.size());
    std::unordered_map<std::string, std::size_t> owner;
    for (std::size_t i = 0; i < urls.size(); ++i) {
        ExpandedTarget t;
        t.url = urls[i];
        t.index = i;
        t.filename = names[i].empty() ? "download_" + std::to_string(i) : names[i];
        auto [it, inserted] = owner.emplace(t.filename, i);
        if (!inserted) {
            return Error{ErrorCode::InvalidTemplate,
                         "URLs " + urls[it->second] + " and " + urls[i] +
                             " both map to file '" + t.filename + "'"};
        }
        t.localPath = outputDir / t.filename;
        targets.push_back(std::move(t));
    }
    return targets;
}

} // namespace wildfetch::downloader
