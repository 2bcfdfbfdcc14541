#pragma once

#include <wildfetch/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wildfetch::downloader {

/**
 * Location and bounds of the "{start..end}" token inside a template.
 */
struct RangeToken {
    std::size_t position{0}; // offset of '{'
    std::size_t length{0};   // through the closing '}'
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::size_t width{0}; // zero-pad width, 0 = natural rendering
};

/**
 * Find and parse the single range token in a template.
 * InvalidTemplate: no token, or more than one. InvalidRange: start > end or a bound overflows.
 */
Expected<RangeToken> parseRangeToken(std::string_view urlTemplate);

/**
 * Expand "http://host/file_{1..3}.csv" into the ordered list of concrete URLs.
 */
Expected<std::vector<std::string>> expandUrlTemplate(std::string_view urlTemplate);

/**
 * Last path segment of a URL with any query or fragment removed; empty if there is none.
 */
std::string filenameFromUrl(std::string_view url);

/**
 * filenameFromUrl plus the sanitized query string: "http://h/get?id=1" -> "get_id=1".
 */
std::string queryQualifiedFilename(std::string_view url);

/**
 * One target per URL, placed under outputDir.
 *
 * Names come from filenameFromUrl. If two of them clash, every name keeps its query via
 * queryQualifiedFilename. A clash that remains after that (e.g. "http://h/{1..3}/data.csv")
 * is InvalidTemplate, since two units would share one file.
 */
Expected<std::vector<ExpandedTarget>> makeTargets(const std::vector<std::string>& urls,
                                                  const std::filesystem::path& outputDir);

} // namespace wildfetch::downloader
