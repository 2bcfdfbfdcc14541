#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace wildfetch::downloader {

/**
 * Response headers the transfer logic acts on, collected from libcurl's header callback.
 *
 * libcurl reports the headers of every response in a redirect chain to the same callback.
 * consumeHeaderLine() starts over on each status line, so only the final response counts.
 */
struct ResponseHeaders {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeStart{};
    std::optional<std::uint64_t> contentRangeTotal{};
};

// "bytes 100-199/200" sets start and total; "bytes */200" sets only the total.
// Other units are ignored; unparseable numbers are left unset.
void parseContentRange(std::string_view value, ResponseHeaders& headers);

// One raw header line as libcurl delivers it, trailing CRLF included or not.
void consumeHeaderLine(std::string_view line, ResponseHeaders& headers);

} // namespace wildfetch::downloader
