#pragma once

#include <kfetch/downloader/downloader.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace kfetch::crawl {

/**
 * Inclusive post-id filter. Numeric ids compare numerically, anything else compares
 * as text. A single id has first == last.
 */
struct PostFilter {
    std::string first;
    std::string last;

    [[nodiscard]] bool matches(std::string_view postId) const;
};

/**
 * Which part of a creator's listing a run covers. Offsets count posts from the
 * start of the listing; the window is [startOffset, endOffset).
 */
struct CrawlScope {
    std::size_t startOffset{0};
    std::optional<std::size_t> endOffset;
    std::optional<PostFilter> postFilter;

    [[nodiscard]] bool containsOffset(std::size_t offset) const noexcept {
        return offset >= startOffset && (!endOffset || offset < *endOffset);
    }
};

/**
 * "all", "<n>" (one page starting at n), "<a>-<b>", "start-<b>", "<a>-end".
 */
downloader::Expected<CrawlScope> parseOffsetRange(std::string_view text, std::size_t pageSize);

/**
 * "<id>" or "<id1>-<id2>" (bounds may be given in either order).
 */
downloader::Expected<PostFilter> parsePostFilter(std::string_view text);

} // namespace kfetch::crawl
