#pragma once

#include <kfetch/crawl/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kfetch::crawl {

struct ExtractorOptions {
    std::string fallbackServer;         // for attachments listed without a server
    bool includeInline{true};           // scan post content for /data/ references
    std::size_t maxFilenameBytes{200};
};

/**
 * Turns a post into the ordered list of files to download.
 *
 * Order: the post's primary file, its attachments in API order, then inline
 * references found in the content. Exact URL duplicates are dropped. Names are
 * sanitized and made unique within the post (case-insensitively) by appending the
 * zero-padded attachment index to the stem: ["x.jpg", "x.jpg"] -> x.jpg, x_1.jpg.
 * The same post always yields the same names.
 */
class MediaExtractor {
public:
    explicit MediaExtractor(ExtractorOptions options = {});

    [[nodiscard]] std::vector<FileDescriptor> extract(const PostRecord& post) const;

    /**
     * Strip \ / * ? " < > | and control characters, replace spaces with '_'.
     * Returns an empty string when nothing usable is left.
     */
    [[nodiscard]] static std::string sanitizeFilename(std::string_view name);

private:
    ExtractorOptions options_;
};

} // namespace kfetch::crawl
