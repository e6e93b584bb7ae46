#pragma once

#include <kfetch/crawl/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kfetch::crawl {

/**
 * One decoded listing page.
 */
struct Page {
    std::vector<PostRecord> posts;          // well-formed entries, page order
    std::size_t rawEntries{0};              // entries the page listed, malformed included
    std::size_t malformed{0};               // entries skipped for a missing or unusable id
    std::optional<std::size_t> totalCount;  // props.count when present
    std::optional<std::string> creatorName; // props.name when present
};

/**
 * Decode a listing response. Accepts the legacy object form
 * ({"props": {...}, "results": [...], "result_previews": [[...]],
 * "result_attachments": [[...]]}) and a bare array of post objects.
 *
 * Attachment servers are resolved from result_previews/result_attachments by path.
 * Returns MalformedResponse when the body is not JSON or has neither shape.
 */
Expected<Page> parsePage(std::string_view body);

} // namespace kfetch::crawl
