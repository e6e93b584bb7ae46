#pragma once

#include <kfetch/crawl/page_parser.hpp>
#include <kfetch/crawl/scope.hpp>
#include <kfetch/crawl/types.hpp>
#include <kfetch/downloader/downloader.hpp>
#include <kfetch/downloader/retry_policy.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace kfetch::crawl {

struct FetchOptions {
    std::string apiBase; // empty: "https://<site>/api/v1"
    std::size_t pageSize{50};
    std::vector<downloader::Header> headers;
    downloader::RequestOptions request{};
    downloader::RetryPolicy retry{};
    int maxConsecutiveMalformedPages{3};
};

/**
 * Walks a creator's paginated listing ("<api>/<service>/user/<id>/posts-legacy?o=<offset>").
 */
class PageFetcher {
public:
    /**
     * Lazy sequence of posts for one target. Pages are requested on demand by next().
     */
    class Cursor {
    public:
        /**
         * The next post not yet emitted in this run, nullopt at the end of the listing
         * or once shouldStop() fires. An error is fatal for the target; posts already
         * returned stay valid.
         */
        Expected<std::optional<PostRecord>> next();

        [[nodiscard]] std::size_t pagesFetched() const noexcept { return pagesFetched_; }
        [[nodiscard]] std::size_t malformedEntries() const noexcept { return malformed_; }
        [[nodiscard]] std::size_t duplicatesSuppressed() const noexcept { return duplicates_; }
        [[nodiscard]] bool stopped() const noexcept { return stopped_; }
        [[nodiscard]] const std::optional<std::size_t>& totalCount() const noexcept {
            return totalCount_;
        }
        [[nodiscard]] const std::optional<std::string>& creatorName() const noexcept {
            return creatorName_;
        }

    private:
        friend class PageFetcher;
        Cursor(const PageFetcher& owner, CreatorTarget target,
               std::unordered_set<std::string>& seen, CrawlScope scope,
               downloader::ShouldCancel shouldStop);

        // Requests one page with retries. nullopt when stopped during backoff.
        Expected<std::optional<std::string>> requestPage(const std::string& url);
        bool stopRequested() const { return shouldStop_ && shouldStop_(); }

        const PageFetcher* owner_;
        CreatorTarget target_;
        std::unordered_set<std::string>* seen_;
        CrawlScope scope_;
        downloader::ShouldCancel shouldStop_;

        std::deque<PostRecord> buffer_;
        std::size_t offset_{0};
        bool done_{false};
        bool stopped_{false};
        int consecutiveMalformed_{0};
        std::size_t pagesFetched_{0};
        std::size_t malformed_{0};
        std::size_t duplicates_{0};
        std::optional<std::size_t> totalCount_;
        std::optional<std::string> creatorName_;
    };

    PageFetcher(downloader::IHttpAdapter& http, FetchOptions options);

    /**
     * `seen` holds the post ids already emitted in this run. It is owned by the caller
     * and must outlive the cursor.
     */
    Cursor fetch(const CreatorTarget& target, std::unordered_set<std::string>& seen,
                 const CrawlScope& scope = {}, downloader::ShouldCancel shouldStop = {}) const;

    [[nodiscard]] std::string pageUrl(const CreatorTarget& target, std::size_t offset) const;

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    downloader::IHttpAdapter& http_;
    FetchOptions options_;
};

} // namespace kfetch::crawl
