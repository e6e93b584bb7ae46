#include <kfetch/crawl/page_fetcher.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace kfetch::crawl {

using downloader::RetrySequence;

PageFetcher::PageFetcher(downloader::IHttpAdapter& http, FetchOptions options)
    : http_(http), options_(std::move(options)) {
    if (options_.pageSize == 0)
        options_.pageSize = 50;
}

std::string PageFetcher::pageUrl(const CreatorTarget& target, std::size_t offset) const {
    std::string base = options_.apiBase.empty() ? "https://" + target.site + "/api/v1"
                                                : options_.apiBase;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/" + target.service + "/user/" + target.creatorId +
           "/posts-legacy?o=" + std::to_string(offset);
}

PageFetcher::Cursor PageFetcher::fetch(const CreatorTarget& target,
                                       std::unordered_set<std::string>& seen,
                                       const CrawlScope& scope,
                                       downloader::ShouldCancel shouldStop) const {
    return Cursor(*this, target, seen, scope, std::move(shouldStop));
}

PageFetcher::Cursor::Cursor(const PageFetcher& owner, CreatorTarget target,
                            std::unordered_set<std::string>& seen, CrawlScope scope,
                            downloader::ShouldCancel shouldStop)
    : owner_(&owner), target_(std::move(target)), seen_(&seen), scope_(std::move(scope)),
      shouldStop_(std::move(shouldStop)), offset_(scope_.startOffset) {}

Expected<std::optional<std::string>> PageFetcher::Cursor::requestPage(const std::string& url) {
    const auto& opts = owner_->options_;
    RetrySequence seq(opts.retry);
    while (seq.begin()) {
        auto body = downloader::fetchText(owner_->http_, url, opts.headers, opts.request,
                                          shouldStop_);
        if (body.ok()) {
            seq.onSuccess();
            return std::optional<std::string>(std::move(body).value());
        }
        if (body.error().code == ErrorCode::Cancelled)
            return std::optional<std::string>{};

        auto delay = seq.onFailure(body.error());
        if (!delay) {
            Error err = body.error();
            err.message = "listing request " + url + " failed after " +
                          std::to_string(seq.attempts()) + " attempt(s): " + err.message;
            return err;
        }
        spdlog::warn("Listing request {} failed ({}), retrying in {} ms", url,
                     body.error().message, delay->count());
        if (!downloader::waitBackoff(*delay, shouldStop_))
            return std::optional<std::string>{};
    }
    return Error{ErrorCode::Unknown, "listing request " + url + " was not attempted"};
}

Expected<std::optional<PostRecord>> PageFetcher::Cursor::next() {
    const auto& opts = owner_->options_;
    while (true) {
        if (!buffer_.empty()) {
            PostRecord post = std::move(buffer_.front());
            buffer_.pop_front();
            return std::optional<PostRecord>(std::move(post));
        }
        if (done_)
            return std::optional<PostRecord>{};
        if (stopRequested()) {
            done_ = stopped_ = true;
            return std::optional<PostRecord>{};
        }
        if ((scope_.endOffset && offset_ >= *scope_.endOffset) ||
            (totalCount_ && offset_ >= *totalCount_)) {
            done_ = true;
            continue;
        }

        const std::string url = owner_->pageUrl(target_, offset_);
        spdlog::debug("Fetching listing page {}", url);
        auto body = requestPage(url);
        if (!body.ok()) {
            done_ = true;
            return body.error();
        }
        if (!body.value()) {
            done_ = stopped_ = true;
            return std::optional<PostRecord>{};
        }
        ++pagesFetched_;

        auto page = parsePage(*body.value());
        if (!page.ok()) {
            ++consecutiveMalformed_;
            spdlog::warn("Skipping malformed listing page at offset {}: {}", offset_,
                         page.error().message);
            if (consecutiveMalformed_ >= opts.maxConsecutiveMalformedPages) {
                done_ = true;
                return Error{ErrorCode::MalformedResponse,
                             std::to_string(consecutiveMalformed_) +
                                 " consecutive malformed listing pages, last at " + url};
            }
            ++malformed_;
            offset_ += opts.pageSize;
            continue;
        }
        consecutiveMalformed_ = 0;

        const Page& p = page.value();
        if (p.totalCount)
            totalCount_ = p.totalCount;
        if (p.creatorName && !creatorName_)
            creatorName_ = p.creatorName;
        malformed_ += p.malformed;

        for (const auto& post : p.posts) {
            const std::size_t position = offset_ + post.listingPosition;
            if (!scope_.containsOffset(position))
                continue;
            if (scope_.postFilter && !scope_.postFilter->matches(post.id))
                continue;
            if (!seen_->insert(post.id).second) {
                ++duplicates_;
                spdlog::debug("Post {} already emitted in this run, skipping", post.id);
                continue;
            }
            PostRecord copy = post;
            copy.listingPosition = position;
            if (copy.service.empty())
                copy.service = target_.service;
            if (copy.creatorId.empty())
                copy.creatorId = target_.creatorId;
            buffer_.push_back(std::move(copy));
        }

        if (p.rawEntries < opts.pageSize)
            done_ = true;
        offset_ += opts.pageSize;
    }
}

} // namespace kfetch::crawl
