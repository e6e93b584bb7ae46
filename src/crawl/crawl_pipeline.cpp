#include <kfetch/crawl/crawl_pipeline.hpp>
#include <kfetch/crawl/download_scheduler.hpp>
#include <kfetch/crawl/post_info_writer.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>
#include <utility>
#include <vector>

namespace kfetch::crawl {

CrawlPipeline::CrawlPipeline(PipelineConfig config, downloader::IHttpAdapter& http,
                             ledger::IProgressLedger& ledger, IRunObserver* observer,
                             downloader::IDiskWriter* disk, downloader::IRateLimiter* limiter)
    : config_(std::move(config)), http_(http), ledger_(ledger), observer_(observer), disk_(disk),
      limiter_(limiter) {
    if (!disk_) {
        ownedDisk_ = downloader::makeDiskWriter();
        disk_ = ownedDisk_.get();
    }
    if (!limiter_ && (config_.rateLimit.globalBps > 0 || config_.rateLimit.perHostBps > 0)) {
        ownedLimiter_ = downloader::makeRateLimiter();
        limiter_ = ownedLimiter_.get();
    }
    if (limiter_)
        limiter_->setLimits(config_.rateLimit);
}

void CrawlPipeline::requestStop() noexcept {
    stop_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lk(schedulerMutex_);
    if (scheduler_)
        scheduler_->requestStop();
}

void CrawlPipeline::attachScheduler(DownloadScheduler* scheduler) {
    std::lock_guard<std::mutex> lk(schedulerMutex_);
    scheduler_ = scheduler;
    // A stop that arrived before the scheduler existed
    if (scheduler_ && stopRequested())
        scheduler_->requestStop();
}

void CrawlPipeline::notifyPost(const PostRecord& post, std::size_t count) {
    if (!observer_)
        return;
    std::lock_guard<std::mutex> lk(observerMutex_);
    observer_->onPost(post, count);
}

void CrawlPipeline::notifyFatal(const Error& error) {
    spdlog::error("{}", error.message);
    if (!observer_)
        return;
    std::lock_guard<std::mutex> lk(observerMutex_);
    observer_->onFatal(error);
}

RunSummary CrawlPipeline::run(const CreatorTarget& target) {
    const auto started = std::chrono::steady_clock::now();
    RunSummary summary;

    spdlog::info("Crawling {} on {} into {}", target.key(), target.site,
                 config_.outputRoot.string());

    ExtractorOptions extractOpts = config_.extract;
    if (extractOpts.fallbackServer.empty())
        extractOpts.fallbackServer = "https://" + target.site;
    MediaExtractor extractor(extractOpts);

    TransferWorker worker(http_, *disk_, limiter_, ledger_, config_.transfer);

    SchedulerConfig schedCfg;
    schedCfg.target = target;
    schedCfg.outputRoot = config_.outputRoot;
    schedCfg.concurrency = config_.concurrency;
    schedCfg.perHostLimit = config_.perHostLimit;
    schedCfg.transferDeadline = config_.transferDeadline;

    // Results arrive one at a time from the scheduler
    DownloadScheduler scheduler(schedCfg, worker, ledger_, [&](const TransferResult& r) {
        switch (r.outcome) {
            case TransferOutcome::Success:
                ++summary.completed;
                break;
            case TransferOutcome::Skipped:
                ++summary.skipped;
                break;
            case TransferOutcome::Failed:
                ++summary.failed;
                break;
        }
        summary.bytesWritten += r.bytesWritten;
        if (observer_) {
            std::lock_guard<std::mutex> lk(observerMutex_);
            observer_->onResult(r);
        }
    });

    attachScheduler(&scheduler);
    struct Detach {
        CrawlPipeline* self;
        ~Detach() { self->attachScheduler(nullptr); }
    } detach{this};

    PageFetcher fetcher(http_, config_.fetch);
    std::unordered_set<std::string> seen;
    auto cursor = fetcher.fetch(target, seen, config_.scope,
                                [this, &scheduler] {
                                    return stopRequested() || scheduler.stopRequested();
                                });

    // Returns false when the run has to stop submitting
    auto handlePost = [&](const PostRecord& post) -> bool {
        if (stopRequested())
            return false;
        auto files = extractor.extract(post);
        ++summary.posts;
        summary.descriptors += files.size();
        notifyPost(post, files.size());

        if (config_.saveInfo && (!files.empty() || config_.includeEmptyPosts)) {
            auto w = writePostInfo(config_.outputRoot, target, post, files);
            if (!w.ok()) {
                summary.fatal = w.error();
                return false;
            }
        }
        for (auto& f : files) {
            if (stopRequested())
                return false;
            if (!scheduler.submit(std::move(f)))
                return false;
        }
        return true;
    };

    std::vector<PostRecord> backlog;
    while (!summary.fatal) {
        auto next = cursor.next();
        if (!next.ok()) {
            summary.fatal = next.error();
            break;
        }
        if (!next.value() || stopRequested())
            break;
        if (config_.processFromOldest) {
            backlog.push_back(std::move(*next.value()));
        } else if (!handlePost(*next.value())) {
            break;
        }
    }
    if (config_.processFromOldest && !summary.fatal && !stopRequested()) {
        spdlog::info("Listing complete ({} posts); downloading oldest first", backlog.size());
        for (auto it = backlog.rbegin(); it != backlog.rend(); ++it) {
            if (!handlePost(*it))
                break;
        }
    }

    if (summary.fatal || stopRequested())
        scheduler.requestStop();
    scheduler.finish();

    if (!summary.fatal) {
        if (auto f = scheduler.fatalError())
            summary.fatal = std::move(f);
    }
    if (summary.fatal)
        notifyFatal(*summary.fatal);

    if (config_.saveInfo && !summary.fatal) {
        auto p = writeCreatorProfile(config_.outputRoot, target, cursor.creatorName(),
                                     cursor.totalCount());
        if (!p.ok())
            spdlog::warn("Could not write creator profile: {}", p.error().message);
    }

    summary.malformed = cursor.malformedEntries();
    summary.dispatched = scheduler.dispatched();
    summary.interrupted = stopRequested();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("{}: {} post(s), {} file(s): {} downloaded, {} skipped, {} failed in {} ms",
                 target.key(), summary.posts, summary.descriptors, summary.completed,
                 summary.skipped, summary.failed, summary.elapsed.count());
    return summary;
}

} // namespace kfetch::crawl
