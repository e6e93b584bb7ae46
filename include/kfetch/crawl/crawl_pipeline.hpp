#pragma once

#include <kfetch/crawl/media_extractor.hpp>
#include <kfetch/crawl/page_fetcher.hpp>
#include <kfetch/crawl/scope.hpp>
#include <kfetch/crawl/transfer_worker.hpp>
#include <kfetch/crawl/types.hpp>
#include <kfetch/downloader/downloader.hpp>
#include <kfetch/ledger/progress_ledger.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>

namespace kfetch::crawl {

class DownloadScheduler;

struct PipelineConfig {
    std::filesystem::path outputRoot{"downloads"};
    std::size_t concurrency{4};
    std::size_t perHostLimit{0};
    std::chrono::milliseconds transferDeadline{std::chrono::minutes(30)};
    downloader::RateLimit rateLimit{};

    FetchOptions fetch{};
    ExtractorOptions extract{}; // fallbackServer defaults to https://<site>
    TransferConfig transfer{};
    CrawlScope scope{};

    bool processFromOldest{false}; // read the whole listing, then download oldest first
    bool saveInfo{false};          // write .posts/<id>.json and profile.json
    bool includeEmptyPosts{false}; // with saveInfo, also describe posts without files
};

/**
 * PageFetcher -> MediaExtractor -> DownloadScheduler -> TransferWorker for one target.
 *
 * Optional collaborators left null are created for the run (disk writer) or skipped
 * (rate limiter, when no limit is configured).
 */
class CrawlPipeline {
public:
    CrawlPipeline(PipelineConfig config, downloader::IHttpAdapter& http,
                  ledger::IProgressLedger& ledger, IRunObserver* observer = nullptr,
                  downloader::IDiskWriter* disk = nullptr,
                  downloader::IRateLimiter* limiter = nullptr);

    RunSummary run(const CreatorTarget& target);

    // Safe from any thread, including a signal watcher. Reaches the running scheduler
    // immediately: queued files are dropped and no further attempts start.
    void requestStop() noexcept;
    [[nodiscard]] bool stopRequested() const noexcept {
        return stop_.load(std::memory_order_acquire);
    }

private:
    void attachScheduler(DownloadScheduler* scheduler);
    void notifyPost(const PostRecord& post, std::size_t count);
    void notifyFatal(const Error& error);

    PipelineConfig config_;
    downloader::IHttpAdapter& http_;
    ledger::IProgressLedger& ledger_;
    IRunObserver* observer_;
    downloader::IDiskWriter* disk_;
    downloader::IRateLimiter* limiter_;

    std::unique_ptr<downloader::IDiskWriter> ownedDisk_;
    std::unique_ptr<downloader::IRateLimiter> ownedLimiter_;

    std::mutex observerMutex_;
    std::atomic<bool> stop_{false};

    std::mutex schedulerMutex_;
    DownloadScheduler* scheduler_{nullptr}; // live only inside run()
};

} // namespace kfetch::crawl
