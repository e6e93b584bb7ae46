#include <kfetch/crawl/download_scheduler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace kfetch::crawl {

namespace fs = std::filesystem;

DownloadScheduler::DownloadScheduler(SchedulerConfig config, ITransferWorker& worker,
                                     ledger::IProgressLedger& ledger, ResultCallback onResult)
    : config_(std::move(config)), worker_(worker), ledger_(ledger),
      onResult_(std::move(onResult)) {
    config_.concurrency = std::max<std::size_t>(1, config_.concurrency);
    capacity_ = config_.queueCapacity ? config_.queueCapacity : 2 * config_.concurrency;

    threads_.reserve(config_.concurrency);
    for (std::size_t i = 0; i < config_.concurrency; ++i) {
        threads_.emplace_back([this] { workerLoop(); });
    }
    spdlog::debug("DownloadScheduler started with {} worker(s), per-host cap {}",
                  config_.concurrency, config_.perHostLimit);
}

DownloadScheduler::~DownloadScheduler() {
    requestStop();
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
}

void DownloadScheduler::requestStop() noexcept {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stop_.exchange(true, std::memory_order_acq_rel))
            return;
        if (!queue_.empty())
            spdlog::info("Stop requested: dropping {} queued file(s)", queue_.size());
        queue_.clear();
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
    hostFree_.notify_all();
}

std::optional<Error> DownloadScheduler::fatalError() const {
    std::lock_guard<std::mutex> lk(resultMutex_);
    return fatal_;
}

bool DownloadScheduler::alreadyComplete(const FileDescriptor& d, const fs::path& finalPath,
                                        TransferResult& skipped) {
    auto entry = ledger_.lookup(config_.target.key(), d.postId, d.filename);
    if (!entry)
        return false;

    std::error_code ec;
    auto onDisk = fs::file_size(finalPath, ec);
    if (!ec && static_cast<std::uint64_t>(onDisk) == entry->size) {
        skipped.descriptor = d;
        skipped.outcome = TransferOutcome::Skipped;
        skipped.finalPath = finalPath;
        return true;
    }

    if (ec) {
        spdlog::info("{} is recorded complete but missing on disk; downloading again",
                     finalPath.string());
    } else {
        spdlog::info("{} is recorded with {} bytes but has {}; downloading again",
                     finalPath.string(), entry->size, onDisk);
    }
    auto inv = ledger_.invalidate(config_.target.key(), d.postId, d.filename);
    if (!inv.ok()) {
        // Cannot reconcile the ledger with the disk: treat like any other local I/O failure
        skipped.descriptor = d;
        skipped.outcome = TransferOutcome::Failed;
        skipped.error = inv.error();
        skipped.finalPath = finalPath;
        skipped.abortsRun = true;
        return true;
    }
    return false;
}

bool DownloadScheduler::submit(FileDescriptor descriptor) {
    if (stopRequested())
        return false;

    const std::string triple = descriptor.postId + '\x1f' + descriptor.filename;
    if (!submitted_.insert(triple).second) {
        spdlog::debug("Ignoring duplicate descriptor {}/{}", descriptor.postId,
                      descriptor.filename);
        return true;
    }

    fs::path finalPath =
        finalPathFor(config_.outputRoot, config_.target, descriptor.postId, descriptor.filename);

    TransferResult immediate;
    if (alreadyComplete(descriptor, finalPath, immediate)) {
        deliver(immediate);
        return !stopRequested();
    }

    {
        std::unique_lock<std::mutex> lk(mutex_);
        notFull_.wait(lk, [this] { return stopRequested() || queue_.size() < capacity_; });
        if (stopRequested())
            return false;
        queue_.push_back(Job{std::move(descriptor), std::move(finalPath)});
    }
    notEmpty_.notify_one();
    return true;
}

void DownloadScheduler::finish() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closing_ = true;
    }
    notEmpty_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
}

void DownloadScheduler::workerLoop() {
    while (true) {
        Job job;
        std::string host;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            notEmpty_.wait(lk, [this] { return stopRequested() || closing_ || !queue_.empty(); });
            if (stopRequested())
                return;
            if (queue_.empty()) {
                if (closing_)
                    return;
                continue;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            notFull_.notify_one();

            host = job.descriptor.host;
            if (config_.perHostLimit > 0) {
                hostFree_.wait(lk, [&] {
                    return stopRequested() || hostActive_[host] < config_.perHostLimit;
                });
                if (stopRequested())
                    return;
            }
            ++hostActive_[host];
        }

        TransferContext ctx;
        ctx.creatorKey = config_.target.key();
        ctx.finalPath = job.finalPath;
        ctx.deadline = std::chrono::steady_clock::now() + config_.transferDeadline;
        ctx.stopRequested = &stop_;

        dispatched_.fetch_add(1, std::memory_order_relaxed);
        TransferResult result = worker_.transfer(job.descriptor, ctx);

        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (auto it = hostActive_.find(host); it != hostActive_.end() && it->second > 0)
                --it->second;
        }
        hostFree_.notify_all();

        deliver(result);
    }
}

void DownloadScheduler::deliver(const TransferResult& result) {
    std::optional<std::string> abortReason;
    {
        std::lock_guard<std::mutex> lk(resultMutex_);
        if (result.abortsRun && !fatal_) {
            fatal_ = result.error ? *result.error
                                  : Error{ErrorCode::IoError, "local I/O failure"};
            abortReason = fatal_->message;
        }
        if (onResult_)
            onResult_(result);
    }
    if (abortReason) {
        spdlog::error("Aborting run: {}", *abortReason);
        requestStop();
    }
}

} // namespace kfetch::crawl
