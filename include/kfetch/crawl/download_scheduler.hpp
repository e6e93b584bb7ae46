#pragma once

#include <kfetch/crawl/types.hpp>
#include <kfetch/ledger/progress_ledger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kfetch::crawl {

/**
 * Per-dispatch facts handed to a worker.
 */
struct TransferContext {
    std::string creatorKey;
    std::filesystem::path finalPath;
    std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
    const std::atomic<bool>* stopRequested{nullptr};

    [[nodiscard]] bool deadlineExceeded() const {
        return std::chrono::steady_clock::now() >= deadline;
    }
    [[nodiscard]] bool stopping() const {
        return stopRequested && stopRequested->load(std::memory_order_acquire);
    }
};

class ITransferWorker {
public:
    virtual ~ITransferWorker() = default;

    /**
     * Transfer one descriptor to ctx.finalPath, record it in the ledger, and report.
     * Called concurrently from scheduler threads.
     */
    virtual TransferResult transfer(const FileDescriptor& descriptor,
                                    const TransferContext& ctx) = 0;
};

struct SchedulerConfig {
    CreatorTarget target;
    std::filesystem::path outputRoot;
    std::size_t concurrency{4};
    std::size_t perHostLimit{0}; // 0 = no per-host cap
    std::chrono::milliseconds transferDeadline{std::chrono::minutes(30)};
    std::size_t queueCapacity{0}; // 0 = 2 * concurrency
};

/**
 * Bounded task queue in front of a fixed set of worker threads.
 *
 * Descriptors are dispatched first-in first-out. submit() consults the ledger and
 * reports Skipped immediately for triples already complete on disk; it blocks while
 * the queue is full. Results are delivered to the callback one at a time.
 *
 * requestStop() drains: queued descriptors are dropped without a result, workers
 * finish the transfer they are on.
 */
class DownloadScheduler {
public:
    using ResultCallback = std::function<void(const TransferResult&)>;

    DownloadScheduler(SchedulerConfig config, ITransferWorker& worker,
                      ledger::IProgressLedger& ledger, ResultCallback onResult);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    /**
     * Returns false once the scheduler is stopping; the descriptor is then dropped.
     */
    bool submit(FileDescriptor descriptor);

    /**
     * Wait for every queued and in-flight transfer, then join the workers.
     */
    void finish();

    void requestStop() noexcept;

    [[nodiscard]] bool stopRequested() const noexcept {
        return stop_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::size_t dispatched() const noexcept { return dispatched_.load(); }

    // First run-aborting error reported by a worker, if any
    [[nodiscard]] std::optional<Error> fatalError() const;

private:
    struct Job {
        FileDescriptor descriptor;
        std::filesystem::path finalPath;
    };

    void workerLoop();
    void deliver(const TransferResult& result);
    bool alreadyComplete(const FileDescriptor& d, const std::filesystem::path& finalPath,
                         TransferResult& skipped);

    SchedulerConfig config_;
    ITransferWorker& worker_;
    ledger::IProgressLedger& ledger_;
    ResultCallback onResult_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::condition_variable hostFree_;
    std::deque<Job> queue_;
    std::unordered_map<std::string, std::size_t> hostActive_;
    bool closing_{false};
    std::atomic<bool> stop_{false};
    std::vector<std::thread> threads_;

    std::unordered_set<std::string> submitted_; // coordinating thread only
    std::atomic<std::size_t> dispatched_{0};

    mutable std::mutex resultMutex_;
    std::optional<Error> fatal_;
};

} // namespace kfetch::crawl
