#pragma once

#include <kfetch/crawl/download_scheduler.hpp>
#include <kfetch/crawl/types.hpp>
#include <kfetch/downloader/downloader.hpp>
#include <kfetch/downloader/retry_policy.hpp>
#include <kfetch/ledger/progress_ledger.h>

#include <filesystem>
#include <vector>

namespace kfetch::crawl {

struct TransferConfig {
    downloader::RequestOptions request{};
    std::vector<downloader::Header> headers;
    downloader::RetryPolicy retry{};
    bool resumePartial{true}; // continue an existing .part with a Range request
};

/**
 * Downloads one descriptor: stage as "<final>.part", verify size and SHA-256,
 * fsync, rename onto the final path, record the triple in the ledger, report.
 *
 * Retries happen here, so one descriptor holds one scheduler slot across all of its
 * attempts. A stop request lets the current attempt finish but prevents new ones.
 */
class TransferWorker final : public ITransferWorker {
public:
    TransferWorker(downloader::IHttpAdapter& http, downloader::IDiskWriter& disk,
                   downloader::IRateLimiter* limiter, ledger::IProgressLedger& ledger,
                   TransferConfig config);

    TransferResult transfer(const FileDescriptor& descriptor, const TransferContext& ctx) override;

private:
    struct AttemptOutcome {
        std::uint64_t fileSize{0};
        std::uint64_t received{0};
        std::uint64_t resumedFrom{0};
    };

    Expected<AttemptOutcome> attemptOnce(const FileDescriptor& d, const TransferContext& ctx,
                                         bool keepPartial, AttemptOutcome& progress);
    Expected<void> hashExisting(const std::filesystem::path& staging, std::uint64_t size,
                                downloader::IIntegrityVerifier& verifier) const;

    downloader::IHttpAdapter& http_;
    downloader::IDiskWriter& disk_;
    downloader::IRateLimiter* limiter_;
    ledger::IProgressLedger& ledger_;
    TransferConfig config_;
};

} // namespace kfetch::crawl
