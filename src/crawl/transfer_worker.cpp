#include <kfetch/crawl/transfer_worker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <utility>

namespace kfetch::crawl {

namespace fs = std::filesystem;
using downloader::RetryDecision;
using downloader::RetryPolicy;
using downloader::RetrySequence;

TransferWorker::TransferWorker(downloader::IHttpAdapter& http, downloader::IDiskWriter& disk,
                               downloader::IRateLimiter* limiter, ledger::IProgressLedger& ledger,
                               TransferConfig config)
    : http_(http), disk_(disk), limiter_(limiter), ledger_(ledger), config_(std::move(config)) {}

Expected<void> TransferWorker::hashExisting(const fs::path& staging, std::uint64_t size,
                                            downloader::IIntegrityVerifier& verifier) const {
    std::ifstream in(staging, std::ios::binary);
    if (!in.good())
        return Error{ErrorCode::IoError, "Failed to read staging file: " + staging.string()};
    std::array<char, 64 * 1024> buf{};
    std::uint64_t remaining = size;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buf.size()));
        in.read(buf.data(), want);
        if (in.gcount() != want)
            return Error{ErrorCode::IoError, "Short read on staging file: " + staging.string()};
        verifier.update(std::as_bytes(std::span<const char>(buf.data(), static_cast<std::size_t>(want))));
        remaining -= static_cast<std::uint64_t>(want);
    }
    return {};
}

Expected<TransferWorker::AttemptOutcome>
TransferWorker::attemptOnce(const FileDescriptor& d, const TransferContext& ctx, bool keepPartial,
                            AttemptOutcome& progress) {
    progress = AttemptOutcome{};

    std::uint64_t existing = 0;
    auto staged = disk_.openStagingFile(ctx.finalPath, keepPartial, existing);
    if (!staged.ok())
        return staged.error();
    const fs::path staging = staged.value();

    // A staging file longer than the known size cannot be a prefix of it
    if (d.expectedBytes && existing > *d.expectedBytes) {
        auto t = disk_.truncate(staging, 0);
        if (!t.ok())
            return t.error();
        existing = 0;
    }

    auto verifier = d.expectedSha256 ? downloader::makeIntegrityVerifierSha256() : nullptr;
    if (verifier && existing > 0) {
        auto h = hashExisting(staging, existing, *verifier);
        if (!h.ok())
            return h.error();
    }

    const std::uint64_t offset = existing;
    progress.resumedFrom = offset;
    std::uint64_t written = offset;
    std::optional<std::uint64_t> announcedTotal;
    if (offset > 0)
        spdlog::debug("Resuming {} from byte {}", d.filename, offset);

    auto onResponse = [&](const downloader::ResponseInfo& info) -> Expected<void> {
        if (offset > 0 && !info.partialContent) {
            spdlog::debug("{} ignored the range request; restarting {} from zero", d.host,
                          d.filename);
            auto t = disk_.truncate(staging, 0);
            if (!t.ok())
                return t;
            written = 0;
            if (verifier)
                verifier->reset();
        }
        if (info.contentLength)
            announcedTotal = (info.partialContent ? offset : 0) + *info.contentLength;
        return {};
    };

    auto cancel = [&ctx]() { return ctx.deadlineExceeded(); };

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        if (limiter_)
            limiter_->acquire(d.host, data.size(), cancel);
        auto w = disk_.writeAt(staging, written, data);
        if (!w.ok())
            return w;
        if (verifier)
            verifier->update(data);
        written += data.size();
        progress.received += data.size();
        return {};
    };

    auto r = http_.get(d.url, config_.headers, offset, config_.request, onResponse, sink, cancel);
    progress.fileSize = written;
    if (!r.ok()) {
        if (r.error().code == ErrorCode::Cancelled && ctx.deadlineExceeded()) {
            return Error{ErrorCode::Timeout, "transfer deadline exceeded for " + d.url};
        }
        return r.error();
    }

    if (d.expectedBytes && written != *d.expectedBytes) {
        return Error{ErrorCode::SizeMismatch, "expected " + std::to_string(*d.expectedBytes) +
                                                  " bytes, received " + std::to_string(written)};
    }
    if (announcedTotal && written != *announcedTotal) {
        return Error{ErrorCode::SizeMismatch, "Content-Length announced " +
                                                  std::to_string(*announcedTotal) +
                                                  " bytes, received " + std::to_string(written)};
    }
    if (verifier) {
        auto sum = verifier->finalize();
        if (sum.hex != *d.expectedSha256) {
            return Error{ErrorCode::ChecksumMismatch,
                         "sha256 " + (sum.hex.empty() ? std::string("unavailable") : sum.hex) +
                             " does not match " + *d.expectedSha256};
        }
    }

    auto s = disk_.sync(staging);
    if (!s.ok())
        return s.error();
    auto p = disk_.promote(staging, ctx.finalPath);
    if (!p.ok())
        return p.error();
    return progress;
}

TransferResult TransferWorker::transfer(const FileDescriptor& d, const TransferContext& ctx) {
    TransferResult result;
    result.descriptor = d;
    result.finalPath = ctx.finalPath;

    RetrySequence seq(config_.retry);
    bool keepPartial = config_.resumePartial;
    std::optional<Error> lastError;
    std::uint64_t received = 0;

    auto stopWaiting = [&ctx]() { return ctx.stopping() || ctx.deadlineExceeded(); };

    while (true) {
        if (ctx.deadlineExceeded()) {
            lastError = Error{ErrorCode::Timeout, "transfer deadline exceeded for " + d.url};
            break;
        }
        // A stop lets the attempt in progress finish but starts no new one
        if (seq.attempts() > 0 && ctx.stopping())
            break;
        if (!seq.begin())
            break;

        AttemptOutcome progress;
        auto r = attemptOnce(d, ctx, keepPartial, progress);
        received += progress.received;
        if (r.ok()) {
            seq.onSuccess();
            auto mark = ledger_.markComplete(ctx.creatorKey, d.postId, d.filename,
                                             r.value().fileSize);
            result.attempts = seq.attempts();
            result.bytesWritten = received;
            if (!mark.ok()) {
                result.outcome = TransferOutcome::Failed;
                result.error = mark.error();
                result.abortsRun = true;
                return result;
            }
            result.outcome = TransferOutcome::Success;
            spdlog::info("Downloaded {} ({} bytes)", ctx.finalPath.string(), r.value().fileSize);
            return result;
        }

        Error err = r.error();
        lastError = err;

        if (err.code == ErrorCode::IoError) {
            result.abortsRun = true;
            break;
        }
        if (err.code == ErrorCode::SizeMismatch || err.code == ErrorCode::ChecksumMismatch) {
            disk_.cleanup(disk_.stagingPathFor(ctx.finalPath));
            break;
        }
        // The staging file no longer matches the remote: start over from zero
        if (err.httpStatus && *err.httpStatus == 416 && progress.resumedFrom > 0) {
            spdlog::debug("Range not satisfiable for {}; discarding partial data", d.filename);
            disk_.cleanup(disk_.stagingPathFor(ctx.finalPath));
            keepPartial = false;
            continue;
        }

        auto delay = seq.onFailure(err);
        if (!delay)
            break;
        keepPartial = config_.resumePartial;
        if (ctx.stopping())
            break;
        spdlog::warn("Attempt {} for {} failed ({}), retrying in {} ms", seq.attempts(), d.url,
                     err.message, delay->count());
        if (!downloader::waitBackoff(*delay, stopWaiting))
            continue; // loop head reports the deadline or honours the stop
    }

    result.outcome = TransferOutcome::Failed;
    result.attempts = seq.attempts();
    result.bytesWritten = received;
    result.error = lastError ? *lastError
                             : Error{ErrorCode::Cancelled, "stopped before the first attempt"};

    const bool keepForResume = config_.resumePartial && !result.abortsRun &&
                               RetryPolicy::classify(*result.error) == RetryDecision::Retryable;
    if (!keepForResume)
        disk_.cleanup(disk_.stagingPathFor(ctx.finalPath));

    spdlog::warn("Failed {} after {} attempt(s): {} ({})", d.url, result.attempts,
                 result.error->message, downloader::errorCodeName(result.error->code));
    return result;
}

} // namespace kfetch::crawl
