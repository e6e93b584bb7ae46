#pragma once

#include <kfetch/downloader/downloader.hpp>

#include <chrono>
#include <optional>

namespace kfetch::downloader {

enum class RetryDecision { Retryable, Fatal };

/**
 * Retry/backoff policy shared by the page fetcher and the transfer worker.
 *
 * Timeouts, connection-level failures, HTTP 5xx and 429 are retryable; everything
 * else (4xx, authentication, TLS verification, local I/O, verification mismatches)
 * is fatal. Backoff is initialBackoff * multiplier^(attempt-1), capped at maxBackoff.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    [[nodiscard]] static RetryDecision classify(const Error& error) noexcept;

    /**
     * Delay to wait after failed attempt number `attempt` (1-based).
     */
    [[nodiscard]] std::chrono::milliseconds backoffDelay(int attempt) const noexcept;
};

/**
 * One descriptor's (or one page's) walk through the retry policy.
 *
 *   Ready --begin()--> Attempting --onSuccess()--> Succeeded
 *                          |
 *                      onFailure()
 *                          |-- retryable, attempts left --> Waiting(delay) --begin()--> ...
 *                          |-- fatal or exhausted --------> Failed
 */
class RetrySequence {
public:
    enum class State { Ready, Attempting, Waiting, Succeeded, Failed };

    explicit RetrySequence(RetryPolicy policy) : policy_(policy) {}

    /**
     * Start the next attempt. Returns false once the sequence is terminal.
     */
    bool begin() noexcept;

    void onSuccess() noexcept { state_ = State::Succeeded; }

    /**
     * Record a failed attempt. Returns the delay before the next attempt, or nullopt
     * when the failure is fatal or the attempt budget is spent.
     */
    std::optional<std::chrono::milliseconds> onFailure(const Error& error) noexcept;

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] int attempts() const noexcept { return attempt_; }
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }
    [[nodiscard]] std::chrono::milliseconds nextDelay() const noexcept { return delay_; }

private:
    RetryPolicy policy_;
    State state_{State::Ready};
    int attempt_{0};
    bool exhausted_{false};
    std::chrono::milliseconds delay_{0};
};

/**
 * Sleep for `delay` in short slices. Returns false if shouldStop() fired first.
 */
bool waitBackoff(std::chrono::milliseconds delay, const ShouldCancel& shouldStop);

} // namespace kfetch::downloader
