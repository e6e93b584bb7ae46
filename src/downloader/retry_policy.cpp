#include <kfetch/downloader/retry_policy.hpp>

#include <algorithm>
#include <cmath>
#include <thread>

namespace kfetch::downloader {

RetryDecision RetryPolicy::classify(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
        case ErrorCode::RateLimited:
            return RetryDecision::Retryable;
        case ErrorCode::Unknown:
            // Unmapped transport failures; a status code decides when there is one
            if (error.httpStatus && *error.httpStatus >= 400 && *error.httpStatus < 500)
                return RetryDecision::Fatal;
            return RetryDecision::Retryable;
        default:
            return RetryDecision::Fatal;
    }
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int attempt) const noexcept {
    if (attempt < 1)
        attempt = 1;
    const double base = static_cast<double>(initialBackoff.count());
    const double mult = multiplier < 1.0 ? 1.0 : multiplier;
    const double cap = static_cast<double>(maxBackoff.count());
    const double raw = base * std::pow(mult, attempt - 1);
    if (!std::isfinite(raw) || raw >= cap)
        return maxBackoff;
    return std::chrono::milliseconds(static_cast<std::int64_t>(raw));
}

bool RetrySequence::begin() noexcept {
    if (state_ == State::Succeeded || state_ == State::Failed)
        return false;
    if (attempt_ >= std::max(1, policy_.maxAttempts)) {
        exhausted_ = true;
        state_ = State::Failed;
        return false;
    }
    ++attempt_;
    state_ = State::Attempting;
    delay_ = std::chrono::milliseconds{0};
    return true;
}

std::optional<std::chrono::milliseconds> RetrySequence::onFailure(const Error& error) noexcept {
    if (RetryPolicy::classify(error) == RetryDecision::Fatal) {
        state_ = State::Failed;
        return std::nullopt;
    }
    if (attempt_ >= std::max(1, policy_.maxAttempts)) {
        exhausted_ = true;
        state_ = State::Failed;
        return std::nullopt;
    }
    delay_ = policy_.backoffDelay(attempt_);
    state_ = State::Waiting;
    return delay_;
}

bool waitBackoff(std::chrono::milliseconds delay, const ShouldCancel& shouldStop) {
    constexpr auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (shouldStop && shouldStop())
            return false;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
}

} // namespace kfetch::downloader
