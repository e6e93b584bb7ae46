/*
 * kfetch/src/downloader/rate_limiter.cpp
 *
 * Token-bucket bandwidth limiter
 * - One global bucket (limits.globalBps) shared by every transfer
 * - One bucket per remote host (limits.perHostBps), created on first use
 * - No-ops when both limits are zero (unlimited)
 * - Cooperative cancellation via ShouldCancel
 *
 * Buckets hold at most one second of allowance; tokens are doubles so partial
 * bytes accumulate between sleeps. Thread-safe for concurrent acquire() calls.
 */

#include <kfetch/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace kfetch::downloader {

namespace {

using clock_t = std::chrono::steady_clock;

struct Bucket {
    double rate_bps{0.0}; // 0 => unlimited
    double capacity{0.0};
    double tokens{0.0};
    clock_t::time_point last_refill{clock_t::now()};

    void init(double rate, clock_t::time_point now) {
        rate_bps = rate;
        capacity = rate > 0.0 ? rate : 0.0;
        tokens = capacity;
        last_refill = now;
    }

    void refill(clock_t::time_point now) {
        if (rate_bps <= 0.0) {
            last_refill = now;
            return;
        }
        const auto dt = std::chrono::duration<double>(now - last_refill).count();
        if (dt <= 0.0)
            return;
        tokens = std::min(capacity, tokens + rate_bps * dt);
        last_refill = now;
    }

    // Seconds until 'bytes' can be taken (0 when available now or unlimited)
    double waitFor(double bytes) const {
        if (rate_bps <= 0.0)
            return 0.0;
        // A request larger than the burst only needs a full bucket
        const double need = std::min(bytes, capacity) - tokens;
        return need > 0.0 ? need / rate_bps : 0.0;
    }

    void take(double bytes) {
        if (rate_bps <= 0.0)
            return;
        tokens = std::max(0.0, tokens - bytes);
    }
};

class TokenBucketLimiter final : public IRateLimiter {
public:
    void setLimits(const RateLimit& limit) override {
        std::lock_guard<std::mutex> lk(mutex_);
        limits_ = limit;
        global_.init(static_cast<double>(limits_.globalBps), clock_t::now());
        hosts_.clear();
    }

    void acquire(std::string_view host, std::uint64_t bytes,
                 const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return;
        const double want = static_cast<double>(bytes);

        while (true) {
            if (shouldCancel && shouldCancel())
                return;

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (limits_.globalBps == 0 && limits_.perHostBps == 0)
                    return;

                const auto now = clock_t::now();
                Bucket* perHost = hostBucket(host, now);
                global_.refill(now);
                if (perHost)
                    perHost->refill(now);

                wait_seconds =
                    std::max(global_.waitFor(want), perHost ? perHost->waitFor(want) : 0.0);
                if (wait_seconds <= 0.0) {
                    global_.take(want);
                    if (perHost)
                        perHost->take(want);
                    return;
                }
            }

            // Sleep in small increments to allow cancel checks
            constexpr auto max_slice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, std::chrono::milliseconds(max_slice)));
            }
        }
    }

private:
    Bucket* hostBucket(std::string_view host, clock_t::time_point now) {
        if (limits_.perHostBps == 0)
            return nullptr;
        auto [it, inserted] = hosts_.try_emplace(std::string(host));
        if (inserted)
            it->second.init(static_cast<double>(limits_.perHostBps), now);
        return &it->second;
    }

    std::mutex mutex_;
    RateLimit limits_{};
    Bucket global_{};
    std::unordered_map<std::string, Bucket> hosts_;
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_unique<TokenBucketLimiter>();
}

} // namespace kfetch::downloader
