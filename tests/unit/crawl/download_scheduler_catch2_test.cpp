#include <catch2/catch_test_macros.hpp>

#include <kfetch/crawl/download_scheduler.hpp>
#include <kfetch/ledger/progress_ledger.h>

#include "common/test_helpers_catch2.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace kfetch::crawl;
using kfetch::downloader::Error;
using kfetch::downloader::ErrorCode;
using kfetch::test::TempDir;
using kfetch::test::write_file;
using namespace std::chrono_literals;

namespace {

FileDescriptor fd(const std::string& post, const std::string& name,
                  const std::string& host = "n1.kemono.test") {
    FileDescriptor d;
    d.url = "https://" + host + "/data/" + post + "/" + name;
    d.filename = name;
    d.postId = post;
    d.host = host;
    return d;
}

// Writes a small file and records what it was asked to do
class RecordingWorker final : public ITransferWorker {
public:
    std::chrono::milliseconds delay{0};
    std::function<void(const FileDescriptor&)> onStart;
    std::function<TransferResult(const FileDescriptor&, const TransferContext&)> override_;

    TransferResult transfer(const FileDescriptor& d, const TransferContext& ctx) override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            order_.push_back(d.filename);
            contexts_.push_back(ctx);
            ++active_[d.host];
            ++activeTotal_;
            maxPerHost_[d.host] = std::max(maxPerHost_[d.host], active_[d.host]);
            maxTotal_ = std::max(maxTotal_, activeTotal_);
        }
        if (onStart)
            onStart(d);
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);

        TransferResult r;
        if (override_) {
            r = override_(d, ctx);
        } else {
            write_file(ctx.finalPath, "data");
            r.descriptor = d;
            r.outcome = TransferOutcome::Success;
            r.finalPath = ctx.finalPath;
            r.bytesWritten = 4;
            r.attempts = 1;
        }
        std::lock_guard<std::mutex> lk(mutex_);
        --active_[d.host];
        --activeTotal_;
        return r;
    }

    std::vector<std::string> order() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return order_;
    }
    std::vector<TransferContext> contexts() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return contexts_;
    }
    std::size_t maxTotal() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return maxTotal_;
    }
    std::size_t maxPerHost(const std::string& host) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = maxPerHost_.find(host);
        return it == maxPerHost_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::vector<TransferContext> contexts_;
    std::map<std::string, std::size_t> active_;
    std::map<std::string, std::size_t> maxPerHost_;
    std::size_t activeTotal_{0};
    std::size_t maxTotal_{0};
};

struct Collected {
    std::mutex mutex;
    std::vector<TransferResult> results;

    DownloadScheduler::ResultCallback callback() {
        return [this](const TransferResult& r) {
            std::lock_guard<std::mutex> lk(mutex);
            results.push_back(r);
        };
    }
    std::size_t count(TransferOutcome o) {
        std::lock_guard<std::mutex> lk(mutex);
        return static_cast<std::size_t>(std::count_if(
            results.begin(), results.end(), [o](const TransferResult& r) { return r.outcome == o; }));
    }
};

SchedulerConfig configFor(const fs::path& root, std::size_t concurrency) {
    SchedulerConfig c;
    c.target = CreatorTarget{"kemono.test", "patreon", "42"};
    c.outputRoot = root;
    c.concurrency = concurrency;
    return c;
}

} // namespace

TEST_CASE("DownloadScheduler: dispatch order and contexts", "[crawl][scheduler]") {
    TempDir tmp("kfetch_sched_");
    auto ledger = kfetch::ledger::makeInMemoryLedger();
    RecordingWorker worker;
    Collected collected;

    SECTION("Single worker runs descriptors first-in first-out") {
        DownloadScheduler sched(configFor(tmp.path(), 1), worker, *ledger, collected.callback());
        for (int i = 0; i < 6; ++i)
            REQUIRE(sched.submit(fd("1", "f" + std::to_string(i) + ".jpg")));
        sched.finish();
        CHECK(worker.order() ==
              std::vector<std::string>{"f0.jpg", "f1.jpg", "f2.jpg", "f3.jpg", "f4.jpg", "f5.jpg"});
        CHECK(sched.dispatched() == 6);
        CHECK(collected.count(TransferOutcome::Success) == 6);
    }

    SECTION("Workers receive the destination, creator key and a deadline") {
        auto cfg = configFor(tmp.path(), 2);
        cfg.transferDeadline = 5min;
        DownloadScheduler sched(cfg, worker, *ledger, collected.callback());
        const auto before = std::chrono::steady_clock::now();
        REQUIRE(sched.submit(fd("1001", "a.jpg")));
        sched.finish();
        auto ctxs = worker.contexts();
        REQUIRE(ctxs.size() == 1);
        CHECK(ctxs[0].creatorKey == "patreon/42");
        CHECK(ctxs[0].finalPath == tmp.path() / "patreon" / "42" / "1001" / "a.jpg");
        CHECK(ctxs[0].deadline >= before + 5min);
        CHECK(ctxs[0].deadline <= std::chrono::steady_clock::now() + 5min);
    }

    SECTION("A triple submitted twice runs once") {
        DownloadScheduler sched(configFor(tmp.path(), 2), worker, *ledger, collected.callback());
        REQUIRE(sched.submit(fd("1", "same.jpg")));
        REQUIRE(sched.submit(fd("1", "same.jpg")));
        REQUIRE(sched.submit(fd("2", "same.jpg")));
        sched.finish();
        CHECK(sched.dispatched() == 2);
        CHECK(collected.results.size() == 2);
    }
}

TEST_CASE("DownloadScheduler: ledger consultation", "[crawl][scheduler][ledger]") {
    TempDir tmp("kfetch_sched_ledger_");
    auto ledger = kfetch::ledger::makeInMemoryLedger();
    RecordingWorker worker;
    Collected collected;
    const fs::path existing = tmp.path() / "patreon" / "42" / "1" / "done.jpg";

    SECTION("Complete and present on disk: skipped without dispatch") {
        write_file(existing, "12345");
        REQUIRE(ledger->markComplete("patreon/42", "1", "done.jpg", 5).ok());
        DownloadScheduler sched(configFor(tmp.path(), 2), worker, *ledger, collected.callback());
        REQUIRE(sched.submit(fd("1", "done.jpg")));
        sched.finish();
        CHECK(sched.dispatched() == 0);
        REQUIRE(collected.results.size() == 1);
        CHECK(collected.results[0].outcome == TransferOutcome::Skipped);
        CHECK(collected.results[0].finalPath == existing);
    }

    SECTION("Recorded but missing on disk: downloaded again") {
        REQUIRE(ledger->markComplete("patreon/42", "1", "done.jpg", 5).ok());
        DownloadScheduler sched(configFor(tmp.path(), 2), worker, *ledger, collected.callback());
        REQUIRE(sched.submit(fd("1", "done.jpg")));
        sched.finish();
        CHECK(sched.dispatched() == 1);
        CHECK(collected.count(TransferOutcome::Success) == 1);
        CHECK_FALSE(ledger->isComplete("patreon/42", "1", "done.jpg"));
    }

    SECTION("Recorded with a different size: downloaded again") {
        write_file(existing, "123");
        REQUIRE(ledger->markComplete("patreon/42", "1", "done.jpg", 5).ok());
        DownloadScheduler sched(configFor(tmp.path(), 2), worker, *ledger, collected.callback());
        REQUIRE(sched.submit(fd("1", "done.jpg")));
        sched.finish();
        CHECK(sched.dispatched() == 1);
    }

    SECTION("Ledger of another creator does not count") {
        write_file(existing, "12345");
        REQUIRE(ledger->markComplete("fanbox/42", "1", "done.jpg", 5).ok());
        DownloadScheduler sched(configFor(tmp.path(), 2), worker, *ledger, collected.callback());
        REQUIRE(sched.submit(fd("1", "done.jpg")));
        sched.finish();
        CHECK(sched.dispatched() == 1);
    }
}

TEST_CASE("DownloadScheduler: concurrency limits", "[crawl][scheduler][concurrency]") {
    TempDir tmp("kfetch_sched_conc_");
    auto ledger = kfetch::ledger::makeInMemoryLedger();
    RecordingWorker worker;
    worker.delay = 40ms;
    Collected collected;

    SECTION("Never more than the configured workers") {
        DownloadScheduler sched(configFor(tmp.path(), 3), worker, *ledger, collected.callback());
        for (int i = 0; i < 12; ++i)
            REQUIRE(sched.submit(fd("1", std::to_string(i) + ".bin")));
        sched.finish();
        CHECK(worker.maxTotal() <= 3);
        CHECK(worker.maxTotal() >= 2);
        CHECK(collected.results.size() == 12);
    }

    SECTION("Per-host cap") {
        auto cfg = configFor(tmp.path(), 4);
        cfg.perHostLimit = 1;
        DownloadScheduler sched(cfg, worker, *ledger, collected.callback());
        for (int i = 0; i < 6; ++i) {
            REQUIRE(sched.submit(fd("1", "a" + std::to_string(i), "n1.kemono.test")));
            REQUIRE(sched.submit(fd("1", "b" + std::to_string(i), "n2.kemono.test")));
        }
        sched.finish();
        CHECK(worker.maxPerHost("n1.kemono.test") == 1);
        CHECK(worker.maxPerHost("n2.kemono.test") == 1);
        CHECK(worker.maxTotal() <= 2);
        CHECK(collected.results.size() == 12);
    }
}

TEST_CASE("DownloadScheduler: stopping", "[crawl][scheduler][stop]") {
    TempDir tmp("kfetch_sched_stop_");
    auto ledger = kfetch::ledger::makeInMemoryLedger();
    RecordingWorker worker;
    Collected collected;

    SECTION("Queued work is dropped, in-flight work finishes") {
        std::promise<void> started;
        std::promise<void> release;
        auto releaseFuture = release.get_future().share();
        std::atomic<bool> first{true};
        worker.onStart = [&](const FileDescriptor&) {
            if (first.exchange(false)) {
                started.set_value();
                releaseFuture.wait();
            }
        };
        auto cfg = configFor(tmp.path(), 1);
        cfg.queueCapacity = 16;
        DownloadScheduler sched(cfg, worker, *ledger, collected.callback());
        for (int i = 0; i < 8; ++i)
            REQUIRE(sched.submit(fd("1", std::to_string(i))));
        started.get_future().wait();

        sched.requestStop();
        CHECK(sched.stopRequested());
        CHECK_FALSE(sched.submit(fd("2", "late")));
        release.set_value();
        sched.finish();

        CHECK(sched.dispatched() == 1);
        CHECK(collected.results.size() == 1);
        CHECK(collected.results[0].outcome == TransferOutcome::Success);
    }

    SECTION("A run-aborting result stops the scheduler") {
        worker.override_ = [](const FileDescriptor& d, const TransferContext& ctx) {
            TransferResult r;
            r.descriptor = d;
            r.finalPath = ctx.finalPath;
            r.outcome = TransferOutcome::Failed;
            r.error = Error{ErrorCode::IoError, "No space left on device"};
            r.abortsRun = true;
            return r;
        };
        DownloadScheduler sched(configFor(tmp.path(), 1), worker, *ledger, collected.callback());
        sched.submit(fd("1", "a"));
        // Give the worker time to fail before more work arrives
        for (int i = 0; i < 100 && !sched.stopRequested(); ++i)
            std::this_thread::sleep_for(5ms);
        CHECK(sched.stopRequested());
        CHECK_FALSE(sched.submit(fd("1", "b")));
        sched.finish();

        auto fatal = sched.fatalError();
        REQUIRE(fatal.has_value());
        CHECK(fatal->code == ErrorCode::IoError);
        CHECK(collected.results.size() == 1);
    }
}
