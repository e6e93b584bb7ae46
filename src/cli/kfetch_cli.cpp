#include <kfetch/cli/kfetch_cli.h>
#include <kfetch/crawl/scope.hpp>
#include <kfetch/ledger/progress_ledger.h>
#include <kfetch/version.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <iterator>
#include <optional>
#include <thread>

namespace kfetch::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;
using downloader::Error;
using downloader::ErrorCode;

namespace {

constexpr const char* kDefaultSite = "kemono.su";

std::atomic<bool> g_interrupted{false};

void onInterrupt(int sig) {
    g_interrupted.store(true);
    // A second Ctrl+C terminates immediately
    std::signal(sig, SIG_DFL);
}

std::string humanBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (v >= 1024.0 && unit + 1 < std::size(kUnits)) {
        v /= 1024.0;
        ++unit;
    }
    return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.1f} {}", v, kUnits[unit]);
}

/**
 * Prints one line per file, or collects everything for a single JSON document.
 */
class ConsoleObserver final : public crawl::IRunObserver {
public:
    ConsoleObserver(bool jsonOutput, bool quiet) : json_(jsonOutput), quiet_(quiet) {}

    void onPost(const crawl::PostRecord& post, std::size_t fileCount) override {
        if (json_ || quiet_)
            return;
        std::string title = post.title.empty() ? "(untitled)" : post.title;
        fmt::print("post {} {} ({} file{})\n", post.id, title, fileCount,
                   fileCount == 1 ? "" : "s");
    }

    void onResult(const crawl::TransferResult& r) override {
        if (json_) {
            json entry{{"post", r.descriptor.postId},
                       {"filename", r.descriptor.filename},
                       {"url", r.descriptor.url},
                       {"outcome", crawl::outcomeName(r.outcome)},
                       {"bytes", r.bytesWritten},
                       {"attempts", r.attempts},
                       {"path", r.finalPath.string()}};
            if (r.error) {
                entry["error"] = {{"code", downloader::errorCodeName(r.error->code)},
                                  {"message", r.error->message}};
                if (r.error->httpStatus)
                    entry["error"]["http_status"] = *r.error->httpStatus;
            }
            results_.push_back(std::move(entry));
            return;
        }
        if (r.outcome == crawl::TransferOutcome::Failed) {
            // Failures are shown even with --quiet
            std::cerr << fmt::format("  [FAIL] {}/{}: {}\n", r.descriptor.postId,
                                     r.descriptor.filename,
                                     r.error ? r.error->message : std::string("unknown error"));
            return;
        }
        if (quiet_)
            return;
        if (r.outcome == crawl::TransferOutcome::Skipped) {
            fmt::print("  [skip] {}\n", r.descriptor.filename);
        } else {
            fmt::print("  [ok]   {} ({})\n", r.descriptor.filename, humanBytes(r.bytesWritten));
        }
    }

    void finish(const crawl::CreatorTarget& target, const crawl::RunSummary& s) const {
        if (json_) {
            json doc{{"target",
                      {{"site", target.site},
                       {"service", target.service},
                       {"creator", target.creatorId}}},
                     {"summary",
                      {{"posts", s.posts},
                       {"files", s.descriptors},
                       {"completed", s.completed},
                       {"skipped", s.skipped},
                       {"failed", s.failed},
                       {"malformed", s.malformed},
                       {"bytes", s.bytesWritten},
                       {"elapsed_ms", s.elapsed.count()},
                       {"interrupted", s.interrupted}}},
                     {"results", results_}};
            if (s.fatal) {
                doc["fatal"] = {{"code", downloader::errorCodeName(s.fatal->code)},
                                {"message", s.fatal->message}};
            }
            std::cout << doc.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return;
        }
        if (s.fatal)
            std::cerr << fmt::format("[FAIL] {}\n", s.fatal->message);
        if (s.interrupted)
            std::cerr << "Interrupted; rerun to continue where this run stopped.\n";
        fmt::print("{}: {} post(s), {} file(s): {} downloaded ({}), {} skipped, {} failed\n",
                   target.key(), s.posts, s.descriptors, s.completed, humanBytes(s.bytesWritten),
                   s.skipped, s.failed);
    }

private:
    bool json_;
    bool quiet_;
    json results_ = json::array();
};

/**
 * Forwards SIGINT/SIGTERM to the pipeline from an ordinary thread.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(crawl::CrawlPipeline& pipeline) : pipeline_(pipeline) {
        g_interrupted.store(false);
        previousInt_ = std::signal(SIGINT, onInterrupt);
        previousTerm_ = std::signal(SIGTERM, onInterrupt);
        thread_ = std::thread([this] {
            while (!done_.load()) {
                if (g_interrupted.load()) {
                    spdlog::warn("Interrupt received; finishing in-flight transfers");
                    pipeline_.requestStop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~InterruptWatcher() {
        done_.store(true);
        if (thread_.joinable())
            thread_.join();
        std::signal(SIGINT, previousInt_ == SIG_ERR ? SIG_DFL : previousInt_);
        std::signal(SIGTERM, previousTerm_ == SIG_ERR ? SIG_DFL : previousTerm_);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    using Handler = void (*)(int);

    crawl::CrawlPipeline& pipeline_;
    std::atomic<bool> done_{false};
    std::thread thread_;
    Handler previousInt_{SIG_DFL};
    Handler previousTerm_{SIG_DFL};
};

} // namespace

Expected<crawl::CreatorTarget> resolveTarget(const CliOptions& options) {
    if (!options.profileUrl.empty()) {
        if (!options.service.empty() || !options.creator.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Give either a profile URL or --service/--creator, not both"};
        }
        return crawl::parseProfileUrl(options.profileUrl);
    }
    if (options.service.empty() || options.creator.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "A profile URL or both --service and --creator are required"};
    }

    crawl::CreatorTarget target;
    target.site = options.site.empty() ? kDefaultSite : options.site;
    target.service = options.service;
    target.creatorId = options.creator;
    for (const auto* part : {&target.site, &target.service, &target.creatorId}) {
        if (!crawl::isSafePathComponent(*part)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Invalid creator target component '{}'", *part)};
        }
    }
    return target;
}

Expected<ResolvedRun> resolveRun(const CliOptions& options, const config::Settings& settings) {
    auto target = resolveTarget(options);
    if (!target.ok())
        return target.error();

    ResolvedRun run;
    run.target = std::move(target).value();

    auto& p = run.pipeline;
    p.outputRoot = options.output ? config::expand_tilde(*options.output) : settings.outputRoot;
    p.concurrency = std::max<std::size_t>(1, options.concurrency.value_or(settings.concurrency));
    p.perHostLimit = options.perHost.value_or(settings.perHost);
    p.transferDeadline = std::chrono::milliseconds(settings.transferDeadlineMs);
    p.rateLimit.globalBps = options.rateLimit.value_or(settings.rateLimitBps);
    p.rateLimit.perHostBps = settings.perHostBps;

    downloader::RequestOptions request;
    request.timeout = std::chrono::milliseconds(options.timeoutMs.value_or(settings.timeoutMs));
    request.tls.insecure = options.insecure || !settings.verifyTls;
    request.tls.caPath = settings.caPath;
    request.userAgent = settings.userAgent.empty()
                            ? fmt::format("kfetch/{}", version::string_v)
                            : settings.userAgent;
    auto proxy = config::build_proxy_url(options.proxy.value_or(settings.proxy),
                                         settings.proxyUsername, settings.proxyPassword);
    if (!proxy.empty())
        request.proxy = proxy;
    if (request.tls.insecure)
        spdlog::warn("TLS certificate verification is disabled");

    std::vector<downloader::Header> headers;
    const std::string token = options.token.value_or(settings.sessionToken);
    if (!token.empty())
        headers.push_back({"Cookie", "session=" + token});

    downloader::RetryPolicy retry;
    retry.maxAttempts = std::clamp(options.retries.value_or(settings.maxAttempts), 1, 100);
    retry.initialBackoff = std::chrono::milliseconds(settings.initialBackoffMs);
    retry.multiplier = settings.multiplier;
    retry.maxBackoff = std::chrono::milliseconds(settings.maxBackoffMs);

    p.fetch.apiBase = settings.apiBase;
    p.fetch.headers = headers;
    p.fetch.request = request;
    p.fetch.retry = retry;

    p.transfer.headers = headers;
    p.transfer.request = request;
    p.transfer.retry = retry;
    p.transfer.resumePartial = settings.resumePartial && !options.noResume;

    if (options.range) {
        auto scope = crawl::parseOffsetRange(*options.range, p.fetch.pageSize);
        if (!scope.ok())
            return scope.error();
        p.scope = std::move(scope).value();
    }
    if (options.post) {
        auto filter = crawl::parsePostFilter(*options.post);
        if (!filter.ok())
            return filter.error();
        p.scope.postFilter = std::move(filter).value();
    }

    p.processFromOldest = options.fromOldest || settings.processFromOldest;
    p.saveInfo = options.saveInfo || settings.saveInfo;
    p.includeEmptyPosts = settings.includeEmptyPosts;

    run.ledgerPath = ledger::defaultLedgerPath(p.outputRoot);
    return run;
}

int exitCodeFor(const crawl::RunSummary& summary) noexcept {
    if (summary.interrupted)
        return ExitInterrupted;
    if (summary.fatal)
        return ExitFatal;
    if (summary.failed > 0)
        return ExitSomeFailed;
    return ExitOk;
}

int KfetchCLI::run(int argc, char* argv[]) {
    CLI::App app{"kfetch - download every post attachment of a Kemono/Coomer creator"};
    app.set_version_flag("--version", KFETCH_VERSION_LONG_STRING);
    registerOptions(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? ExitOk : ExitFatal;
    }

    configureLogging();

    try {
        return execute();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return ExitFatal;
    }
}

void KfetchCLI::registerOptions(CLI::App& app) {
    // Target: a profile URL, or the three parts
    app.add_option("url", options_.profileUrl,
                   "Creator profile URL, e.g. https://kemono.su/patreon/user/12345");
    app.add_option("--site", options_.site, "Site host when not using a URL (default kemono.su)")
        ->check(CLI::IsMember({"kemono.su", "kemono.party", "kemono.cr", "coomer.su",
                               "coomer.party", "coomer.st"}));
    app.add_option("--service", options_.service, "Service name, e.g. patreon, fanbox, onlyfans");
    app.add_option("--creator", options_.creator, "Creator id on the service");

    // Output and config
    app.add_option("-o,--output", options_.output, "Output root directory (default ./downloads)");
    app.add_option("--config", options_.configPath, "Config file (default: XDG config path)");
    app.add_flag("--save-info", options_.saveInfo,
                 "Write per-post metadata and a creator profile next to the files");

    // Scope
    app.add_option("--range", options_.range,
                   "Listing offsets: all, <n>, <a>-<b>, start-<b>, <a>-end");
    app.add_option("--post", options_.post, "Only this post id, or an id range <a>-<b>");
    app.add_flag("--from-oldest", options_.fromOldest,
                 "Read the whole listing first, then download oldest posts first");

    // Transfers
    app.add_option("-c,--concurrency", options_.concurrency, "Parallel transfers (default 4)")
        ->check(CLI::Range(1, 64));
    app.add_option("--per-host", options_.perHost,
                   "Max parallel transfers per host (0 = no limit)")
        ->check(CLI::Range(0, 64));
    app.add_option("--rate-limit", options_.rateLimit,
                   "Global download rate limit in bytes/sec (0 = unlimited)");
    app.add_option("--retries", options_.retries, "Max attempts per request (default 5)")
        ->check(CLI::Range(1, 100));
    app.add_option("--timeout", options_.timeoutMs,
                   "Connect and stall timeout in ms (default 60000)")
        ->check(CLI::Range(1000, 3600 * 1000));
    app.add_flag("--no-resume", options_.noResume,
                 "Discard partial files instead of resuming them");

    // Network
    app.add_option("--token", options_.token, "Session cookie value for authenticated requests");
    app.add_option("--proxy", options_.proxy, "Proxy, e.g. http://host:port or socks5://host:port");
    app.add_flag("--insecure", options_.insecure, "Disable TLS certificate verification");

    // Output format and logging
    app.add_flag("--json", options_.json, "Print one JSON document with all results");
    app.add_flag("-v,--verbose", options_.verbose, "More logging (-vv for debug)");
    app.add_flag("-q,--quiet", options_.quiet, "Only print failures and the summary");
}

void KfetchCLI::configureLogging() const {
    auto parseLevel = [](std::string v) -> std::optional<spdlog::level::level_enum> {
        for (auto& c : v)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (v == "trace")
            return spdlog::level::trace;
        if (v == "debug")
            return spdlog::level::debug;
        if (v == "info")
            return spdlog::level::info;
        if (v == "warn" || v == "warning")
            return spdlog::level::warn;
        if (v == "error" || v == "err")
            return spdlog::level::err;
        if (v == "off" || v == "none")
            return spdlog::level::off;
        return std::nullopt;
    };

    if (const char* envLvl = std::getenv("KFETCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (options_.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (options_.verbose >= 2) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options_.verbose == 1) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

int KfetchCLI::execute() {
    if (!options_.configPath.empty()) {
        std::error_code ec;
        if (!fs::exists(config::expand_tilde(options_.configPath), ec)) {
            std::cerr << fmt::format("[FAIL] Config file not found: {}\n", options_.configPath);
            return ExitFatal;
        }
    }
    auto settings = config::load_settings(config::get_config_path(options_.configPath));

    auto resolved = resolveRun(options_, settings);
    if (!resolved.ok()) {
        std::cerr << fmt::format("[FAIL] {}\n", resolved.error().message);
        return ExitFatal;
    }
    auto& run = resolved.value();

    auto ledger = ledger::openSqliteLedger(run.ledgerPath);
    if (!ledger.ok()) {
        std::cerr << fmt::format("[FAIL] Cannot open progress ledger {}: {}\n",
                                 run.ledgerPath.string(), ledger.error().message);
        return ExitFatal;
    }
    spdlog::debug("Ledger {} holds {} completed file(s)", run.ledgerPath.string(),
                  ledger.value()->count());

    auto http = downloader::makeCurlHttpAdapter();
    ConsoleObserver observer(options_.json, options_.quiet);
    crawl::CrawlPipeline pipeline(run.pipeline, *http, *ledger.value(), &observer);

    crawl::RunSummary summary;
    {
        InterruptWatcher watcher(pipeline);
        summary = pipeline.run(run.target);
    }
    observer.finish(run.target, summary);
    return exitCodeFor(summary);
}

} // namespace kfetch::cli
