#pragma once

#include <kfetch/config/config_helpers.h>
#include <kfetch/crawl/crawl_pipeline.hpp>
#include <kfetch/crawl/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace kfetch::cli {

using downloader::Expected;

enum ExitCode : int {
    ExitOk = 0,
    ExitSomeFailed = 1,
    ExitFatal = 2,
    ExitInterrupted = 130,
};

/**
 * Values given on the command line. Unset optionals fall back to the config file.
 */
struct CliOptions {
    std::string profileUrl;
    std::string site;
    std::string service;
    std::string creator;

    std::optional<std::string> output;
    std::optional<std::size_t> concurrency;
    std::optional<std::size_t> perHost;
    std::optional<std::string> token;
    std::string configPath;
    std::optional<std::string> proxy;
    bool insecure{false};
    std::optional<std::string> range;
    std::optional<std::string> post;
    bool fromOldest{false};
    bool saveInfo{false};
    std::optional<std::uint64_t> rateLimit;
    bool noResume{false};
    std::optional<int> retries;
    std::optional<std::uint64_t> timeoutMs;
    bool json{false};
    int verbose{0};
    bool quiet{false};
};

/**
 * Everything a run needs, after merging command line, config file and defaults.
 */
struct ResolvedRun {
    crawl::CreatorTarget target;
    crawl::PipelineConfig pipeline;
    std::filesystem::path ledgerPath;
};

Expected<crawl::CreatorTarget> resolveTarget(const CliOptions& options);

/**
 * Command line > config file > defaults.
 */
Expected<ResolvedRun> resolveRun(const CliOptions& options, const config::Settings& settings);

[[nodiscard]] int exitCodeFor(const crawl::RunSummary& summary) noexcept;

class KfetchCLI {
public:
    KfetchCLI() = default;

    int run(int argc, char* argv[]);

private:
    void registerOptions(CLI::App& app);
    void configureLogging() const;
    int execute();

    CliOptions options_;
};

} // namespace kfetch::cli
