#pragma once

#include <kfetch/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kfetch::crawl {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

/**
 * One creator on one site. Immutable input to a crawl run.
 */
struct CreatorTarget {
    std::string site;      // host, e.g. "kemono.su"
    std::string service;   // platform, e.g. "patreon"
    std::string creatorId; // platform-specific id

    // Ledger and directory key: "<service>/<creator id>"
    [[nodiscard]] std::string key() const { return service + "/" + creatorId; }
};

/**
 * Parse "https://<site>/<service>/user/<creator id>[/...]".
 */
Expected<CreatorTarget> parseProfileUrl(std::string_view url);

/**
 * One attachment entry as the API lists it.
 */
struct RawAttachment {
    std::string name;                  // remote-provided name, may be empty
    std::string path;                  // "/ab/cd/<sha256>.jpg"
    std::optional<std::string> server; // "https://n1.kemono.su"
    std::optional<std::uint64_t> size;
};

struct PostRecord {
    std::string id;
    std::string creatorId;
    std::string service;
    std::string title;
    std::string published;
    std::vector<RawAttachment> attachments; // primary file first, then API order
    std::string content;                    // HTML body, scanned for inline references
    std::string rawJson;                    // the post object as received
    std::size_t listingPosition{0};         // index in the creator's listing
};

/**
 * Normalized, schedulable representation of one attachment.
 */
struct FileDescriptor {
    std::string url;
    std::string filename;
    std::string postId;
    std::optional<std::uint64_t> expectedBytes;
    std::optional<std::string> expectedSha256; // lower-case hex
    std::string host;
    std::size_t index{0}; // attachment order within the post
};

enum class TransferOutcome { Success, Skipped, Failed };

constexpr const char* outcomeName(TransferOutcome o) {
    switch (o) {
        case TransferOutcome::Success: return "complete";
        case TransferOutcome::Skipped: return "skipped";
        case TransferOutcome::Failed: return "failed";
    }
    return "failed";
}

struct TransferResult {
    FileDescriptor descriptor;
    TransferOutcome outcome{TransferOutcome::Failed};
    std::optional<Error> error; // set when outcome is Failed
    std::uint64_t bytesWritten{0};
    std::filesystem::path finalPath;
    int attempts{0};
    bool abortsRun{false}; // local I/O failure: the run cannot continue safely
};

/**
 * True when `s` can be used as one path component as-is: non-empty, not "." or "..",
 * no separators or control characters.
 */
[[nodiscard]] bool isSafePathComponent(std::string_view s) noexcept;

/**
 * <root>/<service>/<creator id>/<post id>/<filename>
 */
std::filesystem::path finalPathFor(const std::filesystem::path& root, const CreatorTarget& target,
                                   std::string_view postId, std::string_view filename);

struct RunSummary {
    std::size_t posts{0};
    std::size_t descriptors{0};
    std::size_t completed{0};
    std::size_t skipped{0};
    std::size_t failed{0};
    std::size_t malformed{0};
    std::size_t dispatched{0}; // transfers handed to a worker
    std::uint64_t bytesWritten{0};
    std::chrono::milliseconds elapsed{0};
    bool interrupted{false};
    std::optional<Error> fatal;

    [[nodiscard]] bool ok() const noexcept { return !fatal && failed == 0; }
};

/**
 * Receives run events. Callbacks may arrive from worker threads, but never
 * concurrently with each other.
 */
class IRunObserver {
public:
    virtual ~IRunObserver() = default;
    virtual void onPost(const PostRecord& /*post*/, std::size_t /*descriptorCount*/) {}
    virtual void onResult(const TransferResult& result) = 0;
    virtual void onFatal(const Error& /*error*/) {}
};

} // namespace kfetch::crawl
