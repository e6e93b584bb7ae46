#pragma once

#include <kfetch/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kfetch::ledger {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

/**
 * One completed (creator, post, filename) triple.
 */
struct LedgerEntry {
    std::string creator;
    std::string postId;
    std::string filename;
    std::uint64_t size{0};
    std::int64_t completedAt{0}; // unix seconds
};

/**
 * Durable record of completed transfers.
 *
 * Reads (isComplete, lookup, count) are safe from any number of threads and never
 * wait for a write in progress. Writes are serialized; markComplete() returns only
 * after the entry is durable.
 */
class IProgressLedger {
public:
    virtual ~IProgressLedger() = default;

    [[nodiscard]] virtual bool isComplete(std::string_view creator, std::string_view postId,
                                          std::string_view filename) const = 0;

    [[nodiscard]] virtual std::optional<LedgerEntry>
    lookup(std::string_view creator, std::string_view postId, std::string_view filename) const = 0;

    virtual Expected<void> markComplete(std::string_view creator, std::string_view postId,
                                        std::string_view filename, std::uint64_t size) = 0;

    // Forget a triple so the next run transfers it again
    virtual Expected<void> invalidate(std::string_view creator, std::string_view postId,
                                      std::string_view filename) = 0;

    [[nodiscard]] virtual std::size_t count() const = 0;
};

/**
 * Open (or create) the SQLite ledger at `path`. A missing or empty file is an empty
 * ledger; the parent directory is created when needed.
 */
Expected<std::unique_ptr<IProgressLedger>> openSqliteLedger(const std::filesystem::path& path);

/**
 * Process-local ledger with the same semantics and no persistence.
 */
std::unique_ptr<IProgressLedger> makeInMemoryLedger();

/**
 * <output root>/.kfetch/ledger.db
 */
std::filesystem::path defaultLedgerPath(const std::filesystem::path& outputRoot);

} // namespace kfetch::ledger
