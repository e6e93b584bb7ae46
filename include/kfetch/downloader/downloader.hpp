#pragma once

/*
 * kfetch Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces shared by the
 * transfer side of kfetch. It contains no transport or filesystem code.
 *
 * Design principles:
 * - Staging next to the destination so promotion is a same-filesystem rename
 * - Errors travel as values (Expected<T>), never as exceptions across interfaces
 * - Cooperative cancellation everywhere bytes move
 * - Clear separation of concerns (HTTP adapter, integrity verification, disk writer,
 *   rate limit)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for downloader and crawl operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ClientError,
    AuthenticationFailed,
    RateLimited,
    ServerError,
    MalformedResponse,
    IoError,
    SizeMismatch,
    ChecksumMismatch,
    Cancelled,
    Unknown
};

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::NetworkError: return "network-error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::TlsVerificationFailed: return "tls-verification-failed";
        case ErrorCode::ClientError: return "client-error";
        case ErrorCode::AuthenticationFailed: return "authentication-failed";
        case ErrorCode::RateLimited: return "rate-limited";
        case ErrorCode::ServerError: return "server-error";
        case ErrorCode::MalformedResponse: return "malformed-response";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::SizeMismatch: return "size-mismatch";
        case ErrorCode::ChecksumMismatch: return "checksum-mismatch";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (SHA-256, lower-case hex).
 */
struct Checksum {
    std::string hex;
};

/**
 * Bandwidth limits in bytes per second (0 = unlimited).
 */
struct RateLimit {
    std::uint64_t globalBps{0};
    std::uint64_t perHostBps{0};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Per-request transport options.
 */
struct RequestOptions {
    std::chrono::milliseconds timeout{60000}; // connect and stall timeout, not total duration
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    std::string userAgent;
};

/**
 * Status line facts, delivered once per request before the first body byte.
 */
struct ResponseInfo {
    long status{0};
    std::optional<std::uint64_t> contentLength{}; // length of this response body
    bool partialContent{false};                   // 206: the Range request was honoured
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;
using ResponseCallback = std::function<Expected<void>(const ResponseInfo&)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * GET `url`, starting at byte `offset` (a Range request when offset > 0).
     *
     * `onResponse` runs once, before the first body byte, for statuses below 400.
     * The body of a successful response is streamed to `sink`; error bodies are
     * discarded and reported as an Error carrying the HTTP status.
     * If `sink` or `onResponse` fails, the transfer stops and that error is returned.
     */
    virtual Expected<ResponseInfo> get(std::string_view url, const std::vector<Header>& headers,
                                       std::uint64_t offset, const RequestOptions& options,
                                       const ResponseCallback& onResponse, const ByteSink& sink,
                                       const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Disk writer for staging files and promotion to the final path.
 * Staging files live beside their destination so promote() is an atomic rename.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Staging path for a destination: "<final>.part".
     */
    [[nodiscard]] virtual std::filesystem::path
    stagingPathFor(const std::filesystem::path& finalPath) const = 0;

    /**
     * Create the destination directory and the staging file.
     * With keepExisting, an existing staging file is reopened and its size reported in
     * currentSize; otherwise it is truncated and currentSize is 0.
     */
    virtual Expected<std::filesystem::path> openStagingFile(const std::filesystem::path& finalPath,
                                                            bool keepExisting,
                                                            /* out */ std::uint64_t& currentSize) = 0;

    /**
     * Write a contiguous block at a specific offset.
     */
    virtual Expected<void> writeAt(const std::filesystem::path& stagingFile, std::uint64_t offset,
                                   std::span<const std::byte> data) = 0;

    virtual Expected<void> truncate(const std::filesystem::path& stagingFile,
                                    std::uint64_t size) = 0;

    /**
     * Ensure data durability (fsync file and its directory).
     */
    virtual Expected<void> sync(const std::filesystem::path& stagingFile) = 0;

    /**
     * Move the staging file to finalPath, replacing any existing file.
     * Must attempt atomic rename; on EXDEV falls back to copy+fsync+rename.
     */
    virtual Expected<std::filesystem::path> promote(const std::filesystem::path& stagingFile,
                                                    const std::filesystem::path& finalPath) = 0;

    /**
     * Best-effort cleanup of a staging file.
     */
    virtual void cleanup(const std::filesystem::path& stagingFile) noexcept = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available in the global bucket and in the bucket
     * for 'host'. Returns early when shouldCancel() turns true.
     */
    virtual void acquire(std::string_view host, std::uint64_t bytes,
                         const ShouldCancel& shouldCancel) = 0;

    /**
     * Set runtime limits (0 = unlimited).
     */
    virtual void setLimits(const RateLimit& limit) = 0;
};

// ======================
// Helpers
// ======================

/**
 * Lower-case host of an absolute URL ("https://n1.kemono.su:443/data/x" -> "n1.kemono.su").
 * Returns an empty string when the URL has no authority component.
 */
[[nodiscard]] std::string hostOf(std::string_view url);

/**
 * GET a whole response body into memory (listing pages, small documents).
 */
Expected<std::string> fetchText(IHttpAdapter& http, std::string_view url,
                                const std::vector<Header>& headers, const RequestOptions& options,
                                const ShouldCancel& shouldCancel = {});

// ======================
// Factories
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256();
std::unique_ptr<IRateLimiter> makeRateLimiter();

} // namespace kfetch::downloader
