/*
 * kfetch/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging file "<final>.part" beside the destination, so promotion is a rename
 *   within one directory and therefore within one filesystem
 * - Atomic rename onto the final path (replacing a stale file if present)
 * - EXDEV fallback: copy + fsync + rename when the rename still crosses devices
 *   (bind mounts, overlay filesystems)
 * - Staging files are private (0600) until promoted
 */

#include <kfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#endif

namespace kfetch::downloader {

namespace fs = std::filesystem;

namespace {
constexpr std::string_view kStagingSuffix = ".part";
} // namespace

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

static Expected<void> fsync_dir(const fs::path& dir) {
#if defined(_WIN32)
    (void)dir; // directory entries are durable once the rename returns on NTFS
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

static void ensure_file_private(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

static void set_file_published(const fs::path& p) noexcept {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions for {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    fs::path stagingPathFor(const fs::path& finalPath) const override {
        fs::path staging = finalPath;
        staging += std::string(kStagingSuffix);
        return staging;
    }

    Expected<fs::path> openStagingFile(const fs::path& finalPath, bool keepExisting,
                                       std::uint64_t& currentSize) override {
        currentSize = 0;
        if (finalPath.empty() || !finalPath.has_filename()) {
            return Error{ErrorCode::InvalidArgument,
                         "openStagingFile: invalid destination '" + finalPath.string() + "'"};
        }

        std::error_code ec;
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create directory " +
                                                 finalPath.parent_path().string() + ": " +
                                                 ec.message()};
        }

        const fs::path stagingFile = stagingPathFor(finalPath);

        if (keepExisting && fs::exists(stagingFile, ec)) {
            std::error_code fe;
            auto sz = fs::file_size(stagingFile, fe);
            if (!fe) {
                currentSize = static_cast<std::uint64_t>(sz);
                return stagingFile;
            }
            spdlog::debug("Cannot stat staging file {} ({}); starting over", stagingFile.string(),
                          fe.message());
        }

        {
            std::ofstream os(stagingFile, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "Failed to create staging file: " + stagingFile.string()};
            }
        }
        ensure_file_private(stagingFile);
        return stagingFile;
    }

    Expected<void> writeAt(const fs::path& stagingFile, std::uint64_t offset,
                           std::span<const std::byte> data) override {
        std::fstream fsio(stagingFile, std::ios::binary | std::ios::in | std::ios::out);
        if (!fsio.good()) {
            return Error{ErrorCode::IoError,
                         "Failed to open staging for write: " + stagingFile.string()};
        }

        fsio.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!fsio.good()) {
            return Error{ErrorCode::IoError, "seekp failed on: " + stagingFile.string()};
        }

        fsio.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!fsio.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + stagingFile.string()};
        }

        // Durability is sync()'s job
        fsio.close();
        return Expected<void>{};
    }

    Expected<void> truncate(const fs::path& stagingFile, std::uint64_t size) override {
        std::error_code ec;
        fs::resize_file(stagingFile, size, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "resize failed on " + stagingFile.string() + ": " + ec.message()};
        }
        return Expected<void>{};
    }

    Expected<void> sync(const fs::path& stagingFile) override {
        auto r = fsync_file(stagingFile);
        if (!r.ok())
            return r;
        return fsync_dir(stagingFile.parent_path());
    }

    Expected<fs::path> promote(const fs::path& stagingFile, const fs::path& finalPath) override {
        std::error_code ren_ec;
        fs::rename(stagingFile, finalPath, ren_ec);
        if (ren_ec) {
            if (ren_ec == std::errc::cross_device_link) {
                spdlog::warn("Cross-device rename detected; performing copy+fsync+rename for {}",
                             finalPath.string());
                auto copy_ok = copy_file_fsync_rename(stagingFile, finalPath);
                if (!copy_ok.ok()) {
                    return copy_ok.error();
                }
                std::error_code del_ec;
                fs::remove(stagingFile, del_ec);
            } else {
                return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() +
                                                     ") from " + stagingFile.string() + " to " +
                                                     finalPath.string()};
            }
        }

        set_file_published(finalPath);

        // Persist the new directory entry
        auto rr = fsync_dir(finalPath.parent_path());
        if (!rr.ok()) {
            spdlog::debug("fsync on {} failed (continuing)", finalPath.parent_path().string());
        }
        return finalPath;
    }

    void cleanup(const fs::path& stagingFile) noexcept override {
        std::error_code ec;
        fs::remove(stagingFile, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", stagingFile.string(),
                          ec.message());
        }
    }

private:
    // Copy to a sibling of dst, fsync it, then rename into place so dst never holds a
    // partial copy.
    static Expected<void> copy_file_fsync_rename(const fs::path& src, const fs::path& dst) {
        fs::path tmp = dst;
        tmp += ".copy";
        {
            std::ifstream is(src, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
            }
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError, "copy: failed to open destination: " + tmp.string()};
            }
            std::vector<char> buffer(1 << 20);
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        return Error{ErrorCode::IoError,
                                     "copy: write failed for destination: " + tmp.string()};
                    }
                }
            }
            if (!is.eof()) {
                return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
            }
        }

        auto rf = fsync_file(tmp);
        if (!rf.ok())
            return rf;

        std::error_code ec;
        fs::rename(tmp, dst, ec);
        if (ec) {
            std::error_code del_ec;
            fs::remove(tmp, del_ec);
            return Error{ErrorCode::IoError, "copy: rename into place failed: " + ec.message()};
        }
        return fsync_dir(dst.parent_path());
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace kfetch::downloader
