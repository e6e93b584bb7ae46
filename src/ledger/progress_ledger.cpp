#include <kfetch/ledger/progress_ledger.h>

#include <sqlite3.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace kfetch::ledger {

namespace {

std::string makeKey(std::string_view creator, std::string_view postId, std::string_view filename) {
    std::string key;
    key.reserve(creator.size() + postId.size() + filename.size() + 2);
    key.append(creator);
    key.push_back('\x1f');
    key.append(postId);
    key.push_back('\x1f');
    key.append(filename);
    return key;
}

std::int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// SQLite RAII wrapper for statements
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error(
                fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept : stmt_(other.stmt_), db_(other.db_) {
        other.stmt_ = nullptr;
    }

    void bind(int index, std::int64_t value) {
        if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
            throw std::runtime_error("Failed to bind int64 parameter");
        }
    }

    void bind(int index, std::string_view value) {
        if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                              SQLITE_TRANSIENT) != SQLITE_OK) {
            throw std::runtime_error("Failed to bind text parameter");
        }
    }

    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        } else {
            throw std::runtime_error(
                fmt::format("Statement execution failed: {}", sqlite3_errmsg(db_)));
        }
    }

    void execute() {
        if (!step()) {
            return;
        }
        throw std::runtime_error("Execute called on query that returns data");
    }

    std::int64_t getInt64(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::string getString(int col) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return text ? std::string(text) : std::string();
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    sqlite3* db_ = nullptr;
};

// Simple database wrapper
class Database {
public:
    explicit Database(const std::filesystem::path& path) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_NOMUTEX; // access is serialized by the ledger's writer mutex

        int rc = sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error(fmt::format("Failed to open database: {}", msg));
        }
        sqlite3_busy_timeout(db_, 15000);
    }

    ~Database() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void execute(const std::string& sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error(fmt::format("SQL execution failed: {}", error));
        }
    }

    Statement prepare(const std::string& sql) { return Statement(db_, sql); }

private:
    sqlite3* db_ = nullptr;
};

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS completed_files (
    creator      TEXT    NOT NULL,
    post_id      TEXT    NOT NULL,
    filename     TEXT    NOT NULL,
    size         INTEGER NOT NULL,
    completed_at INTEGER NOT NULL,
    PRIMARY KEY (creator, post_id, filename)
);
)sql";

// In-memory index shared by both ledgers. Readers take a shared lock that is held only
// for the map lookup, never across storage I/O.
class LedgerIndex {
public:
    bool contains(const std::string& key) const {
        std::shared_lock lock(mutex_);
        return entries_.count(key) != 0;
    }

    std::optional<LedgerEntry> find(const std::string& key) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    void put(std::string key, LedgerEntry entry) {
        std::unique_lock lock(mutex_);
        entries_.insert_or_assign(std::move(key), std::move(entry));
    }

    void erase(const std::string& key) {
        std::unique_lock lock(mutex_);
        entries_.erase(key);
    }

    std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, LedgerEntry> entries_;
};

class InMemoryLedger final : public IProgressLedger {
public:
    bool isComplete(std::string_view creator, std::string_view postId,
                    std::string_view filename) const override {
        return index_.contains(makeKey(creator, postId, filename));
    }

    std::optional<LedgerEntry> lookup(std::string_view creator, std::string_view postId,
                                      std::string_view filename) const override {
        return index_.find(makeKey(creator, postId, filename));
    }

    Expected<void> markComplete(std::string_view creator, std::string_view postId,
                                std::string_view filename, std::uint64_t size) override {
        index_.put(makeKey(creator, postId, filename),
                   LedgerEntry{std::string(creator), std::string(postId), std::string(filename),
                               size, unixNow()});
        return {};
    }

    Expected<void> invalidate(std::string_view creator, std::string_view postId,
                              std::string_view filename) override {
        index_.erase(makeKey(creator, postId, filename));
        return {};
    }

    std::size_t count() const override { return index_.size(); }

private:
    LedgerIndex index_;
};

class SqliteLedger final : public IProgressLedger {
public:
    explicit SqliteLedger(const std::filesystem::path& path) : path_(path), db_(path) {
        db_.execute("PRAGMA journal_mode=WAL");
        db_.execute("PRAGMA synchronous=FULL");
        db_.execute(kSchema);
        load();
    }

    bool isComplete(std::string_view creator, std::string_view postId,
                    std::string_view filename) const override {
        return index_.contains(makeKey(creator, postId, filename));
    }

    std::optional<LedgerEntry> lookup(std::string_view creator, std::string_view postId,
                                      std::string_view filename) const override {
        return index_.find(makeKey(creator, postId, filename));
    }

    Expected<void> markComplete(std::string_view creator, std::string_view postId,
                                std::string_view filename, std::uint64_t size) override {
        LedgerEntry entry{std::string(creator), std::string(postId), std::string(filename), size,
                          unixNow()};
        std::lock_guard<std::mutex> lock(writeMutex_);
        try {
            auto stmt = db_.prepare("INSERT OR REPLACE INTO completed_files "
                                    "(creator, post_id, filename, size, completed_at) "
                                    "VALUES (?, ?, ?, ?, ?)");
            stmt.bind(1, entry.creator);
            stmt.bind(2, entry.postId);
            stmt.bind(3, entry.filename);
            stmt.bind(4, static_cast<std::int64_t>(entry.size));
            stmt.bind(5, entry.completedAt);
            stmt.execute();
        } catch (const std::exception& e) {
            spdlog::error("Ledger write failed for {}/{}/{}: {}", creator, postId, filename,
                          e.what());
            return Error{ErrorCode::IoError,
                         fmt::format("ledger write failed ({}): {}", path_.string(), e.what())};
        }
        // Visible to readers only once durable
        index_.put(makeKey(creator, postId, filename), std::move(entry));
        return {};
    }

    Expected<void> invalidate(std::string_view creator, std::string_view postId,
                              std::string_view filename) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        // Readers must stop trusting the entry before the row goes away
        index_.erase(makeKey(creator, postId, filename));
        try {
            auto stmt = db_.prepare(
                "DELETE FROM completed_files WHERE creator = ? AND post_id = ? AND filename = ?");
            stmt.bind(1, creator);
            stmt.bind(2, postId);
            stmt.bind(3, filename);
            stmt.execute();
        } catch (const std::exception& e) {
            return Error{ErrorCode::IoError,
                         fmt::format("ledger delete failed ({}): {}", path_.string(), e.what())};
        }
        spdlog::debug("Ledger entry invalidated: {}/{}/{}", creator, postId, filename);
        return {};
    }

    std::size_t count() const override { return index_.size(); }

private:
    void load() {
        auto stmt =
            db_.prepare("SELECT creator, post_id, filename, size, completed_at FROM completed_files");
        std::size_t loaded = 0;
        while (stmt.step()) {
            LedgerEntry e;
            e.creator = stmt.getString(0);
            e.postId = stmt.getString(1);
            e.filename = stmt.getString(2);
            e.size = static_cast<std::uint64_t>(stmt.getInt64(3));
            e.completedAt = stmt.getInt64(4);
            auto key = makeKey(e.creator, e.postId, e.filename);
            index_.put(std::move(key), std::move(e));
            ++loaded;
        }
        spdlog::debug("Ledger {} opened with {} completed entries", path_.string(), loaded);
    }

    std::filesystem::path path_;
    Database db_;
    std::mutex writeMutex_;
    LedgerIndex index_;
};

} // namespace

Expected<std::unique_ptr<IProgressLedger>> openSqliteLedger(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create ledger directory " +
                                                 path.parent_path().string() + ": " +
                                                 ec.message()};
        }
    }
    try {
        std::unique_ptr<IProgressLedger> ledger = std::make_unique<SqliteLedger>(path);
        return ledger;
    } catch (const std::exception& e) {
        return Error{ErrorCode::IoError,
                     fmt::format("Failed to open ledger {}: {}", path.string(), e.what())};
    }
}

std::unique_ptr<IProgressLedger> makeInMemoryLedger() {
    return std::make_unique<InMemoryLedger>();
}

std::filesystem::path defaultLedgerPath(const std::filesystem::path& outputRoot) {
    return outputRoot / ".kfetch" / "ledger.db";
}

} // namespace kfetch::ledger
