#include "transfer_journal.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <filesystem>

namespace {

// Finalizes the statement on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw InternalError("Failed to prepare journal statement: " + std::string(sqlite3_errmsg(db)));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void BindText(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void BindInt64(int index, std::uint64_t value) {
        sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }

private:
    sqlite3_stmt* stmt_;
};

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt, column));
}

} // namespace

TransferJournal::TransferJournal(const std::string& db_path) : db_(nullptr) {
    if (db_path != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        throw InternalError("Failed to open transfer journal: " + message);
    }
    Init();
}

TransferJournal::~TransferJournal() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void TransferJournal::Init() {
    Execute("CREATE TABLE IF NOT EXISTS transfers ("
            "bucket TEXT NOT NULL, "
            "object_key TEXT NOT NULL, "
            "etag TEXT NOT NULL, "
            "size INTEGER NOT NULL, "
            "destination TEXT NOT NULL, "
            "committed_bytes INTEGER NOT NULL, "
            "PRIMARY KEY (bucket, object_key));");
}

void TransferJournal::Execute(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = "SQL error: " + std::string(errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        throw InternalError(error);
    }
}

std::optional<JournalEntry> TransferJournal::Find(const std::string& bucket, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT etag, size, destination, committed_bytes FROM transfers "
                        "WHERE bucket = ? AND object_key = ?;");
    stmt.BindText(1, bucket);
    stmt.BindText(2, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    JournalEntry entry;
    entry.bucket = bucket;
    entry.key = key;
    entry.etag = ColumnText(stmt.get(), 0);
    entry.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
    entry.destination = ColumnText(stmt.get(), 2);
    entry.committed_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 3));
    return entry;
}

void TransferJournal::Begin(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "INSERT OR REPLACE INTO transfers "
                        "(bucket, object_key, etag, size, destination, committed_bytes) "
                        "VALUES (?, ?, ?, ?, ?, ?);");
    stmt.BindText(1, entry.bucket);
    stmt.BindText(2, entry.key);
    stmt.BindText(3, entry.etag);
    stmt.BindInt64(4, entry.size);
    stmt.BindText(5, entry.destination);
    stmt.BindInt64(6, entry.committed_bytes);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw InternalError("Failed to record transfer: " + std::string(sqlite3_errmsg(db_)));
    }
}

void TransferJournal::Checkpoint(const std::string& bucket, const std::string& key,
                                 std::uint64_t committed_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "UPDATE transfers SET committed_bytes = ? WHERE bucket = ? AND object_key = ?;");
    stmt.BindInt64(1, committed_bytes);
    stmt.BindText(2, bucket);
    stmt.BindText(3, key);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw InternalError("Failed to checkpoint transfer: " + std::string(sqlite3_errmsg(db_)));
    }
}

void TransferJournal::Remove(const std::string& bucket, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM transfers WHERE bucket = ? AND object_key = ?;");
    stmt.BindText(1, bucket);
    stmt.BindText(2, key);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        Logger::Warn("Failed to remove journal entry for " + bucket + "/" + key + ": " +
                     sqlite3_errmsg(db_), "Journal");
    }
}

std::size_t TransferJournal::Count() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM transfers;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw InternalError("Failed to count journal entries");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}
