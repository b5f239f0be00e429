#ifndef TRANSFER_JOURNAL_HPP
#define TRANSFER_JOURNAL_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>

// Byte-offset bookmark of a file download that may be resumed.
struct JournalEntry {
    std::string bucket;
    std::string key;
    std::string etag;
    std::uint64_t size = 0;
    std::string destination;
    std::uint64_t committed_bytes = 0;
};

// SQLite-backed record of unfinished file downloads, keyed by (bucket, key).
// Use ":memory:" for a process-local journal.
class TransferJournal {
public:
    explicit TransferJournal(const std::string& db_path);
    ~TransferJournal();

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    std::optional<JournalEntry> Find(const std::string& bucket, const std::string& key);

    // Inserts or replaces the whole entry.
    void Begin(const JournalEntry& entry);

    // Moves the bookmark to the end of the last chunk written and flushed.
    void Checkpoint(const std::string& bucket, const std::string& key, std::uint64_t committed_bytes);

    void Remove(const std::string& bucket, const std::string& key);

    std::size_t Count();

private:
    sqlite3* db_;
    std::mutex mutex_;

    void Init();
    void Execute(const std::string& sql);
};

#endif // TRANSFER_JOURNAL_HPP
