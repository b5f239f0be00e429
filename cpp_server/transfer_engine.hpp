#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include "cancellation.hpp"
#include "destination_sink.hpp"
#include "object_store.hpp"
#include "transfer_journal.hpp"
#include "types.hpp"

struct TransferOptions {
    std::uint64_t chunk_size = 8ull * 1024 * 1024;
    int max_retries = 3;
    int retry_initial_backoff_ms = 200;
    int retry_max_backoff_ms = 5000;
    int parallel_chunks = 4;
};

// Moves one object from the store into a DestinationSink in fixed-size chunks.
//
// Chunks are fetched with up to `parallel_chunks` requests in flight and written
// strictly in object order. A chunk that fails with ConnectivityError is retried
// with exponential backoff; any other error fails the task at once.
//
// Partial state: a resumable sink (FileSink) keeps its bytes and a journal
// bookmark only when retries were exhausted on ConnectivityError, so the next
// download of the same unchanged object continues from the last chunk boundary.
// Every other failure (integrity, cancellation, timeout, missing object)
// discards the partial bytes and the bookmark.
class TransferEngine {
public:
    // `journal` may be null; downloads then always start from zero.
    TransferEngine(ObjectStore& store, TransferOptions options, TransferJournal* journal);

    // Runs the task to completion. Returns the COMPLETED task, or throws the
    // BridgeError that moved it to FAILED.
    TransferTask Download(const std::string& bucket, const std::string& key,
                          DestinationSink& sink, const CancellationToken& token);

    // Downloads into <download_dir>/<bucket>/<key>.
    TransferTask DownloadToFile(const std::string& bucket, const std::string& key,
                                const std::string& download_dir, const CancellationToken& token);

    // Rejects names that would leave `download_dir` (SchemaValidationError).
    static std::string ResolveDestination(const std::string& download_dir, const std::string& bucket,
                                          const std::string& key);

    const TransferOptions& Options() const { return options_; }

private:
    std::string FetchChunk(const std::string& bucket, const std::string& key, std::uint64_t offset,
                           std::uint64_t length, const ReadPrecondition& expected,
                           const CancellationToken& token);

    void Backoff(int attempt, const CancellationToken& token) const;

    void RunChunks(TransferTask& task, DestinationSink& sink, bool journaled,
                   const CancellationToken& token);

    void ClaimLocation(const std::string& location, const CancellationToken& token);
    void ReleaseLocation(const std::string& location);

    ObjectStore& store_;
    TransferOptions options_;
    TransferJournal* journal_;

    // Destinations with a download in progress; a second download of the same
    // destination waits for the first.
    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    std::set<std::string> active_locations_;
};

#endif // TRANSFER_ENGINE_HPP
