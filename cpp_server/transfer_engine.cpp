#include "transfer_engine.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <future>
#include <thread>

namespace {

struct PendingChunk {
    std::uint64_t offset;
    std::uint64_t length;
    std::future<std::string> data;
};

std::string Describe(const std::string& bucket, const std::string& key) {
    return "s3://" + bucket + "/" + key;
}

} // namespace

std::string TransferStateName(TransferState state) {
    switch (state) {
        case TransferState::PENDING: return "PENDING";
        case TransferState::IN_PROGRESS: return "IN_PROGRESS";
        case TransferState::COMPLETED: return "COMPLETED";
        case TransferState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

TransferEngine::TransferEngine(ObjectStore& store, TransferOptions options, TransferJournal* journal)
    : store_(store), options_(options), journal_(journal) {
    if (options_.chunk_size == 0) {
        throw InternalError("Transfer chunk size must be positive");
    }
    options_.parallel_chunks = std::max(1, options_.parallel_chunks);
    options_.max_retries = std::max(0, options_.max_retries);
}

std::string TransferEngine::ResolveDestination(const std::string& download_dir, const std::string& bucket,
                                               const std::string& key) {
    if (bucket.empty() || bucket == "." || bucket == ".." || bucket.find('/') != std::string::npos) {
        throw SchemaValidationError("Bucket name '" + bucket + "' cannot be used as a directory");
    }
    if (key.empty()) {
        throw SchemaValidationError("Object key must not be empty");
    }

    std::size_t start = 0;
    while (start <= key.size()) {
        std::size_t end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        std::string segment = key.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw SchemaValidationError("Object key '" + key + "' cannot be stored as a local file");
        }
        start = end + 1;
    }

    return (std::filesystem::path(download_dir) / bucket / key).string();
}

void TransferEngine::ClaimLocation(const std::string& location, const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(active_mutex_);
    while (active_locations_.count(location) != 0) {
        if (token.IsCancelled()) {
            lock.unlock();
            token.ThrowIfCancelled("Waiting for " + location);
        }
        active_cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    active_locations_.insert(location);
}

void TransferEngine::ReleaseLocation(const std::string& location) {
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_locations_.erase(location);
    }
    active_cv_.notify_all();
}

void TransferEngine::Backoff(int attempt, const CancellationToken& token) const {
    long long delay_ms = options_.retry_initial_backoff_ms;
    for (int i = 0; i < attempt && delay_ms < options_.retry_max_backoff_ms; ++i) {
        delay_ms *= 2;
    }
    delay_ms = std::min<long long>(delay_ms, options_.retry_max_backoff_ms);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        token.ThrowIfCancelled("Retry backoff");
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(20)));
    }
}

std::string TransferEngine::FetchChunk(const std::string& bucket, const std::string& key,
                                       std::uint64_t offset, std::uint64_t length,
                                       const ReadPrecondition& expected, const CancellationToken& token) {
    for (int attempt = 0;; ++attempt) {
        token.ThrowIfCancelled("Chunk fetch");
        try {
            return store_.GetObjectRange(bucket, key, offset, length, expected, token);
        } catch (const ConnectivityError& e) {
            if (attempt >= options_.max_retries) {
                Logger::Error("Chunk at offset " + std::to_string(offset) + " of " + Describe(bucket, key) +
                              " failed after " + std::to_string(attempt + 1) + " attempts: " + e.what(),
                              "Transfer");
                throw;
            }
            Logger::Warn("Chunk at offset " + std::to_string(offset) + " of " + Describe(bucket, key) +
                         " failed (attempt " + std::to_string(attempt + 1) + "/" +
                         std::to_string(options_.max_retries + 1) + "): " + e.what() + "; retrying",
                         "Transfer");
            Backoff(attempt, token);
        } catch (const RangeNotSatisfiableError& e) {
            // The range was valid against the size HEAD reported, so the object shrank.
            throw IntegrityError("Object " + Describe(bucket, key) + " changed during transfer: " + e.what());
        }
    }
}

void TransferEngine::RunChunks(TransferTask& task, DestinationSink& sink, bool journaled,
                               const CancellationToken& token) {
    const std::uint64_t size = task.total_bytes;
    if (task.bytes_transferred >= size) {
        return;
    }

    // Stops sibling fetches when one chunk fails.
    CancellationSource abort_source(token);
    const CancellationToken& fetch_token = abort_source.Token();
    const ReadPrecondition expected{task.object.etag.value_or(""), size};

    std::deque<PendingChunk> window;
    std::uint64_t next_offset = task.bytes_transferred;

    auto launch = [&]() {
        std::uint64_t length = std::min<std::uint64_t>(options_.chunk_size, size - next_offset);
        PendingChunk chunk{next_offset, length, {}};
        chunk.data = std::async(std::launch::async, [this, &task, &expected, &fetch_token,
                                                     offset = next_offset, length]() {
            return FetchChunk(task.bucket, task.key, offset, length, expected, fetch_token);
        });
        window.push_back(std::move(chunk));
        next_offset += length;
    };

    try {
        while (window.size() < static_cast<std::size_t>(options_.parallel_chunks) && next_offset < size) {
            launch();
        }

        while (!window.empty()) {
            PendingChunk chunk = std::move(window.front());
            window.pop_front();

            std::string data = chunk.data.get();
            if (data.size() != chunk.length) {
                throw IntegrityError("Object " + Describe(task.bucket, task.key) + " returned " +
                                     std::to_string(data.size()) + " bytes at offset " +
                                     std::to_string(chunk.offset) + ", expected " +
                                     std::to_string(chunk.length) + "; it changed during transfer");
            }

            // Chunk boundary: the last point where cancellation is observed before writing.
            token.ThrowIfCancelled("Transfer of " + Describe(task.bucket, task.key));

            sink.Write(data);
            sink.Flush();
            task.bytes_transferred += data.size();
            task.chunks_fetched++;
            if (journaled) {
                journal_->Checkpoint(task.bucket, task.key, task.bytes_transferred);
            }
            Logger::Debug(Describe(task.bucket, task.key) + ": " + std::to_string(task.bytes_transferred) +
                          "/" + std::to_string(size) + " bytes", "Transfer");

            if (next_offset < size) {
                launch();
            }
        }
    } catch (...) {
        abort_source.Cancel();
        for (auto& pending : window) {
            pending.data.wait();
        }
        throw;
    }
}

TransferTask TransferEngine::Download(const std::string& bucket, const std::string& key,
                                      DestinationSink& sink, const CancellationToken& token) {
    TransferTask task;
    task.bucket = bucket;
    task.key = key;
    task.destination = sink.Location();
    task.state = TransferState::PENDING;

    const bool claims_location = sink.SupportsResume();
    if (claims_location) {
        ClaimLocation(task.destination, token);
    }
    // Holds its own copy; `task` is returned by value and may be moved before this runs.
    struct LocationGuard {
        TransferEngine* engine;
        std::string location;
        bool active;
        ~LocationGuard() {
            if (active) engine->ReleaseLocation(location);
        }
    } guard{this, task.destination, claims_location};

    task.object = store_.HeadObject(bucket, key, token);
    task.total_bytes = task.object.size;

    const bool journaled = journal_ != nullptr && sink.SupportsResume() && task.object.etag.has_value();
    std::uint64_t resume_offset = 0;
    if (journaled) {
        auto entry = journal_->Find(bucket, key);
        if (entry) {
            if (entry->etag == *task.object.etag && entry->size == task.object.size &&
                entry->destination == task.destination && entry->committed_bytes <= task.object.size) {
                resume_offset = entry->committed_bytes;
            } else {
                Logger::Info("Discarding stale bookmark for " + Describe(bucket, key), "Transfer");
            }
        }
    }

    try {
        std::uint64_t start = sink.Open(resume_offset);
        if (journaled) {
            journal_->Begin(JournalEntry{bucket, key, *task.object.etag, task.object.size,
                                         task.destination, start});
        }
        task.resumed_from = start;
        task.bytes_transferred = start;
        task.state = TransferState::IN_PROGRESS;
        Logger::Info(Describe(bucket, key) + " -> " + task.destination + " " + TransferStateName(task.state) +
                     " (" + std::to_string(task.total_bytes) + " bytes" +
                     (start > 0 ? ", resuming at " + std::to_string(start) : "") + ")", "Transfer");

        RunChunks(task, sink, journaled, token);

        if (task.bytes_transferred != task.total_bytes) {
            throw IntegrityError("Delivered " + std::to_string(task.bytes_transferred) + " bytes of " +
                                 Describe(bucket, key) + ", expected " + std::to_string(task.total_bytes));
        }
        if (IsChecksumVerifiable(task.object)) {
            std::string actual = sink.Checksum();
            if (!ChecksumEquals(*task.object.etag, actual)) {
                throw IntegrityError("Checksum mismatch for " + Describe(bucket, key) + ": expected " +
                                     *task.object.etag + ", got " + actual);
            }
        }

        sink.Commit();
        if (journaled) {
            journal_->Remove(bucket, key);
        }
    } catch (const BridgeError& e) {
        task.state = TransferState::FAILED;
        task.error_kind = e.KindName();
        task.error_message = e.what();
        if (journaled && e.Kind() == ErrorKind::Connectivity) {
            sink.Release();
            Logger::Warn(Describe(bucket, key) + " FAILED with " + task.error_kind + "; " +
                         std::to_string(task.bytes_transferred) + " bytes kept for resume", "Transfer");
        } else {
            sink.Discard();
            if (journaled) {
                journal_->Remove(bucket, key);
            }
            Logger::Error(Describe(bucket, key) + " FAILED with " + task.error_kind + ": " + e.what(),
                          "Transfer");
        }
        throw;
    } catch (const std::exception& e) {
        task.state = TransferState::FAILED;
        sink.Discard();
        if (journaled) {
            journal_->Remove(bucket, key);
        }
        Logger::Error(Describe(bucket, key) + " FAILED: " + e.what(), "Transfer");
        throw InternalError("Transfer of " + Describe(bucket, key) + " failed: " + e.what());
    }

    task.state = TransferState::COMPLETED;
    Logger::Info(Describe(bucket, key) + " -> " + task.destination + " " + TransferStateName(task.state) +
                 " (" + std::to_string(task.chunks_fetched) + " chunks)", "Transfer");
    return task;
}

TransferTask TransferEngine::DownloadToFile(const std::string& bucket, const std::string& key,
                                            const std::string& download_dir, const CancellationToken& token) {
    FileSink sink(ResolveDestination(download_dir, bucket, key));
    return Download(bucket, key, sink, token);
}
