#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct BucketDescriptor {
    std::string name;
    std::string creation_date; // ISO-8601, as reported by the store
};

// Read-only projection of one remote object. Never cached across requests.
struct ObjectDescriptor {
    std::string bucket;
    std::string key;
    std::uint64_t size = 0;
    std::string last_modified;
    std::string content_type;
    std::optional<std::string> etag; // quotes stripped
    // x-amz-server-side-encryption ("AES256", "aws:kms", ...), "SSE-C" for
    // customer keys, empty when none or unknown (listings do not report it).
    std::string encryption;
};

struct ObjectListing {
    std::vector<ObjectDescriptor> objects;
    std::vector<std::string> common_prefixes;
    std::optional<std::string> next_token;
};

struct ListObjectsRequest {
    std::string bucket;
    std::string prefix;
    std::string continuation_token;
    std::string delimiter;
    int max_keys = 0; // 0 means the store default
};

enum class TransferState {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

std::string TransferStateName(TransferState state);

// One download from its creation until the caller receives the result.
struct TransferTask {
    std::string bucket;
    std::string key;
    std::string destination;
    TransferState state = TransferState::PENDING;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t resumed_from = 0;
    std::uint32_t chunks_fetched = 0;
    ObjectDescriptor object;
    std::string error_kind;
    std::string error_message;
};

#endif // TYPES_HPP
