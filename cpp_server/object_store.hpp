#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "types.hpp"

// What a ranged read expects of the object, as its HEAD described it.
struct ReadPrecondition {
    std::string etag;                          // sent as If-Match when non-empty
    std::optional<std::uint64_t> object_size;  // checked against the size the GET reports
};

// Provider-neutral view of an S3-compatible store. Implementations must be
// safe to call from many invocations at once.
//
// Errors: ConnectivityError, NotFoundError, RangeNotSatisfiableError, and
// IntegrityError when a ReadPrecondition does not hold.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Empty vector when the account owns no buckets.
    virtual std::vector<BucketDescriptor> ListBuckets(const CancellationToken& token) = 0;

    // One page. next_token is set when the store truncated the result.
    virtual ObjectListing ListObjects(const ListObjectsRequest& request, const CancellationToken& token) = 0;

    virtual ObjectDescriptor HeadObject(const std::string& bucket, const std::string& key,
                                        const CancellationToken& token) = 0;

    // Returns at most `length` bytes starting at `offset`. offset == size yields an
    // empty result; offset > size throws RangeNotSatisfiableError.
    virtual std::string GetObjectRange(const std::string& bucket, const std::string& key,
                                       std::uint64_t offset, std::uint64_t length,
                                       const ReadPrecondition& expected,
                                       const CancellationToken& token) = 0;
};

// Signs time-limited GET URLs. Only stores with credentials offer this.
class UrlPresigner {
public:
    virtual ~UrlPresigner() = default;

    virtual std::string PresignGetObject(const std::string& bucket, const std::string& key,
                                         int expires_in_seconds) const = 0;
};

#endif // OBJECT_STORE_HPP
