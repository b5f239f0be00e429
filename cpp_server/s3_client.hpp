#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "object_store.hpp"
#include "sigv4.hpp"

typedef void CURL;

// ObjectStore over the S3 REST API (libcurl + SigV4). One instance is built at
// startup and shared by every invocation; the only mutable state is the pool
// of idle curl handles, which keeps connections alive between calls.
class S3Client : public ObjectStore, public UrlPresigner {
public:
    explicit S3Client(const Config::S3Config& config);
    ~S3Client() override;

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;

    std::vector<BucketDescriptor> ListBuckets(const CancellationToken& token) override;

    ObjectListing ListObjects(const ListObjectsRequest& request, const CancellationToken& token) override;

    ObjectDescriptor HeadObject(const std::string& bucket, const std::string& key,
                                const CancellationToken& token) override;

    std::string GetObjectRange(const std::string& bucket, const std::string& key,
                               std::uint64_t offset, std::uint64_t length,
                               const ReadPrecondition& expected,
                               const CancellationToken& token) override;

    std::string PresignGetObject(const std::string& bucket, const std::string& key,
                                 int expires_in_seconds) const override;

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
        HeaderMap headers; // lowercase names
    };

    struct Target {
        std::string host;
        std::string path; // unencoded, starts with '/'
    };

    Target MakeTarget(const std::string& bucket, const std::string& key) const;
    std::string MakeUrl(const Target& target, const std::string& query) const;

    HttpResponse Perform(const std::string& method, const Target& target, const QueryParams& query,
                         HeaderMap headers, const CancellationToken& token);

    [[noreturn]] void ThrowForStatus(const HttpResponse& response, const std::string& bucket,
                                     const std::string& key) const;

    CURL* AcquireHandle();
    void ReleaseHandle(CURL* handle);

    Config::S3Config config_;
    SigV4Signer signer_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// RFC 1123 ("Wed, 21 Oct 2015 07:28:00 GMT") to ISO-8601 ("2015-10-21T07:28:00.000Z").
// Returns the input unchanged when it does not parse.
std::string HttpDateToIso8601(const std::string& http_date);

// Total size from "bytes 0-99/1234"; nullopt when absent or "*".
std::optional<std::uint64_t> ContentRangeTotal(const std::string& content_range);

#endif // S3_CLIENT_HPP
