#ifndef SIGV4_HPP
#define SIGV4_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

using QueryParams = std::vector<std::pair<std::string, std::string>>;
using HeaderMap = std::map<std::string, std::string>; // lowercase names

struct AwsCredentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
};

// Helpers shared by the signer and the tests
std::string HmacSha256(const std::string& key, const std::string& msg);
std::string HexEncode(const unsigned char* data, size_t len);
std::string Sha256Hex(const std::string& str);

// RFC 3986 encoding as required by SigV4. '/' is kept when encode_slash is false.
std::string UriEncode(const std::string& value, bool encode_slash);

// Sorted, encoded "k=v&k=v" form.
std::string CanonicalQueryString(const QueryParams& params);

// "YYYYMMDDTHHMMSSZ" for the current time.
std::string AmzDateNow();

// AWS Signature Version 4 for S3 requests with unsigned payloads.
class SigV4Signer {
public:
    SigV4Signer(AwsCredentials credentials, std::string region, std::string service = "s3");

    // `headers` must contain "host". Adds x-amz-date, x-amz-content-sha256,
    // x-amz-security-token (when configured) and authorization. Every header
    // present in the map is signed.
    void SignHeaders(const std::string& method, const std::string& canonical_uri,
                     const QueryParams& query, HeaderMap& headers,
                     const std::string& amz_date) const;

    // Query string (without '?') of a presigned request, signature included.
    std::string PresignQuery(const std::string& method, const std::string& host,
                             const std::string& canonical_uri, QueryParams query,
                             int expires_in_seconds, const std::string& amz_date) const;

    bool HasCredentials() const { return !credentials_.access_key.empty(); }

private:
    std::string SigningKey(const std::string& date_ymd) const;
    std::string Scope(const std::string& date_ymd) const;

    AwsCredentials credentials_;
    std::string region_;
    std::string service_;
};

#endif // SIGV4_HPP
