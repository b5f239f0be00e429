#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <string>
#include <openssl/evp.h>
#include "types.hpp"

// Incremental MD5, the digest S3 reports as the ETag of single-part uploads.
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void Update(const char* data, size_t len);
    void Update(const std::string& data) { Update(data.data(), data.size()); }

    // Lowercase hex. The hasher cannot be updated afterwards.
    std::string FinalHex();

private:
    EVP_MD_CTX* ctx_;
};

std::string Md5Hex(const std::string& data);

// Streams a file through MD5. Throws InternalError if the file cannot be read.
std::string Md5HexOfFile(const std::string& path);

// True for a plain 32-hex-digit ETag. Multipart ("<hex>-<n>") and opaque ETags
// cannot be recomputed from the bytes.
bool IsVerifiableEtag(const std::string& etag);

// True when the ETag is the MD5 of the bytes a GET returns: a plain ETag on an
// object stored unencrypted or with SSE-S3. SSE-KMS and SSE-C ETags are not.
bool IsChecksumVerifiable(const ObjectDescriptor& object);

bool ChecksumEquals(const std::string& expected, const std::string& actual);

#endif // CHECKSUM_HPP
