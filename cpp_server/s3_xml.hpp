#ifndef S3_XML_HPP
#define S3_XML_HPP

#include <string>
#include <vector>
#include "types.hpp"

// Parsers for the S3 REST XML bodies. All throw ConnectivityError on a body
// that is not the expected document (a proxy error page, a truncated read).

std::vector<BucketDescriptor> ParseListAllMyBucketsResult(const std::string& body);

ObjectListing ParseListBucketResult(const std::string& body, const std::string& bucket);

struct S3ErrorInfo {
    std::string code;
    std::string message;
};

// Empty code when the body is not an <Error> document.
S3ErrorInfo ParseS3Error(const std::string& body);

// Strips surrounding quotes (and the &quot; form some stores emit).
std::string NormalizeEtag(const std::string& etag);

#endif // S3_XML_HPP
