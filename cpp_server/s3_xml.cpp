#include "s3_xml.hpp"
#include "errors.hpp"
#include <rapidxml/rapidxml.hpp>
#include <cstdlib>
#include <cstring>

using namespace rapidxml;

namespace {

std::string ChildValue(xml_node<>* node, const char* name) {
    xml_node<>* child = node->first_node(name);
    if (child == nullptr) {
        return {};
    }
    return std::string(child->value(), child->value_size());
}

// rapidxml parses in place, so each parse works on its own copy of the body.
void ParseInto(xml_document<>& doc, std::vector<char>& buffer, const std::string& body) {
    buffer.assign(body.begin(), body.end());
    buffer.push_back('\0');
    try {
        doc.parse<0>(buffer.data());
    } catch (const parse_error& e) {
        throw ConnectivityError(std::string("Malformed S3 response: ") + e.what());
    }
}

} // namespace

std::string NormalizeEtag(const std::string& etag) {
    std::string value = etag;
    const std::string entity = "&quot;";
    if (value.size() >= 2 * entity.size() && value.compare(0, entity.size(), entity) == 0 &&
        value.compare(value.size() - entity.size(), entity.size(), entity) == 0) {
        return value.substr(entity.size(), value.size() - 2 * entity.size());
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::vector<BucketDescriptor> ParseListAllMyBucketsResult(const std::string& body) {
    xml_document<> doc;
    std::vector<char> buffer;
    ParseInto(doc, buffer, body);

    xml_node<>* result = doc.first_node();
    if (result == nullptr || std::strcmp(result->name(), "ListAllMyBucketsResult") != 0) {
        throw ConnectivityError("Unexpected S3 response to ListBuckets");
    }

    std::vector<BucketDescriptor> buckets;
    xml_node<>* buckets_node = result->first_node("Buckets");
    if (buckets_node == nullptr) {
        return buckets;
    }
    for (xml_node<>* bucket_node = buckets_node->first_node("Bucket"); bucket_node != nullptr;
         bucket_node = bucket_node->next_sibling("Bucket")) {
        BucketDescriptor bucket;
        bucket.name = ChildValue(bucket_node, "Name");
        bucket.creation_date = ChildValue(bucket_node, "CreationDate");
        if (bucket.name.empty()) {
            throw ConnectivityError("S3 ListBuckets entry without a name");
        }
        buckets.push_back(bucket);
    }
    return buckets;
}

ObjectListing ParseListBucketResult(const std::string& body, const std::string& bucket) {
    xml_document<> doc;
    std::vector<char> buffer;
    ParseInto(doc, buffer, body);

    xml_node<>* result = doc.first_node();
    if (result == nullptr || std::strcmp(result->name(), "ListBucketResult") != 0) {
        throw ConnectivityError("Unexpected S3 response to ListObjectsV2");
    }

    ObjectListing listing;
    bool truncated = false;
    std::string next_token;

    for (xml_node<>* n = result->first_node(); n != nullptr; n = n->next_sibling()) {
        const char* name = n->name();
        if (std::strcmp(name, "IsTruncated") == 0) {
            truncated = std::strcmp(n->value(), "true") == 0;
        } else if (std::strcmp(name, "NextContinuationToken") == 0) {
            next_token.assign(n->value(), n->value_size());
        } else if (std::strcmp(name, "Contents") == 0) {
            xml_node<>* key = n->first_node("Key");
            xml_node<>* size = n->first_node("Size");
            if (key == nullptr || size == nullptr) {
                throw ConnectivityError("S3 listing entry without Key or Size");
            }
            ObjectDescriptor object;
            object.bucket = bucket;
            object.key.assign(key->value(), key->value_size());
            object.size = std::strtoull(size->value(), nullptr, 10);
            object.last_modified = ChildValue(n, "LastModified");
            std::string etag = NormalizeEtag(ChildValue(n, "ETag"));
            if (!etag.empty()) {
                object.etag = etag;
            }
            listing.objects.push_back(object);
        } else if (std::strcmp(name, "CommonPrefixes") == 0) {
            for (xml_node<>* prefix = n->first_node("Prefix"); prefix != nullptr;
                 prefix = prefix->next_sibling("Prefix")) {
                listing.common_prefixes.emplace_back(prefix->value(), prefix->value_size());
            }
        }
    }

    if (truncated) {
        if (next_token.empty()) {
            throw ConnectivityError("S3 listing truncated without a continuation token");
        }
        listing.next_token = next_token;
    }
    return listing;
}

S3ErrorInfo ParseS3Error(const std::string& body) {
    S3ErrorInfo info;
    if (body.empty()) {
        return info;
    }
    try {
        xml_document<> doc;
        std::vector<char> buffer;
        ParseInto(doc, buffer, body);
        xml_node<>* root = doc.first_node("Error");
        if (root == nullptr) {
            return info;
        }
        info.code = ChildValue(root, "Code");
        info.message = ChildValue(root, "Message");
    } catch (const ConnectivityError&) {
        // Non-XML error bodies carry no code; the HTTP status decides.
        return S3ErrorInfo{};
    }
    return info;
}
