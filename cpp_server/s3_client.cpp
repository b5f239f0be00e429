#include "s3_client.hpp"
#include "logger.hpp"
#include "s3_xml.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <utility>

namespace {

size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    HeaderMap* headers = static_cast<HeaderMap*>(userdata);
    std::string line(buffer, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        (*headers)[name] = value;
    }
    return size * nitems;
}

// Aborts the transfer once the invocation's token fires.
int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancellationToken* token = static_cast<const CancellationToken*>(clientp);
    return token->IsCancelled() ? 1 : 0;
}

std::string HeaderOr(const HeaderMap& headers, const std::string& name, const std::string& fallback) {
    auto it = headers.find(name);
    return it == headers.end() ? fallback : it->second;
}

void CheckObjectSize(const ReadPrecondition& expected, std::optional<std::uint64_t> actual,
                     const std::string& key) {
    if (!expected.object_size || !actual || *actual == *expected.object_size) {
        return;
    }
    throw IntegrityError("Object '" + key + "' is now " + std::to_string(*actual) + " bytes, expected " +
                         std::to_string(*expected.object_size));
}

} // namespace

std::optional<std::uint64_t> ContentRangeTotal(const std::string& content_range) {
    std::size_t slash = content_range.rfind('/');
    if (slash == std::string::npos || slash + 1 >= content_range.size()) {
        return std::nullopt;
    }
    std::string total = content_range.substr(slash + 1);
    if (!std::all_of(total.begin(), total.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::strtoull(total.c_str(), nullptr, 10);
}

std::string HttpDateToIso8601(const std::string& http_date) {
    std::tm tm{};
    const char* end = strptime(http_date.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
    if (end == nullptr) {
        return http_date;
    }
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S.000Z", &tm);
    return buffer;
}

S3Client::S3Client(const Config::S3Config& config)
    : config_(config),
      signer_(AwsCredentials{config.access_key, config.secret_key, config.session_token}, config.region) {
    curl_global_init(CURL_GLOBAL_ALL);
    if (!signer_.HasCredentials()) {
        Logger::Warn("No S3 credentials configured; requests will be sent unsigned", "S3Client");
    }
}

S3Client::~S3Client() {
    for (CURL* handle : idle_handles_) {
        curl_easy_cleanup(handle);
    }
    idle_handles_.clear();
    curl_global_cleanup();
}

CURL* S3Client::AcquireHandle() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            curl_easy_reset(handle);
            return handle;
        }
    }
    CURL* handle = curl_easy_init();
    if (!handle) {
        throw ConnectivityError("Failed to create curl handle");
    }
    return handle;
}

void S3Client::ReleaseHandle(CURL* handle) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    idle_handles_.push_back(handle);
}

S3Client::Target S3Client::MakeTarget(const std::string& bucket, const std::string& key) const {
    Target target;
    if (bucket.empty()) {
        target.host = config_.endpoint;
        target.path = "/";
    } else if (config_.path_style) {
        target.host = config_.endpoint;
        target.path = "/" + bucket + "/" + key;
    } else {
        target.host = bucket + "." + config_.endpoint;
        target.path = "/" + key;
    }
    return target;
}

std::string S3Client::MakeUrl(const Target& target, const std::string& query) const {
    std::string url = (config_.use_https ? "https://" : "http://") + target.host +
                      UriEncode(target.path, false);
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

S3Client::HttpResponse S3Client::Perform(const std::string& method, const Target& target,
                                         const QueryParams& query, HeaderMap headers,
                                         const CancellationToken& token) {
    token.ThrowIfCancelled("S3 " + method);

    headers["host"] = target.host;
    if (signer_.HasCredentials()) {
        signer_.SignHeaders(method, target.path, query, headers, AmzDateNow());
    }

    const std::string url = MakeUrl(target, CanonicalQueryString(query));

    CURL* curl = AcquireHandle();
    HttpResponse response;

    struct curl_slist* header_list = NULL;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, (header.first + ": " + header.second).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(&token));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config_.request_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!config_.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(header_list);
    ReleaseHandle(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        token.ThrowIfCancelled("S3 " + method + " " + target.path);
    }
    if (res != CURLE_OK) {
        Logger::Warn("S3 " + method + " " + target.host + target.path + " failed: " +
                     curl_easy_strerror(res), "S3Client");
        throw ConnectivityError("S3 request failed: " + std::string(curl_easy_strerror(res)));
    }

    Logger::Debug("S3 " + method + " " + target.host + target.path + " -> " +
                  std::to_string(response.status), "S3Client");
    return response;
}

void S3Client::ThrowForStatus(const HttpResponse& response, const std::string& bucket,
                              const std::string& key) const {
    S3ErrorInfo error = ParseS3Error(response.body);
    std::string detail = error.code.empty() ? "" : " (" + error.code + ")";
    if (!error.message.empty()) {
        detail += ": " + error.message;
    }

    if (error.code == "NoSuchBucket") {
        throw NotFoundError("Bucket '" + bucket + "' not found");
    }
    if (error.code == "NoSuchKey" || (response.status == 404 && !key.empty())) {
        throw NotFoundError("Object '" + key + "' not found in bucket '" + bucket + "'");
    }
    if (response.status == 404) {
        throw NotFoundError("Bucket '" + bucket + "' not found");
    }
    if (response.status == 416 || error.code == "InvalidRange") {
        throw RangeNotSatisfiableError("Requested range not satisfiable for '" + key + "'" + detail);
    }
    if (response.status == 412 || error.code == "PreconditionFailed") {
        throw IntegrityError("Object '" + key + "' changed during transfer" + detail);
    }
    if (response.status == 401 || response.status == 403) {
        throw ConnectivityError("Access denied by S3 (HTTP " + std::to_string(response.status) + ")" + detail);
    }
    throw ConnectivityError("S3 request failed with HTTP " + std::to_string(response.status) + detail);
}

std::vector<BucketDescriptor> S3Client::ListBuckets(const CancellationToken& token) {
    HttpResponse response = Perform("GET", MakeTarget("", ""), {}, {}, token);
    if (response.status != 200) {
        // Any failure here is a connectivity or credential problem, never a missing bucket.
        S3ErrorInfo error = ParseS3Error(response.body);
        throw ConnectivityError("ListBuckets failed with HTTP " + std::to_string(response.status) +
                                (error.code.empty() ? "" : " (" + error.code + ")"));
    }
    return ParseListAllMyBucketsResult(response.body);
}

ObjectListing S3Client::ListObjects(const ListObjectsRequest& request, const CancellationToken& token) {
    QueryParams query;
    query.emplace_back("list-type", "2");
    if (!request.prefix.empty()) {
        query.emplace_back("prefix", request.prefix);
    }
    if (!request.continuation_token.empty()) {
        query.emplace_back("continuation-token", request.continuation_token);
    }
    if (!request.delimiter.empty()) {
        query.emplace_back("delimiter", request.delimiter);
    }
    int max_keys = request.max_keys > 0 ? std::min(request.max_keys, config_.max_keys) : config_.max_keys;
    query.emplace_back("max-keys", std::to_string(max_keys));

    Target target = MakeTarget(request.bucket, "");
    HttpResponse response = Perform("GET", target, query, {}, token);
    if (response.status != 200) {
        ThrowForStatus(response, request.bucket, "");
    }
    return ParseListBucketResult(response.body, request.bucket);
}

ObjectDescriptor S3Client::HeadObject(const std::string& bucket, const std::string& key,
                                      const CancellationToken& token) {
    HttpResponse response = Perform("HEAD", MakeTarget(bucket, key), {}, {}, token);
    if (response.status != 200) {
        ThrowForStatus(response, bucket, key);
    }

    ObjectDescriptor object;
    object.bucket = bucket;
    object.key = key;
    object.size = std::strtoull(HeaderOr(response.headers, "content-length", "0").c_str(), nullptr, 10);
    object.last_modified = HttpDateToIso8601(HeaderOr(response.headers, "last-modified", ""));
    object.content_type = HeaderOr(response.headers, "content-type", "application/octet-stream");
    std::string etag = NormalizeEtag(HeaderOr(response.headers, "etag", ""));
    if (!etag.empty()) {
        object.etag = etag;
    }
    if (response.headers.count("x-amz-server-side-encryption-customer-algorithm") != 0) {
        object.encryption = "SSE-C";
    } else {
        object.encryption = HeaderOr(response.headers, "x-amz-server-side-encryption", "");
    }
    return object;
}

std::string S3Client::GetObjectRange(const std::string& bucket, const std::string& key,
                                     std::uint64_t offset, std::uint64_t length,
                                     const ReadPrecondition& expected,
                                     const CancellationToken& token) {
    if (length == 0) {
        ObjectDescriptor object = HeadObject(bucket, key, token);
        if (offset > object.size) {
            throw RangeNotSatisfiableError("Offset " + std::to_string(offset) + " exceeds size " +
                                           std::to_string(object.size) + " of '" + key + "'");
        }
        return {};
    }

    HeaderMap headers;
    headers["range"] = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    if (!expected.etag.empty()) {
        headers["if-match"] = "\"" + expected.etag + "\"";
    }

    HttpResponse response = Perform("GET", MakeTarget(bucket, key), {}, headers, token);
    if (response.status == 206) {
        std::optional<std::uint64_t> total = ContentRangeTotal(HeaderOr(response.headers, "content-range", ""));
        CheckObjectSize(expected, total, key);
        return std::move(response.body);
    }
    if (response.status == 200) {
        // Store ignored the Range header and sent the whole object.
        CheckObjectSize(expected, response.body.size(), key);
        if (offset >= response.body.size()) {
            if (offset == response.body.size()) {
                return {};
            }
            throw RangeNotSatisfiableError("Offset " + std::to_string(offset) + " exceeds size of '" + key + "'");
        }
        return response.body.substr(offset, length);
    }
    if (response.status == 416) {
        // S3 answers 416 for a range starting exactly at the end; that read is empty, not an error.
        ObjectDescriptor object = HeadObject(bucket, key, token);
        if (offset == object.size) {
            return {};
        }
        throw RangeNotSatisfiableError("Offset " + std::to_string(offset) + " exceeds size " +
                                       std::to_string(object.size) + " of '" + key + "'");
    }
    ThrowForStatus(response, bucket, key);
}

std::string S3Client::PresignGetObject(const std::string& bucket, const std::string& key,
                                       int expires_in_seconds) const {
    if (!signer_.HasCredentials()) {
        throw ConnectivityError("Cannot presign URLs without S3 credentials");
    }
    Target target = MakeTarget(bucket, key);
    std::string query = signer_.PresignQuery("GET", target.host, target.path, {},
                                             expires_in_seconds, AmzDateNow());
    return MakeUrl(target, query);
}
