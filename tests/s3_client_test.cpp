#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include "httplib.h"
#include "errors.hpp"
#include "s3_client.hpp"

namespace {

// Path-style S3 endpoint on 127.0.0.1. Successful ranged GETs are sliced by
// httplib itself, which answers 206 with a Content-Range header.
class FakeS3Server {
public:
    struct Object {
        std::string data;
        std::string etag;
        std::map<std::string, std::string> headers;
    };

    FakeS3Server() {
        server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (list_buckets_status_ != 200) {
                SendError(res, list_buckets_status_, "AccessDenied");
                return;
            }
            std::string body = "<ListAllMyBucketsResult><Buckets>";
            for (const auto& bucket : buckets_) {
                body += "<Bucket><Name>" + bucket.first +
                        "</Name><CreationDate>2024-01-02T03:04:05.000Z</CreationDate></Bucket>";
            }
            body += "</Buckets></ListAllMyBucketsResult>";
            res.set_content(body, "application/xml");
        });

        server_.Get(R"(/([^/]+)/)", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::string bucket = req.matches[1];
            if (buckets_.count(bucket) == 0) {
                SendError(res, 404, "NoSuchBucket");
                return;
            }
            std::string body = "<ListBucketResult><Name>" + bucket + "</Name><IsTruncated>false</IsTruncated>";
            for (const auto& entry : objects_) {
                if (entry.first.rfind(bucket + "/", 0) != 0) continue;
                body += "<Contents><Key>" + entry.first.substr(bucket.size() + 1) +
                        "</Key><LastModified>2024-05-01T10:00:00.000Z</LastModified><ETag>\"" +
                        entry.second.etag + "\"</ETag><Size>" + std::to_string(entry.second.data.size()) +
                        "</Size></Contents>";
            }
            body += "</ListBucketResult>";
            res.set_content(body, "application/xml");
        });

        server_.Get(R"(/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::string bucket = req.matches[1];
            const std::string key = req.matches[2];
            last_if_match_ = req.get_header_value("If-Match");

            auto forced = forced_.find(key);
            if (forced != forced_.end()) {
                SendError(res, forced->second.first, forced->second.second);
                return;
            }
            if (buckets_.count(bucket) == 0) {
                SendError(res, 404, "NoSuchBucket");
                return;
            }
            auto it = objects_.find(bucket + "/" + key);
            if (it == objects_.end()) {
                SendError(res, 404, "NoSuchKey");
                return;
            }
            const Object& object = it->second;
            if (req.has_header("If-Match") && req.get_header_value("If-Match") != "\"" + object.etag + "\"") {
                SendError(res, 412, "PreconditionFailed");
                return;
            }
            if (req.has_header("Range")) {
                const std::string range = req.get_header_value("Range");
                std::uint64_t first = std::stoull(range.substr(range.find('=') + 1));
                if (first >= object.data.size()) {
                    SendError(res, 416, "InvalidRange");
                    return;
                }
            }
            res.set_header("ETag", "\"" + object.etag + "\"");
            res.set_header("Last-Modified", "Wed, 01 May 2024 10:00:00 GMT");
            for (const auto& header : object.headers) {
                res.set_header(header.first, header.second);
            }
            res.set_content(object.data, "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~FakeS3Server() {
        server_.stop();
        thread_.join();
    }

    void CreateBucket(const std::string& bucket) {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_[bucket] = true;
    }

    void PutObject(const std::string& bucket, const std::string& key, Object object) {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_[bucket] = true;
        objects_[bucket + "/" + key] = std::move(object);
    }

    // Every request for `key` fails with this status and S3 error code.
    void Fail(const std::string& key, int status, const std::string& code) {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_[key] = {status, code};
    }

    void FailListBuckets(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        list_buckets_status_ = status;
    }

    std::string LastIfMatch() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_if_match_;
    }

    int Port() const { return port_; }

private:
    static void SendError(httplib::Response& res, int status, const std::string& code) {
        res.status = status;
        res.set_content("<?xml version=\"1.0\" encoding=\"UTF-8\"?><Error><Code>" + code +
                            "</Code><Message>" + code + " from fake</Message></Error>",
                        "application/xml");
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, bool> buckets_;
    std::map<std::string, Object> objects_;
    std::map<std::string, std::pair<int, std::string>> forced_;
    int list_buckets_status_ = 200;
    std::string last_if_match_;
};

Config::S3Config LocalConfig(int port) {
    Config::S3Config config;
    config.endpoint = "127.0.0.1:" + std::to_string(port);
    config.use_https = false;
    config.path_style = true;
    config.connect_timeout_ms = 2000;
    config.request_timeout_ms = 5000;
    return config;
}

class S3ClientTest : public ::testing::Test {
protected:
    S3ClientTest() : client_(LocalConfig(server_.Port())) {
        server_.PutObject("docs", "notes.txt", {"0123456789abcdefghij", "5f2a8a8e1d1e4b7c9e0f1a2b3c4d5e6f", {}});
        server_.CreateBucket("empty");
    }

    const CancellationToken& None() { return CancellationToken::None(); }

    FakeS3Server server_;
    S3Client client_;
};

} // namespace

TEST_F(S3ClientTest, HeadObjectReadsDescriptor) {
    ObjectDescriptor object = client_.HeadObject("docs", "notes.txt", None());
    EXPECT_EQ(object.bucket, "docs");
    EXPECT_EQ(object.key, "notes.txt");
    EXPECT_EQ(object.size, 20u);
    EXPECT_EQ(object.etag.value_or(""), "5f2a8a8e1d1e4b7c9e0f1a2b3c4d5e6f");
    EXPECT_EQ(object.last_modified, "2024-05-01T10:00:00.000Z");
    EXPECT_EQ(object.content_type, "text/plain");
    EXPECT_TRUE(object.encryption.empty());
}

TEST_F(S3ClientTest, HeadObjectReportsServerSideEncryption) {
    server_.PutObject("docs", "kms.txt", {"secret", "0123456789abcdef0123456789abcdef",
                                          {{"x-amz-server-side-encryption", "aws:kms"}}});
    server_.PutObject("docs", "ssec.txt", {"secret", "fedcba9876543210fedcba9876543210",
                                           {{"x-amz-server-side-encryption-customer-algorithm", "AES256"}}});

    EXPECT_EQ(client_.HeadObject("docs", "kms.txt", None()).encryption, "aws:kms");
    EXPECT_EQ(client_.HeadObject("docs", "ssec.txt", None()).encryption, "SSE-C");
}

TEST_F(S3ClientTest, RangedReadReturnsRequestedBytes) {
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 0, 4, {}, None()), "0123");
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 16, 4, {}, None()), "ghij");
}

TEST_F(S3ClientTest, ReadAtEndOfObjectIsEmpty) {
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 20, 8, {}, None()), "");
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 20, 0, {}, None()), "");
}

TEST_F(S3ClientTest, ReadPastEndIsRangeNotSatisfiable) {
    EXPECT_THROW(client_.GetObjectRange("docs", "notes.txt", 21, 8, {}, None()), RangeNotSatisfiableError);
    EXPECT_THROW(client_.GetObjectRange("docs", "notes.txt", 21, 0, {}, None()), RangeNotSatisfiableError);
}

TEST_F(S3ClientTest, IfMatchIsSentAndMismatchIsIntegrityError) {
    ReadPrecondition pinned{"5f2a8a8e1d1e4b7c9e0f1a2b3c4d5e6f", std::nullopt};
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 0, 2, pinned, None()), "01");
    EXPECT_EQ(server_.LastIfMatch(), "\"5f2a8a8e1d1e4b7c9e0f1a2b3c4d5e6f\"");

    ReadPrecondition stale{"00000000000000000000000000000000", std::nullopt};
    EXPECT_THROW(client_.GetObjectRange("docs", "notes.txt", 0, 2, stale, None()), IntegrityError);
}

TEST_F(S3ClientTest, ContentRangeTotalMustMatchExpectedSize) {
    ReadPrecondition same_size{"", 20};
    EXPECT_EQ(client_.GetObjectRange("docs", "notes.txt", 4, 4, same_size, None()), "4567");

    ReadPrecondition grown{"", 12};
    EXPECT_THROW(client_.GetObjectRange("docs", "notes.txt", 4, 4, grown, None()), IntegrityError);
}

TEST_F(S3ClientTest, MissingObjectAndBucketAreNotFound) {
    EXPECT_THROW(client_.HeadObject("docs", "missing.txt", None()), NotFoundError);
    EXPECT_THROW(client_.GetObjectRange("docs", "missing.txt", 0, 4, {}, None()), NotFoundError);

    ListObjectsRequest request;
    request.bucket = "nonexistent";
    try {
        client_.ListObjects(request, None());
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_NE(std::string(e.what()).find("nonexistent"), std::string::npos);
    }
}

TEST_F(S3ClientTest, ListObjectsParsesListing) {
    ListObjectsRequest request;
    request.bucket = "docs";
    ObjectListing listing = client_.ListObjects(request, None());
    ASSERT_EQ(listing.objects.size(), 1u);
    EXPECT_EQ(listing.objects[0].key, "notes.txt");
    EXPECT_EQ(listing.objects[0].size, 20u);
    EXPECT_FALSE(listing.next_token.has_value());

    request.bucket = "empty";
    EXPECT_TRUE(client_.ListObjects(request, None()).objects.empty());
}

TEST_F(S3ClientTest, AccessDeniedAndServerErrorsAreConnectivity) {
    server_.Fail("denied.txt", 403, "AccessDenied");
    server_.Fail("busy.txt", 503, "SlowDown");

    EXPECT_THROW(client_.GetObjectRange("docs", "denied.txt", 0, 4, {}, None()), ConnectivityError);
    EXPECT_THROW(client_.HeadObject("docs", "busy.txt", None()), ConnectivityError);
}

TEST_F(S3ClientTest, ListBucketsFailureIsConnectivityNeverNotFound) {
    auto buckets = client_.ListBuckets(None());
    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[0].name, "docs");

    server_.FailListBuckets(404);
    EXPECT_THROW(client_.ListBuckets(None()), ConnectivityError);
    server_.FailListBuckets(403);
    EXPECT_THROW(client_.ListBuckets(None()), ConnectivityError);
}

TEST_F(S3ClientTest, CancelledTokenStopsBeforeRequest) {
    CancellationSource source;
    source.Cancel();
    EXPECT_THROW(client_.HeadObject("docs", "notes.txt", source.Token()), CancelledError);
}

TEST(S3ClientUnreachableTest, RefusedConnectionIsConnectivity) {
    int port = 0;
    {
        httplib::Server port_finder;
        port = port_finder.bind_to_any_port("127.0.0.1");
    }
    S3Client client(LocalConfig(port));
    EXPECT_THROW(client.HeadObject("docs", "notes.txt", CancellationToken::None()), ConnectivityError);
}

TEST(ContentRangeTotalTest, ParsesTotalSize) {
    EXPECT_EQ(ContentRangeTotal("bytes 0-99/1234").value_or(0), 1234u);
    EXPECT_FALSE(ContentRangeTotal("bytes 0-99/*").has_value());
    EXPECT_FALSE(ContentRangeTotal("").has_value());
}
