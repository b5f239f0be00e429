#include <gtest/gtest.h>
#include <set>
#include "dispatcher.hpp"
#include "fake_object_store.hpp"
#include "storage_tools.hpp"
#include "test_util.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class StorageToolsTest : public ::testing::Test {
protected:
    StorageToolsTest()
        : journal_(":memory:"),
          engine_(store_, EngineOptions(), &journal_),
          admission_(4, 4, 1000ms),
          dispatcher_(registry_, admission_, 10000ms) {
        config_.transfer.download_dir = dir_.Path();
        config_.transfer.max_inline_bytes = 4096;
        RegisterStorageTools(registry_, store_, engine_, &store_, config_);
        registry_.Freeze();
    }

    static TransferOptions EngineOptions() {
        TransferOptions options;
        options.chunk_size = 1024;
        options.retry_initial_backoff_ms = 1;
        options.retry_max_backoff_ms = 2;
        return options;
    }

    json Invoke(const std::string& tool, const json& args) { return dispatcher_.Invoke(tool, args); }

    TempDir dir_;
    FakeObjectStore store_;
    TransferJournal journal_;
    TransferEngine engine_;
    Config::ServerConfig config_;
    ToolRegistry registry_;
    AdmissionController admission_;
    Dispatcher dispatcher_;
};

} // namespace

TEST_F(StorageToolsTest, DeclaresAllTools) {
    std::set<std::string> names;
    for (const auto* tool : registry_.List()) {
        names.insert(tool->name);
    }
    EXPECT_EQ(names, (std::set<std::string>{"list_buckets", "list_objects", "get_object_metadata",
                                            "download_object", "read_object", "get_presigned_url"}));
}

TEST_F(StorageToolsTest, ListBuckets) {
    store_.CreateBucket("docs");
    store_.CreateBucket("logs");
    json envelope = Invoke("list_buckets", json::object());
    ASSERT_EQ(envelope["status"], "success");
    ASSERT_EQ(envelope["payload"]["buckets"].size(), 2u);
    EXPECT_EQ(envelope["payload"]["buckets"][0]["name"], "docs");
    EXPECT_TRUE(envelope["payload"]["buckets"][0].contains("creation_date"));
}

TEST_F(StorageToolsTest, ListBucketsWithNoBucketsIsEmpty) {
    json envelope = Invoke("list_buckets", json::object());
    EXPECT_EQ(envelope["status"], "success");
    EXPECT_TRUE(envelope["payload"]["buckets"].empty());
}

TEST_F(StorageToolsTest, ListBucketsConnectivityFailure) {
    store_.SetListBucketsFailure(true);
    EXPECT_EQ(Invoke("list_buckets", json::object())["error"]["kind"], "ConnectivityError");
}

TEST_F(StorageToolsTest, ListObjectsOfMissingBucketIsNotFound) {
    json envelope = Invoke("list_objects", {{"bucket", "nonexistent"}});
    EXPECT_EQ(envelope["status"], "error");
    EXPECT_EQ(envelope["error"]["kind"], "NotFoundError");
    EXPECT_FALSE(envelope["error"]["message"].get<std::string>().empty());
}

TEST_F(StorageToolsTest, EmptyBucketHasNoObjectsAndNoToken) {
    store_.CreateBucket("empty");
    json payload = Invoke("list_objects", {{"bucket", "empty"}})["payload"];
    EXPECT_TRUE(payload["objects"].empty());
    EXPECT_FALSE(payload.contains("next_continuation_token"));
    EXPECT_EQ(payload["is_truncated"], false);
}

TEST_F(StorageToolsTest, PaginationCoversEveryKeyOnce) {
    std::set<std::string> expected;
    for (int i = 0; i < 23; ++i) {
        std::string key = "k/" + std::to_string(1000 + i);
        store_.PutObject("docs", key, "x");
        expected.insert(key);
    }
    store_.PutObject("docs", "other", "x");

    json single = Invoke("list_objects", {{"bucket", "docs"}, {"prefix", "k/"}})["payload"];
    std::set<std::string> unpaged;
    for (const auto& object : single["objects"]) {
        unpaged.insert(object["key"].get<std::string>());
    }

    std::vector<std::string> paged;
    json args{{"bucket", "docs"}, {"prefix", "k/"}, {"max_keys", 5}};
    int pages = 0;
    while (true) {
        json envelope = Invoke("list_objects", args);
        ASSERT_EQ(envelope["status"], "success");
        for (const auto& object : envelope["payload"]["objects"]) {
            paged.push_back(object["key"].get<std::string>());
        }
        pages++;
        if (!envelope["payload"].contains("next_continuation_token")) {
            break;
        }
        args["continuation_token"] = envelope["payload"]["next_continuation_token"];
    }

    EXPECT_EQ(pages, 5);
    EXPECT_EQ(paged.size(), expected.size());
    EXPECT_EQ(std::set<std::string>(paged.begin(), paged.end()), expected);
    EXPECT_EQ(unpaged, expected);
}

TEST_F(StorageToolsTest, ListObjectsWithDelimiter) {
    store_.PutObject("docs", "2023/a.txt", "x");
    store_.PutObject("docs", "2024/b.txt", "x");
    store_.PutObject("docs", "top.txt", "x");
    json payload = Invoke("list_objects", {{"bucket", "docs"}, {"delimiter", "/"}})["payload"];
    EXPECT_EQ(payload["common_prefixes"], json::array({"2023/", "2024/"}));
    ASSERT_EQ(payload["objects"].size(), 1u);
    EXPECT_EQ(payload["objects"][0]["key"], "top.txt");
}

TEST_F(StorageToolsTest, ListObjectsRejectsBadPageSize) {
    store_.CreateBucket("docs");
    EXPECT_EQ(Invoke("list_objects", {{"bucket", "docs"}, {"max_keys", 0}})["error"]["kind"],
              "SchemaValidationError");
    EXPECT_EQ(Invoke("list_objects", {{"bucket", "docs"}, {"max_keys", 5000}})["error"]["kind"],
              "SchemaValidationError");
}

TEST_F(StorageToolsTest, ObjectMetadata) {
    store_.PutObject("docs", "a.txt", "hello", "text/plain");
    json payload = Invoke("get_object_metadata", {{"bucket", "docs"}, {"key", "a.txt"}})["payload"];
    EXPECT_EQ(payload["bucket"], "docs");
    EXPECT_EQ(payload["key"], "a.txt");
    EXPECT_EQ(payload["size"], 5);
    EXPECT_EQ(payload["content_type"], "text/plain");
    EXPECT_EQ(payload["etag"], "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(payload["checksum_verifiable"], true);

    EXPECT_EQ(Invoke("get_object_metadata", {{"bucket", "docs"}, {"key", "nope"}})["error"]["kind"],
              "NotFoundError");
}

TEST_F(StorageToolsTest, EmptyNamesAreRejected) {
    EXPECT_EQ(Invoke("get_object_metadata", {{"bucket", ""}, {"key", "a"}})["error"]["kind"],
              "SchemaValidationError");
}

TEST_F(StorageToolsTest, KmsObjectMetadataIsNotChecksumVerifiable) {
    store_.PutObjectWithEtag("docs", "secret.txt", "hello", "0123456789abcdef0123456789abcdef", "text/plain");
    store_.SetEncryption("docs", "secret.txt", "aws:kms");
    json payload = Invoke("get_object_metadata", {{"bucket", "docs"}, {"key", "secret.txt"}})["payload"];
    EXPECT_EQ(payload["encryption"], "aws:kms");
    EXPECT_EQ(payload["checksum_verifiable"], false);

    json read = Invoke("read_object", {{"bucket", "docs"}, {"key", "secret.txt"}});
    ASSERT_EQ(read["status"], "success") << read.dump();
    EXPECT_EQ(read["payload"]["data"], "hello");
}

TEST_F(StorageToolsTest, DownloadObjectReportsDestinationAndDescriptor) {
    const std::string data = RandomBytes(2500, 21);
    store_.PutObjectWithEtag("docs", "report.pdf", data, "abc123", "application/pdf");

    json envelope = Invoke("download_object", {{"bucket", "docs"}, {"key", "report.pdf"}});
    ASSERT_EQ(envelope["status"], "success") << envelope.dump();
    const json& payload = envelope["payload"];
    EXPECT_EQ(payload["bytes_transferred"], 2500);
    EXPECT_EQ(payload["chunks_fetched"], 3);
    EXPECT_EQ(payload["resumed_from"], 0);
    EXPECT_EQ(payload["object"]["size"], 2500);
    EXPECT_EQ(payload["object"]["etag"], "abc123");
    EXPECT_EQ(payload["object"]["checksum_verifiable"], false);
    EXPECT_EQ(ReadFileBytes(payload["destination"].get<std::string>()), data);
}

TEST_F(StorageToolsTest, DownloadRejectsEscapingKey) {
    store_.PutObject("docs", "../escape.txt", "x");
    EXPECT_EQ(Invoke("download_object", {{"bucket", "docs"}, {"key", "../escape.txt"}})["error"]["kind"],
              "SchemaValidationError");
}

TEST_F(StorageToolsTest, ReadObjectDecodesCsv) {
    store_.PutObject("docs", "people.csv", "name,age\nAda,36\n", "text/csv");
    json envelope = Invoke("read_object", {{"bucket", "docs"}, {"key", "people.csv"}});
    ASSERT_EQ(envelope["status"], "success") << envelope.dump();
    EXPECT_EQ(envelope["payload"]["format"], "csv");
    EXPECT_EQ(envelope["payload"]["data"][0]["age"], "36");
    EXPECT_EQ(envelope["payload"]["object"]["key"], "people.csv");
}

TEST_F(StorageToolsTest, ReadObjectUnsupportedTypeFetchesNothing) {
    store_.PutObject("docs", "deck.pptx", "PK\x03\x04");
    EXPECT_EQ(Invoke("read_object", {{"bucket", "docs"}, {"key", "deck.pptx"}})["error"]["kind"],
              "UnsupportedContentError");
    EXPECT_TRUE(store_.RangeCalls().empty());
}

TEST_F(StorageToolsTest, ReadObjectPdfReturnsPageTexts) {
    store_.PutObject("docs", "reports/summary.pdf", MinimalPdf({"Revenue up 12 percent", "Costs flat"}),
                     "application/pdf");
    json envelope = Invoke("read_object", {{"bucket", "docs"}, {"key", "reports/summary.pdf"}});
    ASSERT_EQ(envelope["status"], "success") << envelope.dump();
    EXPECT_EQ(envelope["payload"]["format"], "pdf");
    ASSERT_EQ(envelope["payload"]["data"].size(), 2u);
    EXPECT_NE(envelope["payload"]["data"][0].get<std::string>().find("Revenue up 12 percent"), std::string::npos);
    EXPECT_EQ(envelope["payload"]["object"]["checksum_verifiable"], true);
}

TEST_F(StorageToolsTest, ReadObjectOverInlineLimit) {
    store_.PutObject("docs", "big.txt", std::string(5000, 'a'));
    EXPECT_EQ(Invoke("read_object", {{"bucket", "docs"}, {"key", "big.txt"}})["error"]["kind"],
              "UnsupportedContentError");
    EXPECT_TRUE(store_.RangeCalls().empty());
}

TEST_F(StorageToolsTest, ReadObjectCorruptedIsIntegrityError) {
    store_.PutObject("docs", "a.json", "{\"a\":1}");
    store_.CorruptObject("docs", "a.json", "{\"a\":2}");
    EXPECT_EQ(Invoke("read_object", {{"bucket", "docs"}, {"key", "a.json"}})["error"]["kind"], "IntegrityError");
}

TEST_F(StorageToolsTest, PresignedUrl) {
    store_.PutObject("docs", "reports/q1.pdf", "x");
    json payload = Invoke("get_presigned_url", {{"bucket", "docs"}, {"key", "reports/q1.pdf"}})["payload"];
    EXPECT_EQ(payload["expires_in"], 3600);
    EXPECT_EQ(payload["file_name"], "q1.pdf");
    EXPECT_NE(payload["url"].get<std::string>().find("X-Amz-Expires=3600"), std::string::npos);

    json custom = Invoke("get_presigned_url", {{"bucket", "docs"}, {"key", "reports/q1.pdf"}, {"expires_in", 60}});
    EXPECT_EQ(custom["payload"]["expires_in"], 60);
}

TEST_F(StorageToolsTest, PresignedUrlValidation) {
    store_.PutObject("docs", "a.txt", "x");
    EXPECT_EQ(Invoke("get_presigned_url", {{"bucket", "docs"}, {"key", "a.txt"}, {"expires_in", 0}})["error"]["kind"],
              "SchemaValidationError");
    EXPECT_EQ(Invoke("get_presigned_url",
                     {{"bucket", "docs"}, {"key", "a.txt"}, {"expires_in", 604801}})["error"]["kind"],
              "SchemaValidationError");
    EXPECT_EQ(Invoke("get_presigned_url", {{"bucket", "docs"}, {"key", "gone.txt"}})["error"]["kind"],
              "NotFoundError");
}

TEST(StorageToolsRegistrationTest, NoPresignerNoPresignTool) {
    FakeObjectStore store;
    TransferEngine engine(store, TransferOptions{}, nullptr);
    ToolRegistry registry;
    RegisterStorageTools(registry, store, engine, nullptr, Config::ServerConfig{});
    EXPECT_EQ(registry.Find("get_presigned_url"), nullptr);
    EXPECT_NE(registry.Find("download_object"), nullptr);
}
