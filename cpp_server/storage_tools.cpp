#include "storage_tools.hpp"
#include "content_reader.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "logger.hpp"

using json = nlohmann::json;

namespace {

constexpr int kMaxListKeys = 1000;

std::string StringArg(const json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return "";
    }
    return it->get<std::string>();
}

std::string RequireNonEmpty(const json& args, const char* name) {
    std::string value = StringArg(args, name);
    if (value.empty()) {
        throw SchemaValidationError(std::string("Field '") + name + "' must not be empty");
    }
    return value;
}

std::string BaseName(const std::string& key) {
    std::size_t slash = key.rfind('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

const FieldSpec kBucketField{"bucket", FieldType::String, true, "Name of the S3 bucket"};
const FieldSpec kKeyField{"key", FieldType::String, true, "Object key within the bucket"};

} // namespace

void RegisterStorageTools(ToolRegistry& registry, ObjectStore& store, TransferEngine& engine,
                          const UrlPresigner* presigner, const Config::ServerConfig& config) {
    const int default_max_keys = config.s3.max_keys;
    const std::string download_dir = config.transfer.download_dir;
    const std::uint64_t max_inline_bytes = config.transfer.max_inline_bytes;
    const int default_expiry = config.presign_default_expiry_s;
    const int max_expiry = config.presign_max_expiry_s;

    registry.Register(
        ToolDescriptor{"list_buckets", "List all S3 buckets the configured account can access.", {}, false},
        [&store](const json&, const CancellationToken& token) {
            json buckets = json::array();
            for (const auto& bucket : store.ListBuckets(token)) {
                buckets.push_back(ToJson(bucket));
            }
            return json{{"buckets", buckets}};
        });

    registry.Register(
        ToolDescriptor{"list_objects",
                       "List one page of objects in a bucket. Pass next_continuation_token back as "
                       "continuation_token to fetch the next page.",
                       {kBucketField,
                        {"prefix", FieldType::String, false, "Only keys starting with this prefix"},
                        {"continuation_token", FieldType::String, false, "Token from the previous page"},
                        {"delimiter", FieldType::String, false, "Group keys sharing a prefix up to this character"},
                        {"max_keys", FieldType::Integer, false, "Page size, 1 to 1000"}},
                       false},
        [&store, default_max_keys](const json& args, const CancellationToken& token) {
            ListObjectsRequest request;
            request.bucket = RequireNonEmpty(args, "bucket");
            request.prefix = StringArg(args, "prefix");
            request.continuation_token = StringArg(args, "continuation_token");
            request.delimiter = StringArg(args, "delimiter");
            request.max_keys = default_max_keys;
            if (args.contains("max_keys") && !args["max_keys"].is_null()) {
                long long max_keys = args["max_keys"].get<long long>();
                if (max_keys < 1 || max_keys > kMaxListKeys) {
                    throw SchemaValidationError("Field 'max_keys' must be between 1 and " +
                                                std::to_string(kMaxListKeys));
                }
                request.max_keys = static_cast<int>(max_keys);
            }

            ObjectListing listing = store.ListObjects(request, token);

            json objects = json::array();
            for (const auto& object : listing.objects) {
                objects.push_back(ToJson(object));
            }
            json payload;
            payload["bucket"] = request.bucket;
            payload["objects"] = objects;
            payload["common_prefixes"] = listing.common_prefixes;
            payload["is_truncated"] = listing.next_token.has_value();
            if (listing.next_token) {
                payload["next_continuation_token"] = *listing.next_token;
            }
            return payload;
        });

    registry.Register(
        ToolDescriptor{"get_object_metadata", "Get size, type, modification time and ETag of an object.",
                       {kBucketField, kKeyField}, false},
        [&store](const json& args, const CancellationToken& token) {
            return ToJson(store.HeadObject(RequireNonEmpty(args, "bucket"), RequireNonEmpty(args, "key"), token));
        });

    registry.Register(
        ToolDescriptor{"download_object",
                       "Download an object into the server's download directory and return where it was written.",
                       {kBucketField, kKeyField}, false},
        [&engine, download_dir](const json& args, const CancellationToken& token) {
            TransferTask task = engine.DownloadToFile(RequireNonEmpty(args, "bucket"), RequireNonEmpty(args, "key"),
                                                      download_dir, token);
            return ToJson(task);
        });

    registry.Register(
        ToolDescriptor{"read_object",
                       "Read a txt, md, json, jsonl, csv or pdf object and return its decoded content. "
                       "PDFs come back as one text string per page.",
                       {kBucketField, kKeyField}, false},
        [&store, &engine, max_inline_bytes](const json& args, const CancellationToken& token) {
            std::string bucket = RequireNonEmpty(args, "bucket");
            std::string key = RequireNonEmpty(args, "key");

            ObjectDescriptor object = store.HeadObject(bucket, key, token);
            if (!IsDecodableKey(key)) {
                throw UnsupportedContentError("Cannot read '" + key + "' inline: supported types are "
                                              "txt, md, json, jsonl, csv and pdf");
            }
            if (object.size > max_inline_bytes) {
                throw UnsupportedContentError("Object '" + key + "' is " + std::to_string(object.size) +
                                              " bytes, over the inline limit of " +
                                              std::to_string(max_inline_bytes) + "; use download_object");
            }

            MemorySink sink;
            TransferTask task = engine.Download(bucket, key, sink, token);
            DecodedContent content = DecodeContent(key, sink.Data());

            json payload;
            payload["object"] = ToJson(task.object);
            payload["format"] = content.format;
            payload["data"] = std::move(content.data);
            return payload;
        });

    if (presigner == nullptr) {
        Logger::Warn("No credentials configured; get_presigned_url is not available", "Dispatcher");
        return;
    }

    registry.Register(
        ToolDescriptor{"get_presigned_url",
                       "Create a time-limited URL that downloads the object without credentials.",
                       {kBucketField, kKeyField,
                        {"expires_in", FieldType::Integer, false, "Validity in seconds"}},
                       false},
        [&store, presigner, default_expiry, max_expiry](const json& args, const CancellationToken& token) {
            std::string bucket = RequireNonEmpty(args, "bucket");
            std::string key = RequireNonEmpty(args, "key");
            long long expires_in = default_expiry;
            if (args.contains("expires_in") && !args["expires_in"].is_null()) {
                expires_in = args["expires_in"].get<long long>();
            }
            if (expires_in < 1 || expires_in > max_expiry) {
                throw SchemaValidationError("Field 'expires_in' must be between 1 and " + std::to_string(max_expiry));
            }

            // Missing keys fail here with NotFoundError.
            store.HeadObject(bucket, key, token);

            json payload;
            payload["url"] = presigner->PresignGetObject(bucket, key, static_cast<int>(expires_in));
            payload["expires_in"] = expires_in;
            payload["file_name"] = BaseName(key);
            return payload;
        });
}
