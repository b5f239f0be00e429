#include "envelope.hpp"
#include "checksum.hpp"

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& payload) {
    nlohmann::json envelope;
    envelope["status"] = "success";
    envelope["payload"] = payload;
    return envelope;
}

nlohmann::json MakeErrorEnvelope(const std::string& kind, const std::string& message) {
    nlohmann::json envelope;
    envelope["status"] = "error";
    envelope["error"] = {{"kind", kind}, {"message", message}};
    return envelope;
}

bool IsSuccessEnvelope(const nlohmann::json& envelope) {
    return envelope.value("status", "") == "success";
}

nlohmann::json ToJson(const BucketDescriptor& bucket) {
    return {{"name", bucket.name}, {"creation_date", bucket.creation_date}};
}

nlohmann::json ToJson(const ObjectDescriptor& object) {
    nlohmann::json j;
    j["bucket"] = object.bucket;
    j["key"] = object.key;
    j["size"] = object.size;
    j["last_modified"] = object.last_modified;
    j["content_type"] = object.content_type;
    if (object.etag) {
        j["etag"] = *object.etag;
    }
    if (!object.encryption.empty()) {
        j["encryption"] = object.encryption;
    }
    j["checksum_verifiable"] = IsChecksumVerifiable(object);
    return j;
}

nlohmann::json ToJson(const TransferTask& task) {
    nlohmann::json j;
    j["destination"] = task.destination;
    j["object"] = ToJson(task.object);
    j["bytes_transferred"] = task.bytes_transferred;
    j["chunks_fetched"] = task.chunks_fetched;
    j["resumed_from"] = task.resumed_from;
    return j;
}
