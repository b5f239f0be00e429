#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>

namespace {

constexpr std::uint64_t kMinChunkSize = 64 * 1024;

std::string GetEnv(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

bool HasEnv(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

template <typename T>
void ReadIfPresent(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
    } else {
        try {
            nlohmann::json j;
            file >> j;
            ServerConfig parsed = config_;
            ApplyJson(j, parsed);
            config_ = parsed;
            Logger::Info("Configuration loaded from " + path, "Config");
        } catch (const std::exception& e) {
            Logger::Error("Failed to parse config file: " + std::string(e.what()), "Config");
        }
    }
    ApplyEnvironment(config_);
}

const Config::ServerConfig& Config::Get() const {
    return config_;
}

void Config::ApplyJson(const nlohmann::json& j, ServerConfig& config) {
    ReadIfPresent(j, "log_level", config.log_level);
    ReadIfPresent(j, "http_api_key", config.http_api_key);

    if (j.contains("http")) {
        auto& http = j["http"];
        ReadIfPresent(http, "host", config.http_host);
        ReadIfPresent(http, "port", config.http_port);
    }

    if (j.contains("grpc")) {
        auto& grpc = j["grpc"];
        ReadIfPresent(grpc, "address", config.grpc_address);
        ReadIfPresent(grpc, "enabled", config.grpc_enabled);
        ReadIfPresent(grpc, "cert_dir", config.grpc_cert_dir);
    }

    if (j.contains("s3")) {
        auto& s3 = j["s3"];
        ReadIfPresent(s3, "endpoint", config.s3.endpoint);
        ReadIfPresent(s3, "region", config.s3.region);
        ReadIfPresent(s3, "access_key", config.s3.access_key);
        ReadIfPresent(s3, "secret_key", config.s3.secret_key);
        ReadIfPresent(s3, "session_token", config.s3.session_token);
        ReadIfPresent(s3, "use_https", config.s3.use_https);
        ReadIfPresent(s3, "path_style", config.s3.path_style);
        ReadIfPresent(s3, "verify_tls", config.s3.verify_tls);
        ReadIfPresent(s3, "connect_timeout_ms", config.s3.connect_timeout_ms);
        ReadIfPresent(s3, "request_timeout_ms", config.s3.request_timeout_ms);
        ReadIfPresent(s3, "max_keys", config.s3.max_keys);
    }

    if (j.contains("transfer")) {
        auto& transfer = j["transfer"];
        ReadIfPresent(transfer, "download_dir", config.transfer.download_dir);
        ReadIfPresent(transfer, "journal_path", config.transfer.journal_path);
        ReadIfPresent(transfer, "chunk_size", config.transfer.chunk_size);
        ReadIfPresent(transfer, "max_retries", config.transfer.max_retries);
        ReadIfPresent(transfer, "retry_initial_backoff_ms", config.transfer.retry_initial_backoff_ms);
        ReadIfPresent(transfer, "retry_max_backoff_ms", config.transfer.retry_max_backoff_ms);
        ReadIfPresent(transfer, "parallel_chunks", config.transfer.parallel_chunks);
        ReadIfPresent(transfer, "max_inline_bytes", config.transfer.max_inline_bytes);
    }

    if (j.contains("dispatch")) {
        auto& dispatch = j["dispatch"];
        ReadIfPresent(dispatch, "max_concurrent", config.dispatch.max_concurrent);
        ReadIfPresent(dispatch, "max_queued", config.dispatch.max_queued);
        ReadIfPresent(dispatch, "queue_wait_ms", config.dispatch.queue_wait_ms);
        ReadIfPresent(dispatch, "invocation_timeout_ms", config.dispatch.invocation_timeout_ms);
    }

    if (j.contains("presign")) {
        auto& presign = j["presign"];
        ReadIfPresent(presign, "default_expiry_s", config.presign_default_expiry_s);
        ReadIfPresent(presign, "max_expiry_s", config.presign_max_expiry_s);
    }
}

void Config::ApplyEnvironment(ServerConfig& config) {
    config.http_host = GetEnv("S3_MCP_SERVER_HOST", config.http_host);
    if (HasEnv("S3_MCP_SERVER_PORT")) {
        config.http_port = std::atoi(std::getenv("S3_MCP_SERVER_PORT"));
    }
    config.grpc_address = GetEnv("S3_MCP_GRPC_ADDRESS", config.grpc_address);
    config.http_api_key = GetEnv("S3_MCP_API_KEY", config.http_api_key);
    config.log_level = GetEnv("S3_MCP_LOG_LEVEL", config.log_level);

    config.s3.endpoint = GetEnv("S3_ENDPOINT", config.s3.endpoint);
    config.s3.region = GetEnv("AWS_REGION", config.s3.region);
    config.s3.access_key = GetEnv("AWS_ACCESS_KEY_ID", config.s3.access_key);
    config.s3.access_key = GetEnv("AWS_ACCESS_KEY", config.s3.access_key);
    config.s3.secret_key = GetEnv("AWS_SECRET_ACCESS_KEY", config.s3.secret_key);
    config.s3.secret_key = GetEnv("AWS_SECRET_KEY", config.s3.secret_key);
    config.s3.session_token = GetEnv("AWS_SESSION_TOKEN", config.s3.session_token);

    config.transfer.download_dir = GetEnv("S3_DOWNLOAD_DIR", config.transfer.download_dir);
    if (HasEnv("S3_CHUNK_SIZE")) {
        config.transfer.chunk_size = std::strtoull(std::getenv("S3_CHUNK_SIZE"), nullptr, 10);
    }
}

bool Config::Validate(const ServerConfig& config, std::string& error) {
    LogLevel level;
    if (!Logger::ParseLevel(config.log_level, level)) {
        error = "log_level must be one of DEBUG, INFO, WARN, ERROR, FATAL";
        return false;
    }
    if (config.http_port <= 0 || config.http_port > 65535) {
        error = "http.port must be in 1..65535";
        return false;
    }
    if (config.s3.endpoint.empty()) {
        error = "s3.endpoint must not be empty";
        return false;
    }
    if (config.s3.max_keys <= 0 || config.s3.max_keys > 1000) {
        error = "s3.max_keys must be in 1..1000";
        return false;
    }
    if (config.transfer.chunk_size < kMinChunkSize) {
        error = "transfer.chunk_size must be at least 65536 bytes";
        return false;
    }
    if (config.transfer.max_retries < 0) {
        error = "transfer.max_retries must not be negative";
        return false;
    }
    if (config.transfer.parallel_chunks <= 0) {
        error = "transfer.parallel_chunks must be positive";
        return false;
    }
    if (config.transfer.download_dir.empty()) {
        error = "transfer.download_dir must not be empty";
        return false;
    }
    if (config.dispatch.max_concurrent <= 0 || config.dispatch.max_queued < 0) {
        error = "dispatch.max_concurrent must be positive and dispatch.max_queued non-negative";
        return false;
    }
    if (config.dispatch.invocation_timeout_ms <= 0) {
        error = "dispatch.invocation_timeout_ms must be positive";
        return false;
    }
    if (config.presign_default_expiry_s <= 0 ||
        config.presign_default_expiry_s > config.presign_max_expiry_s ||
        config.presign_max_expiry_s > 604800) {
        error = "presign expiry must satisfy 0 < default <= max <= 604800";
        return false;
    }
    return true;
}
