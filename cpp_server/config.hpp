#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class Config {
public:
    struct S3Config {
        std::string endpoint = "s3.amazonaws.com"; // host[:port], no scheme
        std::string region = "eu-central-1";
        std::string access_key = "";
        std::string secret_key = "";
        std::string session_token = "";
        bool use_https = true;
        bool path_style = false;
        bool verify_tls = true;
        long connect_timeout_ms = 5000;
        long request_timeout_ms = 60000;
        int max_keys = 1000;
    };

    struct TransferConfig {
        std::string download_dir = "data/downloads";
        std::string journal_path = "data/transfers.db";
        std::uint64_t chunk_size = 8ull * 1024 * 1024;
        int max_retries = 3;
        int retry_initial_backoff_ms = 200;
        int retry_max_backoff_ms = 5000;
        int parallel_chunks = 4;
        std::uint64_t max_inline_bytes = 4ull * 1024 * 1024;
    };

    struct DispatchConfig {
        int max_concurrent = 8;
        int max_queued = 16;
        int queue_wait_ms = 2000;
        int invocation_timeout_ms = 300000;
    };

    struct ServerConfig {
        std::string http_host = "0.0.0.0";
        int http_port = 8002;
        std::string http_api_key = "changeme"; // "changeme" leaves the HTTP routes open

        std::string grpc_address = "0.0.0.0:50051";
        bool grpc_enabled = true;
        std::string grpc_cert_dir = ""; // empty: plaintext gRPC

        std::string log_level = "INFO";

        int presign_default_expiry_s = 3600;
        int presign_max_expiry_s = 604800;

        S3Config s3;
        TransferConfig transfer;
        DispatchConfig dispatch;
    };

    static Config& Instance();

    // Reads the JSON file over the current values, then applies the environment.
    void Load(const std::string& path);
    const ServerConfig& Get() const;

    // Overlays the keys present in `j`. Throws nlohmann::json::exception on type mismatch.
    static void ApplyJson(const nlohmann::json& j, ServerConfig& config);
    static void ApplyEnvironment(ServerConfig& config);

    // Returns false and fills `error` for values the server cannot run with.
    static bool Validate(const ServerConfig& config, std::string& error);

private:
    Config() = default;
    ServerConfig config_;
};

#endif // CONFIG_HPP
