#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <openssl/ssl.h>
#include <openssl/err.h>

#include "admission.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "grpc_service.hpp"
#include "http_gateway.hpp"
#include "logger.hpp"
#include "mcp_handler.hpp"
#include "s3_client.hpp"
#include "storage_tools.hpp"
#include "tool_registry.hpp"
#include "transfer_engine.hpp"
#include "transfer_journal.hpp"

namespace {

constexpr const char* kServerName = "s3-tool-bridge";
constexpr const char* kServerVersion = "1.0.0";

std::string ResolveConfigPath(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    const char* env = std::getenv("S3_MCP_CONFIG");
    if (env != nullptr && env[0] != '\0') {
        return env;
    }
    return "config.json";
}

TransferOptions MakeTransferOptions(const Config::TransferConfig& config) {
    TransferOptions options;
    options.chunk_size = config.chunk_size;
    options.max_retries = config.max_retries;
    options.retry_initial_backoff_ms = config.retry_initial_backoff_ms;
    options.retry_max_backoff_ms = config.retry_max_backoff_ms;
    options.parallel_chunks = config.parallel_chunks;
    return options;
}

} // namespace

int main(int argc, char** argv) {
    Config::Instance().Load(ResolveConfigPath(argc, argv));
    const auto& config = Config::Instance().Get();

    std::string error;
    if (!Config::Validate(config, error)) {
        Logger::Fatal("Invalid configuration: " + error, "Config");
        return EXIT_FAILURE;
    }

    LogLevel level;
    if (Logger::ParseLevel(config.log_level, level)) {
        Logger::SetLevel(level);
    } else {
        Logger::Warn("Unknown log_level '" + config.log_level + "', keeping INFO", "Config");
    }

    // Initialize OpenSSL library
    Logger::Info("Initializing OpenSSL...");
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, NULL);
    Logger::Info("OpenSSL version: " + std::string(OpenSSL_version(OPENSSL_VERSION)));

    std::unique_ptr<S3Client> s3_client;
    std::unique_ptr<TransferJournal> journal;
    try {
        Logger::Info("Initializing S3 Client (" + config.s3.endpoint + ", " + config.s3.region + ")...");
        s3_client = std::make_unique<S3Client>(config.s3);

        Logger::Info("Opening transfer journal at " + config.transfer.journal_path + "...");
        journal = std::make_unique<TransferJournal>(config.transfer.journal_path);
        Logger::Info(std::to_string(journal->Count()) + " interrupted transfer(s) can be resumed", "Journal");
    } catch (const std::exception& e) {
        Logger::Fatal(std::string("Startup failed: ") + e.what());
        return EXIT_FAILURE;
    }

    TransferEngine engine(*s3_client, MakeTransferOptions(config.transfer), journal.get());

    ToolRegistry registry;
    const bool has_credentials = !config.s3.access_key.empty() && !config.s3.secret_key.empty();
    RegisterStorageTools(registry, *s3_client, engine, has_credentials ? s3_client.get() : nullptr, config);
    registry.Freeze();
    Logger::Info(std::to_string(registry.List().size()) + " tools registered");

    AdmissionController admission(config.dispatch.max_concurrent, config.dispatch.max_queued,
                                  std::chrono::milliseconds(config.dispatch.queue_wait_ms));
    Dispatcher dispatcher(registry, admission, std::chrono::milliseconds(config.dispatch.invocation_timeout_ms));
    McpHandler mcp(dispatcher, kServerName, kServerVersion);

    if (!config.grpc_enabled) {
        RunHTTPServer(dispatcher, mcp, config);
        return EXIT_FAILURE;
    }

    // Start HTTP Gateway in a separate thread
    std::thread http_thread([&]() {
        RunHTTPServer(dispatcher, mcp, config);
        Logger::Fatal("HTTP Gateway stopped");
        std::exit(EXIT_FAILURE);
    });
    http_thread.detach();

    RunGrpcServer(dispatcher, config.grpc_address, config.grpc_cert_dir);

    return 0;
}
