#ifndef MCP_HANDLER_HPP
#define MCP_HANDLER_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "dispatcher.hpp"

// JSON-RPC 2.0 front end (Model Context Protocol subset) over the dispatcher:
// initialize, ping, tools/list, tools/call and the initialized / cancelled
// notifications.
class McpHandler {
public:
    static constexpr const char* kProtocolVersion = "2025-06-18";

    enum ErrorCode {
        kParseError = -32700,
        kInvalidRequest = -32600,
        kMethodNotFound = -32601,
        kInvalidParams = -32602
    };

    McpHandler(Dispatcher& dispatcher, std::string server_name, std::string server_version);

    // Raw request body, single message or batch. std::nullopt means nothing is
    // sent back (the body held only notifications). Request ids are scoped to
    // `session`, so two clients may both use id 1.
    std::optional<nlohmann::json> HandleBody(const std::string& body, const std::string& session,
                                             const DisconnectCheck& client_gone = nullptr);

    std::optional<nlohmann::json> Handle(const nlohmann::json& message, const std::string& session,
                                         const DisconnectCheck& client_gone = nullptr);

    // Invocation id used for the tools/call request with JSON-RPC id `request_id`.
    static std::string InvocationIdFor(const std::string& session, const nlohmann::json& request_id);

    // Common prefix of every invocation id issued for `session`.
    static std::string InvocationPrefixFor(const std::string& session);

    // 128 random bits, hex encoded.
    static std::string NewSessionId();

    // 1 to 128 characters from [A-Za-z0-9._-].
    static bool IsValidSessionId(const std::string& session);

private:
    nlohmann::json Initialize(const nlohmann::json& params) const;
    nlohmann::json CallTool(const nlohmann::json& id, const nlohmann::json& params, const std::string& session,
                            const DisconnectCheck& client_gone);

    static nlohmann::json Result(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json Error(const nlohmann::json& id, int code, const std::string& message);

    Dispatcher& dispatcher_;
    std::string server_name_;
    std::string server_version_;
};

#endif // MCP_HANDLER_HPP
