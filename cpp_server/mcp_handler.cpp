#include "mcp_handler.hpp"
#include "envelope.hpp"
#include "logger.hpp"
#include "sigv4.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

McpHandler::McpHandler(Dispatcher& dispatcher, std::string server_name, std::string server_version)
    : dispatcher_(dispatcher), server_name_(std::move(server_name)), server_version_(std::move(server_version)) {}

json McpHandler::Result(const json& id, const json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json McpHandler::Error(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string McpHandler::InvocationPrefixFor(const std::string& session) {
    return "mcp:" + session + ":";
}

std::string McpHandler::InvocationIdFor(const std::string& session, const json& request_id) {
    return InvocationPrefixFor(session) + request_id.dump();
}

std::string McpHandler::NewSessionId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed to generate a session id");
    }
    return HexEncode(bytes, sizeof(bytes));
}

bool McpHandler::IsValidSessionId(const std::string& session) {
    if (session.empty() || session.size() > 128) {
        return false;
    }
    return std::all_of(session.begin(), session.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-';
    });
}

std::optional<json> McpHandler::HandleBody(const std::string& body, const std::string& session,
                                           const DisconnectCheck& client_gone) {
    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error& e) {
        Logger::Warn(std::string("Unparseable JSON-RPC body: ") + e.what(), "MCP");
        return Error(nullptr, kParseError, "Parse error");
    }

    if (!message.is_array()) {
        return Handle(message, session, client_gone);
    }
    if (message.empty()) {
        return Error(nullptr, kInvalidRequest, "Empty batch");
    }

    json responses = json::array();
    for (const auto& entry : message) {
        auto response = Handle(entry, session, client_gone);
        if (response) {
            responses.push_back(std::move(*response));
        }
    }
    if (responses.empty()) {
        return std::nullopt;
    }
    return responses;
}

std::optional<json> McpHandler::Handle(const json& message, const std::string& session,
                                       const DisconnectCheck& client_gone) {
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0" ||
        !message.contains("method") || !message["method"].is_string()) {
        json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
        return Error(id, kInvalidRequest, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool is_notification = !message.contains("id");
    const json id = is_notification ? json(nullptr) : message["id"];
    json params = message.value("params", json::object());
    if (!params.is_object()) {
        if (is_notification) return std::nullopt;
        return Error(id, kInvalidParams, "params must be an object");
    }

    Logger::Debug("JSON-RPC " + method + (is_notification ? " (notification)" : " id=" + id.dump()), "MCP");

    if (method == "notifications/initialized") {
        Logger::Info("Client initialized", "MCP");
        return std::nullopt;
    }
    if (method == "notifications/cancelled") {
        if (params.contains("requestId")) {
            dispatcher_.Cancel(InvocationIdFor(session, params["requestId"]));
        } else {
            Logger::Warn("notifications/cancelled without requestId", "MCP");
        }
        return std::nullopt;
    }
    if (is_notification) {
        // Unknown notifications are ignored.
        return std::nullopt;
    }

    if (method == "initialize") {
        Logger::Info("Session " + session + " initializing", "MCP");
        return Result(id, Initialize(params));
    }
    if (method == "ping") {
        return Result(id, json::object());
    }
    if (method == "tools/list") {
        return Result(id, dispatcher_.Registry().Describe());
    }
    if (method == "tools/call") {
        if (!params.contains("name") || !params["name"].is_string()) {
            return Error(id, kInvalidParams, "tools/call requires a string 'name'");
        }
        return CallTool(id, params, session, client_gone);
    }

    return Error(id, kMethodNotFound, "Method not found: " + method);
}

json McpHandler::Initialize(const json& params) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::Info("Client " + params["clientInfo"].value("name", "unknown") + " " +
                     params["clientInfo"].value("version", "unknown") + " connected", "MCP");
    }
    return {{"protocolVersion", kProtocolVersion},
            {"serverInfo", {{"name", server_name_}, {"version", server_version_}}},
            {"capabilities", {{"tools", {{"listChanged", false}}}}}};
}

json McpHandler::CallTool(const json& id, const json& params, const std::string& session,
                          const DisconnectCheck& client_gone) {
    const std::string name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());

    json envelope = dispatcher_.Invoke(name, arguments, InvocationIdFor(session, id), client_gone);

    json result;
    if (IsSuccessEnvelope(envelope)) {
        const json& payload = envelope["payload"];
        result["content"] = json::array({{{"type", "text"}, {"text", payload.dump(-1, ' ', false, json::error_handler_t::replace)}}});
        if (payload.is_object()) {
            result["structuredContent"] = payload;
        }
        result["isError"] = false;
    } else {
        const json& error = envelope["error"];
        result["content"] = json::array({{{"type", "text"},
                                          {"text", error.value("kind", "") + ": " + error.value("message", "")}}});
        result["structuredContent"] = envelope;
        result["isError"] = true;
    }
    return Result(id, result);
}
