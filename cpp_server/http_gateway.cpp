#include "http_gateway.hpp"
#include "httplib.h"
#include "envelope.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>

using json = nlohmann::json;

namespace {

constexpr auto kSseKeepAlive = std::chrono::seconds(15);
constexpr const char* kSessionHeader = "Mcp-Session-Id";

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

DisconnectCheck DisconnectCheckFor(const httplib::Request& req) {
    return [&req]() {
        return req.is_connection_closed && req.is_connection_closed();
    };
}

bool RequiresAuth(const std::string& path) {
    return path.rfind("/tools", 0) == 0 || path.rfind("/mcp", 0) == 0 || path == "/sse" ||
           path == "/messages";
}

std::string Dump(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

void ConfigureHttpRoutes(httplib::Server& svr, Dispatcher& dispatcher, McpHandler& mcp,
                         SseSessionHub& sse_hub, const std::string& api_key) {
    // Middleware for CORS and Auth
    svr.set_pre_routing_handler([api_key](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-API-Key, Mcp-Session-Id");
        res.set_header("Access-Control-Expose-Headers", "Mcp-Session-Id");

        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }

        if (RequiresAuth(req.path) && api_key != "changeme") {
            if (!req.has_header("X-API-Key") || req.get_header_value("X-API-Key") != api_key) {
                Logger::Warn("Rejected unauthenticated request to " + req.path, "HTTP");
                SendJson(res, {{"error", "Unauthorized"}}, 401);
                return httplib::Server::HandlerResponse::Handled;
            }
        }

        return httplib::Server::HandlerResponse::Unhandled;
    });

    // GET /health (Public)
    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, {{"status", "SERVING"}});
    });

    // GET /tools
    svr.Get("/tools", [&dispatcher](const httplib::Request&, httplib::Response& res) {
        SendJson(res, dispatcher.Registry().Describe());
    });

    // POST /tools/invoke {toolName, arguments, invocationId?}
    svr.Post("/tools/invoke", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            SendJson(res, {{"error", std::string("Invalid JSON: ") + e.what()}}, 400);
            return;
        }
        if (!body.is_object()) {
            SendJson(res, {{"error", "Request body must be a JSON object"}}, 400);
            return;
        }

        // Envelope-level failures still return 200 so clients branch on "status".
        if (!body.contains("toolName") || !body["toolName"].is_string()) {
            SendJson(res, MakeErrorEnvelope(ErrorKindName(ErrorKind::SchemaValidation),
                                            "Field 'toolName' must be a string"));
            return;
        }
        std::string invocation_id;
        if (body.contains("invocationId")) {
            if (!body["invocationId"].is_string()) {
                SendJson(res, MakeErrorEnvelope(ErrorKindName(ErrorKind::SchemaValidation),
                                                "Field 'invocationId' must be a string"));
                return;
            }
            invocation_id = body["invocationId"].get<std::string>();
        }

        json arguments = body.value("arguments", json::object());
        SendJson(res, dispatcher.Invoke(body["toolName"].get<std::string>(), arguments, invocation_id,
                                        DisconnectCheckFor(req)));
    });

    // POST /tools/cancel {invocationId}
    svr.Post("/tools/cancel", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("invocationId") ||
            !body["invocationId"].is_string()) {
            SendJson(res, {{"error", "Body must be {\"invocationId\": string}"}}, 400);
            return;
        }
        SendJson(res, {{"cancelled", dispatcher.Cancel(body["invocationId"].get<std::string>())}});
    });

    // POST /mcp (JSON-RPC 2.0). Requests without Mcp-Session-Id are assigned a
    // new session, returned in the same header.
    svr.Post("/mcp", [&mcp](const httplib::Request& req, httplib::Response& res) {
        std::string session = req.get_header_value(kSessionHeader);
        if (session.empty()) {
            session = McpHandler::NewSessionId();
        } else if (!McpHandler::IsValidSessionId(session)) {
            SendJson(res, {{"error", "Malformed Mcp-Session-Id header"}}, 400);
            return;
        }
        res.set_header(kSessionHeader, session);

        auto response = mcp.HandleBody(req.body, session, DisconnectCheckFor(req));
        if (!response) {
            res.status = 202;
            return;
        }
        SendJson(res, *response);
    });

    // DELETE /mcp ends a session: its in-flight tool calls are cancelled.
    svr.Delete("/mcp", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        std::string session = req.get_header_value(kSessionHeader);
        if (!McpHandler::IsValidSessionId(session)) {
            SendJson(res, {{"error", "Mcp-Session-Id header required"}}, 400);
            return;
        }
        std::size_t cancelled = dispatcher.CancelWithPrefix(McpHandler::InvocationPrefixFor(session));
        Logger::Info("Session " + session + " terminated, " + std::to_string(cancelled) + " call(s) cancelled",
                     "MCP");
        SendJson(res, {{"cancelled", cancelled}});
    });

    // GET /sse opens an event stream. The first event names the endpoint that
    // accepts this session's messages; responses arrive as "message" events.
    svr.Get("/sse", [&dispatcher, &sse_hub](const httplib::Request&, httplib::Response& res) {
        std::shared_ptr<SseSession> session = sse_hub.Open(McpHandler::NewSessionId());
        session->Push("endpoint", "/messages?session_id=" + session->Id());

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/event-stream",
            [session](size_t, httplib::DataSink& sink) {
                if (sink.is_writable && !sink.is_writable()) {
                    session->Close();
                    return false;
                }
                std::string frame;
                if (!session->Next(frame, kSseKeepAlive)) {
                    sink.done();
                    return true;
                }
                if (frame.empty()) {
                    frame = ": keepalive

";
                }
                if (!sink.write(frame.data(), frame.size())) {
                    session->Close();
                    return false;
                }
                return true;
            },
            [session, &dispatcher, &sse_hub](bool) {
                session->Close();
                dispatcher.CancelWithPrefix(McpHandler::InvocationPrefixFor(session->Id()));
                session->Join();
                sse_hub.Remove(session->Id());
            });
    });

    // POST /messages?session_id=<id> (JSON-RPC 2.0 for an open /sse stream)
    svr.Post("/messages", [&mcp, &sse_hub](const httplib::Request& req, httplib::Response& res) {
        std::shared_ptr<SseSession> session = sse_hub.Find(req.get_param_value("session_id"));
        if (!session) {
            SendJson(res, {{"error", "Unknown or closed session"}}, 404);
            return;
        }
        std::string body = req.body;
        bool accepted = session->Spawn([&mcp, session, body]() {
            auto response = mcp.HandleBody(body, session->Id(), [session]() { return session->Closed(); });
            if (response) {
                session->Push("message", Dump(*response));
            }
        });
        if (!accepted) {
            SendJson(res, {{"error", "Unknown or closed session"}}, 404);
            return;
        }
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        Logger::Error("Unhandled error on " + req.path + ": " + message, "HTTP");
        SendJson(res, {{"error", message}}, 500);
    });
}

void RunHTTPServer(Dispatcher& dispatcher, McpHandler& mcp, const Config::ServerConfig& config) {
    SseSessionHub sse_hub;
    httplib::Server svr;
    ConfigureHttpRoutes(svr, dispatcher, mcp, sse_hub, config.http_api_key);

    if (config.http_api_key == "changeme") {
        Logger::Warn("http_api_key is 'changeme'; tool routes are unauthenticated", "HTTP");
    }
    Logger::Info("HTTP Gateway listening on " + config.http_host + ":" + std::to_string(config.http_port), "HTTP");
    if (!svr.listen(config.http_host, config.http_port)) {
        Logger::Fatal("HTTP Gateway failed to bind " + config.http_host + ":" + std::to_string(config.http_port),
                      "HTTP");
    }
    sse_hub.CloseAll();
}
