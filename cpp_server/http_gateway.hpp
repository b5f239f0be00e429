#ifndef HTTP_GATEWAY_HPP
#define HTTP_GATEWAY_HPP

#include <string>
#include "config.hpp"
#include "dispatcher.hpp"
#include "mcp_handler.hpp"
#include "sse_session.hpp"

namespace httplib {
class Server;
}

// Installs the auth middleware and the /health, /tools, /tools/invoke,
// /tools/cancel, /mcp, /sse and /messages routes. "changeme" as api_key
// leaves them open. `sse_hub` must be closed before `svr` stops.
void ConfigureHttpRoutes(httplib::Server& svr, Dispatcher& dispatcher, McpHandler& mcp,
                         SseSessionHub& sse_hub, const std::string& api_key);

// Starts the HTTP server in a blocking loop (intended to be run in a thread)
void RunHTTPServer(Dispatcher& dispatcher, McpHandler& mcp, const Config::ServerConfig& config);

#endif // HTTP_GATEWAY_HPP
