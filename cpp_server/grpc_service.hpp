#ifndef GRPC_SERVICE_HPP
#define GRPC_SERVICE_HPP

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "tool_bridge.grpc.pb.h"
#include "dispatcher.hpp"

class ToolBridgeServiceImpl final : public s3bridge::ToolBridge::Service {
public:
    explicit ToolBridgeServiceImpl(Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

    grpc::Status ListTools(grpc::ServerContext* context, const s3bridge::ListToolsRequest* request,
                           s3bridge::ListToolsResponse* response) override;

    grpc::Status InvokeTool(grpc::ServerContext* context, const s3bridge::InvokeToolRequest* request,
                            s3bridge::InvokeToolResponse* response) override;

    grpc::Status CancelInvocation(grpc::ServerContext* context, const s3bridge::CancelInvocationRequest* request,
                                  s3bridge::CancelInvocationResponse* response) override;

private:
    Dispatcher& dispatcher_;
};

// Plaintext when cert_dir is empty; otherwise mutual TLS with ca.crt,
// server.crt and server.key from cert_dir.
std::shared_ptr<grpc::ServerCredentials> MakeServerCredentials(const std::string& cert_dir);

// Blocks until the server shuts down. Exits the process if the server cannot start.
void RunGrpcServer(Dispatcher& dispatcher, const std::string& address, const std::string& cert_dir);

#endif // GRPC_SERVICE_HPP
