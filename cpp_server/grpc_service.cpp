#include "grpc_service.hpp"
#include "envelope.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <grpcpp/health_check_service_interface.h>

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using json = nlohmann::json;

namespace {

// Function to read a file into a string
std::string read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::Fatal("Failed to open file: " + filepath, "gRPC");
        exit(EXIT_FAILURE);
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::string Dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

Status ToolBridgeServiceImpl::ListTools(ServerContext*, const s3bridge::ListToolsRequest*,
                                        s3bridge::ListToolsResponse* response) {
    for (const auto* descriptor : dispatcher_.Registry().List()) {
        auto* tool = response->add_tools();
        tool->set_name(descriptor->name);
        tool->set_description(descriptor->description);
        tool->set_input_schema_json(Dump(ToJsonSchema(*descriptor)));
    }
    return Status::OK;
}

Status ToolBridgeServiceImpl::InvokeTool(ServerContext* context, const s3bridge::InvokeToolRequest* request,
                                         s3bridge::InvokeToolResponse* response) {
    json arguments = json::object();
    if (!request->arguments_json().empty()) {
        arguments = json::parse(request->arguments_json(), nullptr, false);
        if (arguments.is_discarded()) {
            return Status(grpc::StatusCode::INVALID_ARGUMENT, "arguments_json is not valid JSON");
        }
    }

    json envelope = dispatcher_.Invoke(request->tool_name(), arguments, request->invocation_id(),
                                       [context]() { return context->IsCancelled(); });

    response->set_status(envelope.value("status", ""));
    if (IsSuccessEnvelope(envelope)) {
        response->set_payload_json(Dump(envelope["payload"]));
    } else {
        response->mutable_error()->set_kind(envelope["error"].value("kind", ""));
        response->mutable_error()->set_message(envelope["error"].value("message", ""));
    }
    response->set_envelope_json(Dump(envelope));
    return Status::OK;
}

Status ToolBridgeServiceImpl::CancelInvocation(ServerContext*, const s3bridge::CancelInvocationRequest* request,
                                               s3bridge::CancelInvocationResponse* response) {
    if (request->invocation_id().empty()) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT, "invocation_id is required");
    }
    response->set_cancelled(dispatcher_.Cancel(request->invocation_id()));
    return Status::OK;
}

std::shared_ptr<grpc::ServerCredentials> MakeServerCredentials(const std::string& cert_dir) {
    if (cert_dir.empty()) {
        return grpc::InsecureServerCredentials();
    }

    grpc::SslServerCredentialsOptions ssl_opts;
    ssl_opts.pem_root_certs = read_file(cert_dir + "/ca.crt");
    grpc::SslServerCredentialsOptions::PemKeyCertPair pkcp = {
        read_file(cert_dir + "/server.key"),
        read_file(cert_dir + "/server.crt")
    };
    ssl_opts.pem_key_cert_pairs.push_back(pkcp);
    ssl_opts.client_certificate_request = GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;

    return grpc::SslServerCredentials(ssl_opts);
}

void RunGrpcServer(Dispatcher& dispatcher, const std::string& address, const std::string& cert_dir) {
    ToolBridgeServiceImpl service(dispatcher);
    grpc::EnableDefaultHealthCheckService(true);

    ServerBuilder builder;
    builder.AddListeningPort(address, MakeServerCredentials(cert_dir));
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (server == nullptr) {
        Logger::Fatal("Failed to build or start the gRPC server.", "gRPC");
        exit(EXIT_FAILURE);
    }
    Logger::Info("gRPC server listening on " + address + (cert_dir.empty() ? " (plaintext)" : " (mTLS)"), "gRPC");
    server->Wait();
}
