#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "zktable/coordination.pb.h"
#include "zktable/coordination.grpc.pb.h"
#include "config.hpp"
#include "coordination.hpp"
#include "errors.hpp"

namespace zktable {

/**
 * CoordinationClient backed by a gRPC coordination gateway.
 *
 * Each call is a single unary RPC. A NOT_FOUND status means the node does
 * not exist; every other failure is raised as GrpcError. Retries and
 * session handling stay on the gateway side.
 *
 * Example:
 *   auto client = GrpcCoordinationClient::connect("localhost:2181");
 *   TableStateReader reader(*client, "/wasp/table");
 *   bool disabled = reader.is_disabled_table("orders");
 */
class GrpcCoordinationClient : public CoordinationClient {
public:
    /**
     * Connect to a coordination gateway at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:2181")
     * @param call_timeout Per-call deadline, zero for none
     * @return Unique pointer to GrpcCoordinationClient
     */
    static std::unique_ptr<GrpcCoordinationClient> connect(
            const std::string& endpoint,
            std::chrono::milliseconds call_timeout = std::chrono::milliseconds(0)) {
        auto channel = grpc::CreateChannel(format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        return std::make_unique<GrpcCoordinationClient>(channel, call_timeout);
    }

    /**
     * Connect using the endpoint and deadline of a ReaderConfig.
     */
    static std::unique_ptr<GrpcCoordinationClient> from_config(const ReaderConfig& config) {
        return connect(config.endpoint, config.call_timeout);
    }

    /**
     * Create a client from an existing channel.
     *
     * @param channel Shared gRPC channel
     * @param call_timeout Per-call deadline, zero for none
     * @throws InvalidArgumentError if call_timeout is negative or above MAX_CALL_TIMEOUT
     */
    explicit GrpcCoordinationClient(
            std::shared_ptr<grpc::Channel> channel,
            std::chrono::milliseconds call_timeout = std::chrono::milliseconds(0))
        : stub_(CoordinationService::NewStub(channel))
        , call_timeout_(checked_call_timeout(call_timeout)) {}

    /**
     * Read a node's payload with a single GetData call.
     *
     * @param path Absolute node path
     * @return Node payload, or std::nullopt if the gateway answers NOT_FOUND
     * @throws GrpcError on any other non-OK status, including DEADLINE_EXCEEDED
     */
    std::optional<std::string> get_data(const std::string& path) override {
        GetDataRequest request;
        request.set_path(path);
        GetDataResponse response;
        grpc::ClientContext context;
        apply_deadline(context);
        auto status = stub_->GetData(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
            return std::nullopt;
        }
        if (!status.ok()) {
            throw GrpcError("GetData " + path + ": " + status.error_message(),
                            status.error_code());
        }
        return std::move(*response.mutable_data());
    }

    /**
     * List a node's children with a single GetChildren call.
     *
     * @param path Absolute path of the parent node
     * @return Child names in gateway order, empty if the gateway answers NOT_FOUND
     * @throws GrpcError on any other non-OK status, including DEADLINE_EXCEEDED
     */
    std::vector<std::string> list_children(const std::string& path) override {
        GetChildrenRequest request;
        request.set_path(path);
        GetChildrenResponse response;
        grpc::ClientContext context;
        apply_deadline(context);
        auto status = stub_->GetChildren(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
            return {};
        }
        if (!status.ok()) {
            throw GrpcError("GetChildren " + path + ": " + status.error_message(),
                            status.error_code());
        }
        return std::vector<std::string>(response.children().begin(),
                                        response.children().end());
    }

private:
    std::unique_ptr<CoordinationService::Stub> stub_;
    std::chrono::milliseconds call_timeout_;

    void apply_deadline(grpc::ClientContext& context) const {
        if (call_timeout_.count() > 0) {
            context.set_deadline(std::chrono::system_clock::now() + call_timeout_);
        }
    }

    static std::string format_endpoint(const std::string& endpoint) {
        auto pos = endpoint.find("://");
        if (pos == std::string::npos) {
            return endpoint; // Already plain host:port
        }
        // Strip http:// or https:// prefix for gRPC
        return endpoint.substr(pos + 3);
    }
};

} // namespace zktable
