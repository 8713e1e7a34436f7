// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <grpcpp/generic/async_generic_service.h>
#include <grpcpp/grpcpp.h>

#include "chaintrace/application.h"
#include "chaintrace/grpc_request_interceptor.h"

namespace chaintrace {

/**
 * @brief Callback generic service running every RPC through an Application
 *
 * Each RPC reads one request message, serves the request context that
 * GrpcRequestInterceptor opened for it and replies with the response body.
 * The response status maps onto a gRPC status; the interceptor finalizes
 * the trace when that status is sent.
 *
 * Usage:
 * @code
 *   auto tracker = std::make_shared<chaintrace::RpcRequestTracker>();
 *   chaintrace::ChainGenericService service(app, tracker);
 *   builder.RegisterCallbackGenericService(&service);
 * @endcode
 */
class ChainGenericService final : public grpc::CallbackGenericService {
public:
    ChainGenericService(Application& app, std::shared_ptr<RpcRequestTracker> tracker);

    grpc::ServerGenericBidiReactor* CreateReactor(grpc::GenericCallbackServerContext* context) override;

    /// gRPC status for a finished response, OK below 400
    static grpc::Status ToGrpcStatus(const Response& response);

private:
    Application& app_;
    std::shared_ptr<RpcRequestTracker> tracker_;
};

}  // namespace chaintrace
