// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <grpcpp/grpcpp.h>
#include <grpcpp/support/server_interceptor.h>

#include "chaintrace/chain_tracer.h"

namespace chaintrace {

/**
 * @brief Maps in-flight RPCs to the request contexts opened for them
 *
 * Handlers use Lookup() with their own server context to find the request
 * the interceptor started.
 *
 * Thread Safety: all methods are thread-safe.
 */
class RpcRequestTracker {
public:
    void Bind(const grpc::ServerContextBase* context, RequestId id);
    std::optional<RequestId> Lookup(const grpc::ServerContextBase* context) const;
    void Release(const grpc::ServerContextBase* context);
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<const grpc::ServerContextBase*, RequestId> requests_;
};

/**
 * @brief Server-side gRPC interceptor driving one request context per RPC
 *
 * - POST_RECV_INITIAL_METADATA: starts a request ("POST <full method>")
 * - PRE_SEND_STATUS: records the HTTP-style response status and finalizes
 *   the request. The transaction keeps the name the chain's own response
 *   writes gave it; the final status never re-snapshots the path.
 * - RPCs torn down without a status are finalized as aborted
 *
 * Usage:
 * @code
 *   std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> creators;
 *   creators.push_back(std::make_unique<chaintrace::GrpcRequestInterceptorFactory>(tracer, tracker));
 *   builder.experimental().SetInterceptorCreators(std::move(creators));
 * @endcode
 */
class GrpcRequestInterceptor : public grpc::experimental::Interceptor {
public:
    GrpcRequestInterceptor(grpc::experimental::ServerRpcInfo* info, ChainTracer& tracer,
                           std::shared_ptr<RpcRequestTracker> tracker);
    ~GrpcRequestInterceptor() override;

    void Intercept(grpc::experimental::InterceptorBatchMethods* methods) override;

    /// HTTP-style status for a gRPC status code
    static int ToHttpStatus(grpc::StatusCode code);

private:
    void StartRequest();
    void EndRequest(const grpc::Status& status);

    grpc::experimental::ServerRpcInfo* rpc_info_;
    ChainTracer& tracer_;
    std::shared_ptr<RpcRequestTracker> tracker_;
    std::optional<RequestId> request_id_;
    bool ended_ = false;
};

class GrpcRequestInterceptorFactory
    : public grpc::experimental::ServerInterceptorFactoryInterface {
public:
    GrpcRequestInterceptorFactory(ChainTracer& tracer, std::shared_ptr<RpcRequestTracker> tracker)
        : tracer_(tracer), tracker_(std::move(tracker)) {}

    grpc::experimental::Interceptor* CreateServerInterceptor(
        grpc::experimental::ServerRpcInfo* info) override {
        return new GrpcRequestInterceptor(info, tracer_, tracker_);
    }

private:
    ChainTracer& tracer_;
    std::shared_ptr<RpcRequestTracker> tracker_;
};

}  // namespace chaintrace
