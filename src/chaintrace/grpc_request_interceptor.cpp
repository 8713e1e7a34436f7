// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/grpc_request_interceptor.h"

#include <spdlog/spdlog.h>

namespace chaintrace {

using HP = grpc::experimental::InterceptionHookPoints;

void RpcRequestTracker::Bind(const grpc::ServerContextBase* context, RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_[context] = id;
}

std::optional<RequestId> RpcRequestTracker::Lookup(const grpc::ServerContextBase* context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(context);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RpcRequestTracker::Release(const grpc::ServerContextBase* context) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.erase(context);
}

std::size_t RpcRequestTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

GrpcRequestInterceptor::GrpcRequestInterceptor(grpc::experimental::ServerRpcInfo* info,
                                               ChainTracer& tracer,
                                               std::shared_ptr<RpcRequestTracker> tracker)
    : rpc_info_(info), tracer_(tracer), tracker_(std::move(tracker)) {}

GrpcRequestInterceptor::~GrpcRequestInterceptor() {
    if (!request_id_) {
        return;
    }
    if (!ended_) {
        spdlog::debug("RPC for request {} torn down without a status", *request_id_);
        tracer_.OnRequestAborted(*request_id_);
    }
    tracker_->Release(rpc_info_->server_context());
}

void GrpcRequestInterceptor::Intercept(grpc::experimental::InterceptorBatchMethods* methods) {
    if (methods->QueryInterceptionHookPoint(HP::POST_RECV_INITIAL_METADATA)) {
        StartRequest();
    }

    if (methods->QueryInterceptionHookPoint(HP::PRE_SEND_STATUS)) {
        EndRequest(methods->GetSendStatus());
    }

    methods->Proceed();
}

void GrpcRequestInterceptor::StartRequest() {
    if (request_id_) {
        return;
    }
    const char* method = rpc_info_->method();
    auto request = tracer_.OnRequestStart(RequestDescriptor{"POST", method ? method : "/unknown"});
    request_id_ = request->id();
    tracker_->Bind(rpc_info_->server_context(), *request_id_);
}

void GrpcRequestInterceptor::EndRequest(const grpc::Status& status) {
    if (!request_id_ || ended_) {
        return;
    }
    ended_ = true;

    // Error statuses are reported by the transaction's status policy
    const int http_status = ToHttpStatus(status.error_code());
    if (!status.ok()) {
        spdlog::debug("Request {} ended with gRPC status {}: {}", *request_id_,
                      static_cast<int>(status.error_code()), status.error_message());
    }
    tracer_.OnResponseStatus(*request_id_, http_status);
    tracer_.OnRequestEnd(*request_id_);
}

int GrpcRequestInterceptor::ToHttpStatus(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK:
            return 200;
        case grpc::StatusCode::INVALID_ARGUMENT:
        case grpc::StatusCode::FAILED_PRECONDITION:
        case grpc::StatusCode::OUT_OF_RANGE:
            return 400;
        case grpc::StatusCode::UNAUTHENTICATED:
            return 401;
        case grpc::StatusCode::PERMISSION_DENIED:
            return 403;
        case grpc::StatusCode::NOT_FOUND:
            return 404;
        case grpc::StatusCode::ALREADY_EXISTS:
        case grpc::StatusCode::ABORTED:
            return 409;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return 429;
        case grpc::StatusCode::CANCELLED:
            return 499;
        case grpc::StatusCode::UNIMPLEMENTED:
            return 501;
        case grpc::StatusCode::UNAVAILABLE:
            return 503;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return 504;
        default:
            return 500;
    }
}

}  // namespace chaintrace
