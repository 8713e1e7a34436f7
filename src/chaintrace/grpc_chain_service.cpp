// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/grpc_chain_service.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace chaintrace {

namespace {

class ChainReactor : public grpc::ServerGenericBidiReactor {
public:
    ChainReactor(grpc::GenericCallbackServerContext* context, Application& app,
                 std::shared_ptr<RpcRequestTracker> tracker)
        : context_(context), app_(app), tracker_(std::move(tracker)) {
        StartRead(&request_);
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "missing request message"));
            return;
        }

        auto id = tracker_->Lookup(context_);
        auto request = id ? app_.tracer().registry().Find(*id) : nullptr;
        if (!request) {
            spdlog::warn("No request context for {}", context_->method());
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "request tracing unavailable"));
            return;
        }

        // The callback may run on whichever thread settles the chain
        app_.Serve(request, [this](const Response& response) {
            grpc::Slice slice(response.body());
            response_ = grpc::ByteBuffer(&slice, 1);
            StartWriteAndFinish(&response_, grpc::WriteOptions(),
                                ChainGenericService::ToGrpcStatus(response));
        });
    }

    void OnDone() override { delete this; }

private:
    grpc::GenericCallbackServerContext* context_;
    Application& app_;
    std::shared_ptr<RpcRequestTracker> tracker_;
    grpc::ByteBuffer request_;
    grpc::ByteBuffer response_;
};

}  // namespace

ChainGenericService::ChainGenericService(Application& app, std::shared_ptr<RpcRequestTracker> tracker)
    : app_(app), tracker_(std::move(tracker)) {
    if (!tracker_) {
        throw std::invalid_argument("ChainGenericService requires a request tracker");
    }
}

grpc::ServerGenericBidiReactor* ChainGenericService::CreateReactor(
    grpc::GenericCallbackServerContext* context) {
    return new ChainReactor(context, app_, tracker_);
}

grpc::Status ChainGenericService::ToGrpcStatus(const Response& response) {
    const int status = response.status();
    if (status < 400) {
        return grpc::Status::OK;
    }
    switch (status) {
        case 400:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response.body());
        case 401:
            return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, response.body());
        case 403:
            return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, response.body());
        case 404:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, response.body());
        case 409:
            return grpc::Status(grpc::StatusCode::ABORTED, response.body());
        case 429:
            return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, response.body());
        case 501:
            return grpc::Status(grpc::StatusCode::UNIMPLEMENTED, response.body());
        case 503:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, response.body());
        case 504:
            return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, response.body());
        default:
            return grpc::Status(grpc::StatusCode::INTERNAL, response.body());
    }
}

}  // namespace chaintrace
