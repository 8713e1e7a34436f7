// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

/**
 * Integration Tests: gRPC requests through a traced chain
 *
 * These tests start an in-process callback server hosting ChainGenericService
 * behind GrpcRequestInterceptor and verify:
 * - Each RPC finishes as one transaction named after its method
 * - Middleware segments are recorded for the RPC
 * - The transport's final status does not rename the transaction
 * - Failures surface as gRPC errors and reported transaction errors
 */

#include <gtest/gtest.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "chaintrace/application.h"
#include "chaintrace/chain_tracer.h"
#include "chaintrace/grpc_chain_service.h"
#include "chaintrace/grpc_request_interceptor.h"

using chaintrace::Completion;
using chaintrace::Context;
using chaintrace::FinishedTrace;
using chaintrace::NextFn;

namespace {

class CapturingReporter : public chaintrace::TraceReporter {
public:
    void Report(const FinishedTrace& trace) override {
        std::lock_guard<std::mutex> lock(mutex_);
        traces_.push_back(trace);
    }

    std::vector<FinishedTrace> traces() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return traces_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<FinishedTrace> traces_;
};

struct CallResult {
    grpc::Status status;
    std::string body;
};

}  // namespace

class GrpcChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        reporter_ = std::make_shared<CapturingReporter>();
        tracer_.AddReporter(reporter_);

        app_.Use("wrap", [](Context& ctx, NextFn next) {
            if (!ctx.request().url.ends_with("/StatusOnly")) {
                return next();
            }
            ctx.AppendPath("wrap-start");
            return next().Then([&ctx] { ctx.AppendPath("wrap-end"); });
        });
        app_.Use("router", [](Context& ctx, NextFn next) {
            const std::string& url = ctx.request().url;
            const std::string method = url.substr(url.find_last_of('/') + 1);
            ctx.AppendPath(method);
            if (method == "Echo") {
                ctx.response().SetBody("echo");
                return Completion::Resolved();
            }
            if (method == "StatusOnly") {
                ctx.response().SetStatus(200);
                return Completion::Resolved();
            }
            if (method == "Fail") {
                throw std::runtime_error("requested failure");
            }
            return next();
        });

        tracker_ = std::make_shared<chaintrace::RpcRequestTracker>();
        service_ = std::make_unique<chaintrace::ChainGenericService>(app_, tracker_);

        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterCallbackGenericService(service_.get());
        std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> creators;
        creators.push_back(
            std::make_unique<chaintrace::GrpcRequestInterceptorFactory>(tracer_, tracker_));
        builder.experimental().SetInterceptorCreators(std::move(creators));
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port_, 0);

        channel_ = grpc::CreateChannel("127.0.0.1:" + std::to_string(port_),
                                       grpc::InsecureChannelCredentials());
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown();
        }
    }

    CallResult Call(const std::string& method) {
        grpc::GenericStub stub(channel_);
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));

        grpc::Slice slice(std::string("payload"));
        grpc::ByteBuffer request(&slice, 1);
        grpc::ByteBuffer response;

        std::promise<grpc::Status> done;
        stub.UnaryCall(&context, method, grpc::StubOptions(), &request, &response,
                       [&done](grpc::Status status) { done.set_value(std::move(status)); });

        CallResult result;
        result.status = done.get_future().get();
        std::vector<grpc::Slice> slices;
        if (result.status.ok() && response.Dump(&slices).ok()) {
            for (const auto& part : slices) {
                result.body.append(reinterpret_cast<const char*>(part.begin()), part.size());
            }
        }
        return result;
    }

    chaintrace::ChainTracer tracer_;
    chaintrace::Application app_{tracer_};
    std::shared_ptr<CapturingReporter> reporter_;
    std::shared_ptr<chaintrace::RpcRequestTracker> tracker_;
    std::unique_ptr<chaintrace::ChainGenericService> service_;
    std::unique_ptr<grpc::Server> server_;
    std::shared_ptr<grpc::Channel> channel_;
    int port_ = 0;
};

TEST_F(GrpcChainTest, RpcBecomesNamedTransaction) {
    CallResult result = Call("/chaintrace.Demo/Echo");
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.body, "echo");

    auto traces = reporter_->traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].name, "WebTransaction/WebFrameworkUri/Chain/POST//Echo");
    EXPECT_EQ(traces[0].request.method, "POST");
    EXPECT_EQ(traces[0].request.url, "/chaintrace.Demo/Echo");
    EXPECT_EQ(traces[0].status_code, 200);
    EXPECT_EQ(traces[0].reason, chaintrace::FinalizeReason::kResponseEnd);
    EXPECT_TRUE(traces[0].errors.empty());

    const chaintrace::Segment& root = traces[0].root();
    ASSERT_EQ(root.children().size(), 1u);
    const chaintrace::Segment& wrap = *root.children()[0];
    EXPECT_EQ(wrap.name(), "Middleware/Chain/wrap");
    ASSERT_EQ(wrap.children().size(), 1u);
    EXPECT_EQ(wrap.children()[0]->name(), "Middleware/Chain/router");
    EXPECT_FALSE(wrap.children()[0]->truncated());
}

TEST_F(GrpcChainTest, FinalStatusKeepsNameFromStatusAssignment) {
    CallResult result = Call("/chaintrace.Demo/StatusOnly");
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();

    auto traces = reporter_->traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].name, "WebTransaction/WebFrameworkUri/Chain/POST//wrap-start/StatusOnly");
    EXPECT_EQ(traces[0].status_code, 200);
    EXPECT_TRUE(traces[0].errors.empty());
}

TEST_F(GrpcChainTest, FailingMiddlewareReportsError) {
    CallResult result = Call("/chaintrace.Demo/Fail");
    EXPECT_EQ(result.status.error_code(), grpc::StatusCode::INTERNAL);

    auto traces = reporter_->traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].status_code, 500);
    ASSERT_EQ(traces[0].errors.size(), 1u);
    EXPECT_EQ(traces[0].errors[0].message, "requested failure");
    EXPECT_EQ(traces[0].errors[0].segment, "Middleware/Chain/router");
}

TEST_F(GrpcChainTest, UnroutedMethodIsNotFoundWithoutError) {
    CallResult result = Call("/chaintrace.Demo/Missing");
    EXPECT_EQ(result.status.error_code(), grpc::StatusCode::NOT_FOUND);

    auto traces = reporter_->traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].status_code, 404);
    EXPECT_TRUE(traces[0].errors.empty());
}

TEST_F(GrpcChainTest, EachRpcIsItsOwnTransaction) {
    ASSERT_TRUE(Call("/chaintrace.Demo/Echo").status.ok());
    ASSERT_TRUE(Call("/chaintrace.Demo/Echo").status.ok());

    auto traces = reporter_->traces();
    ASSERT_EQ(traces.size(), 2u);
    EXPECT_NE(traces[0].request_id, traces[1].request_id);
    EXPECT_EQ(tracer_.registry().size(), 0u);
}
