// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

/**
 * Unit Tests: gRPC request interceptor helpers
 *
 * These tests verify:
 * - gRPC status codes map onto HTTP-style statuses
 * - RpcRequestTracker binds, looks up and releases request ids
 *
 * The interceptor lifecycle against a live server is covered by
 * tests/integration/test_grpc_chain.cpp.
 */

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include "chaintrace/grpc_request_interceptor.h"

using chaintrace::GrpcRequestInterceptor;
using grpc::StatusCode;

TEST(GrpcStatusMapping, SuccessIs200) {
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::OK), 200);
}

TEST(GrpcStatusMapping, ClientErrors) {
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::INVALID_ARGUMENT), 400);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::FAILED_PRECONDITION), 400);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::OUT_OF_RANGE), 400);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::UNAUTHENTICATED), 401);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::PERMISSION_DENIED), 403);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::NOT_FOUND), 404);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::ALREADY_EXISTS), 409);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::ABORTED), 409);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::RESOURCE_EXHAUSTED), 429);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::CANCELLED), 499);
}

TEST(GrpcStatusMapping, ServerErrors) {
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::UNIMPLEMENTED), 501);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::UNAVAILABLE), 503);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::DEADLINE_EXCEEDED), 504);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::INTERNAL), 500);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::UNKNOWN), 500);
    EXPECT_EQ(GrpcRequestInterceptor::ToHttpStatus(StatusCode::DATA_LOSS), 500);
}

TEST(RpcRequestTracker, BindLookupRelease) {
    chaintrace::RpcRequestTracker tracker;
    grpc::ServerContext first;
    grpc::ServerContext second;

    tracker.Bind(&first, 11);
    tracker.Bind(&second, 12);
    EXPECT_EQ(tracker.size(), 2u);
    EXPECT_EQ(tracker.Lookup(&first).value_or(0), 11u);
    EXPECT_EQ(tracker.Lookup(&second).value_or(0), 12u);

    tracker.Release(&first);
    EXPECT_FALSE(tracker.Lookup(&first).has_value());
    EXPECT_EQ(tracker.size(), 1u);

    // Releasing an unknown context is harmless
    tracker.Release(&first);
    EXPECT_EQ(tracker.size(), 1u);
}
