// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

/**
 * Unit Tests: RequestContext and RequestRegistry
 *
 * This test verifies:
 * - Lifecycle CREATED -> ACTIVE -> FINALIZING -> DONE
 * - Name triggers (body always, status only before a body)
 * - The transport's final status is recorded without naming
 * - Which errors a finished trace reports
 * - Late signals after finalization are ignored
 */

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "chaintrace/request_context.h"
#include "chaintrace/request_registry.h"

using chaintrace::FinalizeReason;
using chaintrace::MutationKind;
using chaintrace::RequestContext;
using chaintrace::RequestDescriptor;
using chaintrace::RequestState;
using chaintrace::TracerConfig;

class RequestContextTest : public ::testing::Test {
protected:
    RequestContextTest() : context_(1, RequestDescriptor{"GET", "/users/42"}, TracerConfig{}) {}

    RequestContext context_;
};

TEST_F(RequestContextTest, StartsWithOpenRoot) {
    EXPECT_EQ(context_.state(), RequestState::kCreated);
    EXPECT_TRUE(context_.root()->is_open());
    EXPECT_EQ(context_.CurrentPath(), "/");
    EXPECT_EQ(context_.TransactionName(), "WebTransaction/WebFrameworkUri/Chain/GET//");
}

TEST_F(RequestContextTest, LifecycleTransitions) {
    context_.MarkActive();
    EXPECT_EQ(context_.state(), RequestState::kActive);

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(context_.state(), RequestState::kFinalizing);
    EXPECT_TRUE(context_.IsFinalizing());

    EXPECT_FALSE(context_.BeginFinalize(FinalizeReason::kTimeout).has_value());

    context_.MarkDone();
    EXPECT_EQ(context_.state(), RequestState::kDone);
    EXPECT_STREQ(chaintrace::ToString(context_.state()), "done");
}

TEST_F(RequestContextTest, BodyAssignmentNamesTransaction) {
    context_.AppendPath("one-start");
    context_.AppendPath("two");
    context_.OnResponseMutation(MutationKind::kBody, 200);
    context_.AppendPath("one-end");

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    ASSERT_TRUE(trace);
    EXPECT_EQ(trace->name, "WebTransaction/WebFrameworkUri/Chain/GET//one-start/two");
    EXPECT_EQ(trace->path, "/one-start/two");
    EXPECT_EQ(trace->root().name(), trace->name);
    EXPECT_EQ(trace->status_code, 200);
}

TEST_F(RequestContextTest, StatusAfterBodyKeepsBodyName) {
    context_.AppendPath("two");
    context_.OnResponseMutation(MutationKind::kBody, 200);
    context_.AppendPath("setting-status");
    context_.OnResponseMutation(MutationKind::kStatus, 201);

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    EXPECT_EQ(trace->path, "/two");
    EXPECT_EQ(trace->status_code, 201);
}

TEST_F(RequestContextTest, StatusNamesTransactionWithoutBody) {
    context_.AppendPath("two");
    context_.OnResponseMutation(MutationKind::kStatus, 200);
    context_.AppendPath("later");

    EXPECT_EQ(context_.BeginFinalize(FinalizeReason::kResponseEnd)->path, "/two");
}

TEST_F(RequestContextTest, FinalStatusDoesNotRenameTransaction) {
    context_.AppendPath("wrap-start");
    context_.OnResponseMutation(MutationKind::kStatus, 200);
    context_.AppendPath("wrap-end");
    context_.SetFinalStatus(500);

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    EXPECT_EQ(trace->path, "/wrap-start");
    EXPECT_EQ(trace->status_code, 500);
}

TEST_F(RequestContextTest, FinalStatusWithoutTriggerKeepsLiveStack) {
    context_.AppendPath("a");
    context_.SetFinalStatus(200);
    context_.AppendPath("b");

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    EXPECT_EQ(trace->path, "/a/b");
    EXPECT_EQ(trace->status_code, 200);
}

TEST_F(RequestContextTest, NoTriggerUsesLiveStack) {
    context_.AppendPath("a");
    context_.AppendPath("b");
    EXPECT_EQ(context_.BeginFinalize(FinalizeReason::kAborted)->path, "/a/b");
}

TEST_F(RequestContextTest, FinalizeTruncatesOpenSegments) {
    chaintrace::Segment* open = context_.OpenSegment(nullptr, "custom");
    chaintrace::Segment* closed = context_.OpenSegment(nullptr, "closed");
    EXPECT_TRUE(context_.CloseSegment(closed));

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);

    EXPECT_EQ(open->name(), "Truncated/custom");
    EXPECT_TRUE(open->truncated());
    EXPECT_EQ(closed->name(), "closed");
    EXPECT_FALSE(trace->root().is_open());
    EXPECT_EQ(trace->duration, trace->root().Duration());
}

TEST_F(RequestContextTest, LateSignalsAreIgnored) {
    chaintrace::Segment* open = context_.OpenSegment(nullptr, "open");
    context_.BeginFinalize(FinalizeReason::kResponseEnd);

    EXPECT_EQ(context_.OpenSegment(nullptr, "late"), nullptr);
    EXPECT_FALSE(context_.CloseSegment(open));
    context_.AppendPath("late");
    context_.OnResponseMutation(MutationKind::kBody, 500);
    EXPECT_FALSE(context_.RecordUnhandledError(std::make_exception_ptr(std::runtime_error("late"))));

    EXPECT_TRUE(context_.PathStack().empty());
    EXPECT_EQ(context_.status_code(), 0);
    EXPECT_EQ(context_.root()->children().size(), 1u);
}

TEST_F(RequestContextTest, UnhandledErrorsAreDeduplicated) {
    auto error = std::make_exception_ptr(std::runtime_error("middleware error"));
    chaintrace::Segment* segment = context_.OpenSegment(nullptr, "Middleware/Chain/two");
    context_.NoticeError(error, segment);

    EXPECT_TRUE(context_.RecordUnhandledError(error));
    EXPECT_FALSE(context_.RecordUnhandledError(error));
    EXPECT_FALSE(context_.RecordUnhandledError(nullptr));

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    ASSERT_EQ(trace->errors.size(), 1u);
    EXPECT_EQ(trace->errors[0].message, "middleware error");
    EXPECT_EQ(trace->errors[0].segment, "Middleware/Chain/two");
    EXPECT_EQ(segment->error(), "middleware error");
}

TEST_F(RequestContextTest, HandledErrorWithSuccessStatusIsNotReported) {
    auto error = std::make_exception_ptr(std::runtime_error("middleware error"));
    context_.NoticeError(error, context_.OpenSegment(nullptr, "two"));
    context_.OnResponseMutation(MutationKind::kStatus, 200);

    EXPECT_TRUE(context_.BeginFinalize(FinalizeReason::kResponseEnd)->errors.empty());
}

TEST_F(RequestContextTest, ErrorStatusReportsLastNoticedError) {
    context_.NoticeError(std::make_exception_ptr(std::runtime_error("first")), nullptr);
    context_.NoticeError(std::make_exception_ptr(std::runtime_error("second")), nullptr);
    context_.OnResponseMutation(MutationKind::kStatus, 500);

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    ASSERT_EQ(trace->errors.size(), 1u);
    EXPECT_EQ(trace->errors[0].message, "second");
}

TEST_F(RequestContextTest, ErrorStatusWithoutErrorReportsHttpError) {
    context_.OnResponseMutation(MutationKind::kStatus, 503);

    auto trace = context_.BeginFinalize(FinalizeReason::kResponseEnd);
    ASSERT_EQ(trace->errors.size(), 1u);
    EXPECT_EQ(trace->errors[0].message, "HttpError 503");
    EXPECT_TRUE(trace->errors[0].segment.empty());
}

TEST_F(RequestContextTest, IgnoredStatusIsNotAnError) {
    context_.OnResponseMutation(MutationKind::kStatus, 404);
    EXPECT_TRUE(context_.BeginFinalize(FinalizeReason::kResponseEnd)->errors.empty());
}

TEST(DescribeError, HandlesNonStandardExceptions) {
    EXPECT_EQ(chaintrace::DescribeError(nullptr), "");
    EXPECT_EQ(chaintrace::DescribeError(std::make_exception_ptr(std::logic_error("x"))), "x");
    EXPECT_EQ(chaintrace::DescribeError(std::make_exception_ptr(std::string("text"))), "text");
    EXPECT_EQ(chaintrace::DescribeError(std::make_exception_ptr(42)), "unknown error");
}

TEST(RequestRegistry, AssignsIdsAndRemoves) {
    chaintrace::RequestRegistry registry;
    auto a = registry.Create(RequestDescriptor{}, TracerConfig{});
    auto b = registry.Create(RequestDescriptor{"POST", "/b"}, TracerConfig{});

    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.Find(b->id()), b);
    EXPECT_EQ(b->request().method, "POST");

    EXPECT_TRUE(registry.Remove(a->id()));
    EXPECT_FALSE(registry.Remove(a->id()));
    EXPECT_EQ(registry.Find(a->id()), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RequestRegistry, StartedBeforeSelectsOldRequests) {
    chaintrace::RequestRegistry registry;
    auto old_request = registry.Create(RequestDescriptor{}, TracerConfig{});
    const auto cutoff = chaintrace::Clock::now() + std::chrono::milliseconds(1);

    EXPECT_EQ(registry.StartedBefore(old_request->started_at()).size(), 0u);
    auto expired = registry.StartedBefore(cutoff);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], old_request);
}
