// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

/**
 * Unit Tests: Completion, Deferred and ContextScope
 *
 * This test verifies:
 * - Settlement happens once and continuations run in registration order
 * - Then()/Catch() chaining, adoption of returned completions
 * - Continuations run inside the binding current at registration
 */

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chaintrace/completion.h"
#include "chaintrace/context_scope.h"
#include "chaintrace/request_context.h"

using chaintrace::Completion;
using chaintrace::ContextBinding;
using chaintrace::ContextScope;
using chaintrace::CurrentBinding;
using chaintrace::Deferred;

namespace {

std::string MessageOf(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

std::shared_ptr<chaintrace::RequestContext> MakeRequest(chaintrace::RequestId id) {
    return std::make_shared<chaintrace::RequestContext>(id, chaintrace::RequestDescriptor{},
                                                        chaintrace::TracerConfig{});
}

}  // namespace

TEST(Completion, ResolvedAndRejectedFactories) {
    Completion ok = Completion::Resolved();
    EXPECT_TRUE(ok.is_resolved());
    EXPECT_FALSE(ok.is_pending());
    EXPECT_EQ(ok.error(), nullptr);

    Completion failed = Completion::Rejected(std::make_exception_ptr(std::runtime_error("boom")));
    EXPECT_TRUE(failed.is_rejected());
    EXPECT_EQ(MessageOf(failed.error()), "boom");

    EXPECT_THROW(Completion::Rejected(nullptr), std::invalid_argument);
}

TEST(Completion, SettlesOnlyOnce) {
    Deferred deferred;
    EXPECT_TRUE(deferred.completion().is_pending());

    EXPECT_TRUE(deferred.Resolve());
    EXPECT_FALSE(deferred.Resolve());
    EXPECT_FALSE(deferred.Reject(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_TRUE(deferred.completion().is_resolved());
}

TEST(Completion, CallbacksRunOnSettleInRegistrationOrder) {
    Deferred deferred;
    std::vector<int> order;
    deferred.completion().OnSettled([&](std::exception_ptr) { order.push_back(1); });
    deferred.completion().OnSettled([&](std::exception_ptr) { order.push_back(2); });
    EXPECT_TRUE(order.empty());

    deferred.Resolve();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));

    // Already settled: runs immediately
    deferred.completion().OnSettled([&](std::exception_ptr) { order.push_back(3); });
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(Completion, FromCallCapturesThrow) {
    Completion ok = Completion::FromCall([] {});
    EXPECT_TRUE(ok.is_resolved());

    Completion failed = Completion::FromCall([] { throw std::runtime_error("sync"); });
    ASSERT_TRUE(failed.is_rejected());
    EXPECT_EQ(MessageOf(failed.error()), "sync");
}

TEST(Completion, ThenSkipsOnRejectionAndPropagatesSameError) {
    auto error = std::make_exception_ptr(std::runtime_error("first"));
    bool ran = false;

    Completion chained = Completion::Rejected(error).Then([&] { ran = true; });

    EXPECT_FALSE(ran);
    ASSERT_TRUE(chained.is_rejected());
    EXPECT_EQ(chained.error(), error);
}

TEST(Completion, ThenAdoptsReturnedCompletion) {
    Deferred inner;
    Completion chained = Completion::Resolved().Then([inner] { return inner.completion(); });

    EXPECT_TRUE(chained.is_pending());
    inner.Resolve();
    EXPECT_TRUE(chained.is_resolved());
}

TEST(Completion, CatchRecoversOrRethrows) {
    auto error = std::make_exception_ptr(std::runtime_error("handled"));

    std::string seen;
    Completion recovered = Completion::Rejected(error).Catch([&](std::exception_ptr e) {
        seen = MessageOf(e);
    });
    EXPECT_EQ(seen, "handled");
    EXPECT_TRUE(recovered.is_resolved());

    Completion still_failed = Completion::Rejected(error).Catch([](std::exception_ptr e) {
        std::rethrow_exception(e);
    });
    ASSERT_TRUE(still_failed.is_rejected());
    EXPECT_EQ(still_failed.error(), error);

    Completion passthrough = Completion::Resolved().Catch([&](std::exception_ptr) { seen = "no"; });
    EXPECT_TRUE(passthrough.is_resolved());
    EXPECT_EQ(seen, "handled");
}

TEST(Completion, ContinuationThrowRejectsChain) {
    Completion chained = Completion::Resolved().Then([] { throw std::logic_error("then"); });
    ASSERT_TRUE(chained.is_rejected());
    EXPECT_EQ(MessageOf(chained.error()), "then");
}

TEST(ContextScope, NestsAndRestores) {
    auto outer = MakeRequest(1);
    auto inner = MakeRequest(2);

    EXPECT_FALSE(CurrentBinding());
    {
        ContextScope a(ContextBinding{outer, outer->root()});
        EXPECT_EQ(CurrentBinding().request, outer);
        {
            ContextScope b(ContextBinding{inner, nullptr});
            EXPECT_EQ(CurrentBinding().request, inner);
            EXPECT_EQ(CurrentBinding().segment, nullptr);
        }
        EXPECT_EQ(CurrentBinding().request, outer);
        EXPECT_EQ(CurrentBinding().segment, outer->root());
    }
    EXPECT_FALSE(CurrentBinding());
}

TEST(ContextScope, ContinuationRunsInRegistrationBinding) {
    auto request = MakeRequest(1);
    Deferred deferred;

    std::shared_ptr<chaintrace::RequestContext> seen;
    {
        ContextScope scope(ContextBinding{request, request->root()});
        deferred.completion().Then([&] { seen = CurrentBinding().request; });
    }

    // Settled outside any binding
    EXPECT_FALSE(CurrentBinding());
    deferred.Resolve();
    EXPECT_EQ(seen, request);
    EXPECT_FALSE(CurrentBinding());
}

TEST(ContextScope, BindingFollowsContinuationAcrossThreads) {
    auto request = MakeRequest(7);
    Deferred deferred;

    chaintrace::RequestId seen = 0;
    {
        ContextScope scope(ContextBinding{request, request->root()});
        deferred.completion().Then([&] {
            auto current = CurrentBinding().request;
            seen = current ? current->id() : 0;
        });
    }

    std::thread settler([deferred] { deferred.Resolve(); });
    settler.join();
    EXPECT_EQ(seen, 7u);
}

TEST(ContextScope, BindToCurrentCapturesNow) {
    auto request = MakeRequest(3);
    std::function<void()> task;
    std::shared_ptr<chaintrace::RequestContext> seen;
    {
        ContextScope scope(ContextBinding{request, nullptr});
        task = chaintrace::BindToCurrent([&] { seen = CurrentBinding().request; });
    }
    task();
    EXPECT_EQ(seen, request);
}
