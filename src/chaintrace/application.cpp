// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/application.h"

#include <atomic>

#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"

namespace chaintrace {

void Response::SetBody(std::string body) {
    body_ = std::move(body);
    has_body_ = true;
    if (!explicit_status_) {
        status_ = 200;
    }
    tracer_.OnResponseMutation(id_, MutationKind::kBody, status_);
}

void Response::SetStatus(int status) {
    if (status < 100 || status > 999) {
        throw std::invalid_argument("invalid status code " + std::to_string(status));
    }
    status_ = status;
    explicit_status_ = true;
    tracer_.OnResponseMutation(id_, MutationKind::kStatus, status_);
}

void Response::WriteError(int status, std::string message) {
    SetStatus(status);
    body_ = std::move(message);
    has_body_ = true;
}

Application& Application::Use(MiddlewareOptions options, Middleware fn) {
    if (!fn) {
        throw std::invalid_argument("middleware must be callable");
    }
    middleware_.push_back(WrapMiddleware<Context>(tracer_, std::move(options), std::move(fn)));
    return *this;
}

Application& Application::Use(std::string name, Middleware fn) {
    return Use(MiddlewareOptions{std::move(name), ""}, std::move(fn));
}

Application& Application::Use(Middleware fn) {
    return Use(MiddlewareOptions{}, std::move(fn));
}

void Application::OnError(ErrorListener listener) {
    if (!listener) {
        throw std::invalid_argument("error listener must be callable");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

Completion Application::Dispatch(const std::shared_ptr<Context>& context, std::size_t index) {
    if (index >= middleware_.size()) {
        return Completion::Resolved();
    }

    auto called = std::make_shared<std::atomic<bool>>(false);
    NextFn next = [this, context, index, called]() -> Completion {
        if (called->exchange(true)) {
            return Completion::Rejected(
                std::make_exception_ptr(std::logic_error("next() called multiple times")));
        }
        return Dispatch(context, index + 1);
    };

    try {
        return middleware_[index](*context, std::move(next));
    } catch (...) {
        return Completion::Rejected(std::current_exception());
    }
}

Completion Application::Handle(RequestDescriptor request, ResponseCallback on_response) {
    auto trace = tracer_.OnRequestStart(std::move(request));
    const RequestId id = trace->id();
    return Serve(trace, std::move(on_response)).Then([this, id]() { tracer_.OnRequestEnd(id); });
}

Completion Application::Serve(const std::shared_ptr<RequestContext>& request,
                              ResponseCallback on_response) {
    if (!request) {
        throw std::invalid_argument("Serve requires a request context");
    }
    auto context = std::make_shared<Context>(tracer_, request->id(), request->request());

    ContextScope scope(ContextBinding{request, request->root()});
    Deferred delivered;
    Dispatch(context, 0)
        .Catch([this, context](std::exception_ptr error) { HandleError(*context, error); })
        .OnSettled([this, context, delivered, on_response = std::move(on_response)](
                       std::exception_ptr error) {
            if (error) {
                // Non-standard exceptions skip HandleError's response mapping
                context->response().WriteError(500, "Internal Server Error");
            }
            Respond(*context, on_response);
            delivered.Resolve();
        });
    return delivered.completion();
}

void Application::HandleError(Context& context, std::exception_ptr error) {
    tracer_.OnUnhandledError(context.request_id(), error);

    std::vector<ErrorListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    if (listeners.empty()) {
        spdlog::error("Request {} failed: {}", context.request_id(), DescribeError(error));
    }
    for (const auto& listener : listeners) {
        try {
            listener(error, context);
        } catch (const std::exception& e) {
            spdlog::error("Error listener failed for request {}: {}", context.request_id(), e.what());
        }
    }

    int status = 500;
    std::string message = "Internal Server Error";
    try {
        std::rethrow_exception(error);
    } catch (const HttpError& e) {
        status = e.status();
        message = e.what();
    } catch (const std::exception&) {
        // Internal details stay out of the response
    }
    context.response().WriteError(status, std::move(message));
}

void Application::Respond(Context& context, const ResponseCallback& on_response) {
    if (on_response) {
        try {
            on_response(context.response());
        } catch (const std::exception& e) {
            spdlog::error("Request {} response delivery failed: {}", context.request_id(), e.what());
            tracer_.OnRequestAborted(context.request_id());
        }
    }
}

}  // namespace chaintrace
