// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "chaintrace/chain_tracer.h"
#include "chaintrace/completion.h"

namespace chaintrace {

/**
 * @brief Error carrying the HTTP status the response should get
 */
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

/**
 * @brief Response under construction
 *
 * Assigning the body or the status fires a name trigger on the tracer.
 */
class Response {
public:
    Response(ChainTracer& tracer, RequestId id) : tracer_(tracer), id_(id) {}

    /// Also sets status 200 unless a status was assigned explicitly
    void SetBody(std::string body);
    void SetStatus(int status);

    const std::string& body() const { return body_; }
    int status() const { return status_; }
    bool has_body() const { return has_body_; }

private:
    friend class Application;

    // Error responses bypass the name triggers for the body
    void WriteError(int status, std::string message);

    ChainTracer& tracer_;
    RequestId id_;
    std::string body_;
    int status_ = 404;
    bool has_body_ = false;
    bool explicit_status_ = false;
};

/**
 * @brief Per-request view passed to every middleware
 */
class Context {
public:
    Context(ChainTracer& tracer, RequestId id, RequestDescriptor request)
        : tracer_(tracer), id_(id), request_(std::move(request)), response_(tracer, id) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    RequestId request_id() const { return id_; }
    const RequestDescriptor& request() const { return request_; }
    Response& response() { return response_; }
    const Response& response() const { return response_; }

    /// Append a component to the transaction naming path
    void AppendPath(std::string component) { tracer_.AppendPath(id_, std::move(component)); }

private:
    ChainTracer& tracer_;
    RequestId id_;
    RequestDescriptor request_;
    Response response_;
};

using Middleware = std::function<Completion(Context&, NextFn)>;
using ErrorListener = std::function<void(std::exception_ptr, Context&)>;
using ResponseCallback = std::function<void(const Response&)>;

/**
 * @brief Koa-style middleware dispatcher with tracing built in
 *
 * Middleware run in registration order; each decides whether and when to
 * continue the chain through next(). An error escaping the chain is reported
 * to the tracer and the error listeners, and turned into an error response.
 *
 * Registration is not synchronized with Handle(); register everything before
 * serving.
 */
class Application {
public:
    explicit Application(ChainTracer& tracer) : tracer_(tracer) {}

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// @throws std::invalid_argument for an empty middleware
    Application& Use(MiddlewareOptions options, Middleware fn);
    Application& Use(std::string name, Middleware fn);

    /// Anonymous middleware
    Application& Use(Middleware fn);

    /// Listener for errors that escape the chain
    void OnError(ErrorListener listener);

    /**
     * @brief Start, run and finalize one request
     *
     * @param request Method and URL of the request
     * @param on_response Receives the response before the request finalizes
     * @return Completion resolved once the request has been finalized
     */
    Completion Handle(RequestDescriptor request, ResponseCallback on_response = nullptr);

    /**
     * @brief Run the chain for a request started elsewhere
     *
     * Used by transports that own the request lifecycle (the gRPC
     * interceptor); finalization is left to the caller. A failing
     * on_response finalizes the request as aborted.
     *
     * @return Completion resolved once the response has been delivered
     */
    Completion Serve(const std::shared_ptr<RequestContext>& request,
                     ResponseCallback on_response = nullptr);

    std::size_t size() const { return middleware_.size(); }
    ChainTracer& tracer() { return tracer_; }

private:
    Completion Dispatch(const std::shared_ptr<Context>& context, std::size_t index);
    void HandleError(Context& context, std::exception_ptr error);
    void Respond(Context& context, const ResponseCallback& on_response);

    ChainTracer& tracer_;
    std::vector<Middleware> middleware_;

    std::mutex listeners_mutex_;
    std::vector<ErrorListener> listeners_;
};

}  // namespace chaintrace
