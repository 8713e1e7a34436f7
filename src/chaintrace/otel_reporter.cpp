// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/otel_reporter.h"

#include <cstdint>
#include <stdexcept>

#include "opentelemetry/common/timestamp.h"
#include "opentelemetry/trace/span_context.h"
#include "opentelemetry/trace/span_startoptions.h"

#include <spdlog/spdlog.h>

namespace chaintrace {

namespace trace_api = opentelemetry::trace;
namespace common = opentelemetry::common;

namespace {

std::string ErrorFor(const FinishedTrace& trace, std::uint32_t segment_id) {
    for (const auto& error : trace.errors) {
        if (error.segment_id == segment_id) {
            return error.message;
        }
    }
    return "";
}

}  // namespace

std::chrono::system_clock::time_point OtelTraceReporter::ClockOffset::ToSystem(
    Clock::time_point t) const {
    return system_now - std::chrono::duration_cast<std::chrono::system_clock::duration>(steady_now - t);
}

OtelTraceReporter::OtelTraceReporter(
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer)
    : tracer_(std::move(tracer)) {
    if (!tracer_) {
        throw std::invalid_argument("OtelTraceReporter requires a tracer");
    }
}

void OtelTraceReporter::Report(const FinishedTrace& trace) {
    const ClockOffset clock{Clock::now(), std::chrono::system_clock::now()};
    const Segment& root = trace.root();

    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kServer;
    options.start_system_time = common::SystemTimestamp(clock.ToSystem(root.start()));
    options.start_steady_time = common::SteadyTimestamp(root.start());

    auto span = tracer_->StartSpan(trace.name, options);
    span->SetAttribute("http.request.method", trace.request.method);
    span->SetAttribute("url.full", trace.request.url);
    span->SetAttribute("http.response.status_code", static_cast<int64_t>(trace.status_code));
    span->SetAttribute("chaintrace.request_id", static_cast<int64_t>(trace.request_id));
    span->SetAttribute("chaintrace.path", trace.path);
    span->SetAttribute("chaintrace.finalize_reason", ToString(trace.reason));

    // Errors that never crossed a middleware belong to the transaction itself
    for (const auto& error : trace.errors) {
        if (error.segment_id == trace.root().id()) {
            RecordError(*span, error.message);
        }
    }

    const trace_api::SpanContext root_context = span->GetContext();
    for (const auto& child : root.children()) {
        ExportSegment(trace, *child, root_context, clock);
    }

    trace_api::EndSpanOptions end_options;
    end_options.end_steady_time = common::SteadyTimestamp(root.end().value_or(clock.steady_now));
    span->End(end_options);

    spdlog::debug("Exported request {} as '{}' ({} segments)", trace.request_id, trace.name,
                  trace.tree->size());
}

void OtelTraceReporter::ExportSegment(const FinishedTrace& trace, const Segment& segment,
                                      const trace_api::SpanContext& parent,
                                      const ClockOffset& clock) {
    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kInternal;
    options.parent = parent;
    options.start_system_time = common::SystemTimestamp(clock.ToSystem(segment.start()));
    options.start_steady_time = common::SteadyTimestamp(segment.start());

    auto span = tracer_->StartSpan(segment.name(), options);
    if (segment.truncated()) {
        span->SetAttribute("chaintrace.truncated", true);
    }
    if (segment.is_placeholder()) {
        span->SetAttribute("chaintrace.collapsed_count",
                           static_cast<int64_t>(segment.collapsed_count()));
    }

    const std::string reported = ErrorFor(trace, segment.id());
    if (!reported.empty()) {
        RecordError(*span, reported);
    } else if (!segment.error().empty()) {
        // Caught further up the chain, kept as an event only
        span->AddEvent("exception", {{"exception.message", segment.error()}});
    }

    const trace_api::SpanContext context = span->GetContext();
    for (const auto& child : segment.children()) {
        ExportSegment(trace, *child, context, clock);
    }

    trace_api::EndSpanOptions end_options;
    end_options.end_steady_time = common::SteadyTimestamp(segment.end().value_or(clock.steady_now));
    span->End(end_options);
}

void OtelTraceReporter::RecordError(trace_api::Span& span, const std::string& message) {
    span.AddEvent("exception", {{"exception.message", message}});
    span.SetStatus(trace_api::StatusCode::kError, message);
}

}  // namespace chaintrace
