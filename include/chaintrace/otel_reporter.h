// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/trace/span.h"
#include "opentelemetry/trace/tracer.h"

#include "chaintrace/finished_trace.h"

namespace chaintrace {

/**
 * @brief Exports finished traces as OpenTelemetry spans
 *
 * The root segment becomes a server span named after the transaction; every
 * other segment becomes an internal child span with the segment's own start
 * and end time.
 *
 * Span attributes:
 * - root: http.request.method, url.full, http.response.status_code,
 *   chaintrace.request_id, chaintrace.path, chaintrace.finalize_reason
 * - truncated segments: chaintrace.truncated, chaintrace.collapsed_count
 *
 * Reported errors become "exception" events on the span of the segment they
 * escaped from (the root when unknown) and set its status to error.
 */
class OtelTraceReporter : public TraceReporter {
public:
    explicit OtelTraceReporter(opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer);

    void Report(const FinishedTrace& trace) override;

private:
    struct ClockOffset {
        Clock::time_point steady_now;
        std::chrono::system_clock::time_point system_now;

        std::chrono::system_clock::time_point ToSystem(Clock::time_point t) const;
    };

    void ExportSegment(const FinishedTrace& trace, const Segment& segment,
                       const opentelemetry::trace::SpanContext& parent, const ClockOffset& clock);

    static void RecordError(opentelemetry::trace::Span& span, const std::string& message);

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
};

}  // namespace chaintrace
