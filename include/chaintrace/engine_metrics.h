// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "chaintrace/finished_trace.h"

namespace chaintrace {

// Prometheus counters and histogram fed by every finished trace.
class EngineMetrics : public TraceReporter {
public:
    explicit EngineMetrics(const std::shared_ptr<prometheus::Registry>& registry);

    void Report(const FinishedTrace& trace) override;

    // Labelled by finalize reason
    prometheus::Family<prometheus::Counter>& transactions_family;

    prometheus::Counter& errors_total;
    prometheus::Counter& truncated_segments_total;
    prometheus::Counter& collapsed_segments_total;
    prometheus::Histogram& duration_histogram;
};

}  // namespace chaintrace
