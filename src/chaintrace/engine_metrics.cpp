// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/engine_metrics.h"

#include <chrono>
#include <cstddef>
#include <vector>

namespace chaintrace {

namespace {

std::size_t CountTruncated(const Segment& segment) {
    std::size_t count = segment.truncated() ? 1 : 0;
    for (const auto& child : segment.children()) {
        count += CountTruncated(*child);
    }
    return count;
}

}  // namespace

EngineMetrics::EngineMetrics(const std::shared_ptr<prometheus::Registry>& registry)
    : transactions_family(prometheus::BuildCounter()
                              .Name("chaintrace_transactions_total")
                              .Help("Finished transactions by finalize reason")
                              .Register(*registry)),
      errors_total(prometheus::BuildCounter()
                       .Name("chaintrace_errors_total")
                       .Help("Errors reported on finished transactions")
                       .Register(*registry)
                       .Add({})),
      truncated_segments_total(prometheus::BuildCounter()
                                   .Name("chaintrace_truncated_segments_total")
                                   .Help("Segments reported as truncated")
                                   .Register(*registry)
                                   .Add({})),
      collapsed_segments_total(prometheus::BuildCounter()
                                   .Name("chaintrace_collapsed_segments_total")
                                   .Help("Segment opens folded into truncation placeholders")
                                   .Register(*registry)
                                   .Add({})),
      duration_histogram(prometheus::BuildHistogram()
                             .Name("chaintrace_transaction_duration_seconds")
                             .Help("Transaction duration in seconds")
                             .Register(*registry)
                             .Add({}, std::vector<double>{
                                 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0
                             })) {}

void EngineMetrics::Report(const FinishedTrace& trace) {
    transactions_family.Add({{"reason", ToString(trace.reason)}}).Increment();
    errors_total.Increment(static_cast<double>(trace.errors.size()));
    truncated_segments_total.Increment(static_cast<double>(CountTruncated(trace.root())));
    collapsed_segments_total.Increment(static_cast<double>(trace.tree->collapsed()));

    std::chrono::duration<double> elapsed = trace.duration;
    duration_histogram.Observe(elapsed.count());
}

}  // namespace chaintrace
