// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "chaintrace/segment_tree.h"

namespace chaintrace {

/**
 * @brief Engine configuration
 *
 * Environment Variables (read by LoadTracerConfig):
 * - CHAINTRACE_FRAMEWORK: framework label used in segment and transaction names
 * - CHAINTRACE_MAX_SEGMENTS: detailed segments per request
 * - CHAINTRACE_MAX_OPEN_CHILDREN: concurrently open detailed children per segment
 * - CHAINTRACE_REQUEST_TIMEOUT_MS: age after which FinalizeExpired() reclaims a request
 * - CHAINTRACE_IGNORE_STATUS_CODES: comma separated status codes never treated as errors
 */
struct TracerConfig {
    std::string framework = "Chain";
    SegmentBudget budget;
    std::chrono::milliseconds request_timeout{60000};
    std::vector<int> ignore_status_codes{404};

    /// True for 4xx/5xx statuses that are not ignored
    bool IsErrorStatus(int status_code) const;
};

/**
 * @brief Build a configuration from defaults overridden by the environment
 *
 * Malformed values are logged and the default is kept.
 */
TracerConfig LoadTracerConfig();

}  // namespace chaintrace
