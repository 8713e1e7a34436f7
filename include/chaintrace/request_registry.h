// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "chaintrace/request_context.h"

namespace chaintrace {

/**
 * @brief Live request contexts keyed by request id
 *
 * Thread Safety: all methods are thread-safe.
 */
class RequestRegistry {
public:
    /// Create and register a context with the next request id
    std::shared_ptr<RequestContext> Create(RequestDescriptor request, const TracerConfig& config);

    /// @return nullptr for unknown or already removed ids
    std::shared_ptr<RequestContext> Find(RequestId id) const;

    /// @return false if the id was not registered
    bool Remove(RequestId id);

    /// Contexts created before the given time point
    std::vector<std::shared_ptr<RequestContext>> StartedBefore(Clock::time_point deadline) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    RequestId next_id_ = 1;
    std::unordered_map<RequestId, std::shared_ptr<RequestContext>> contexts_;
};

}  // namespace chaintrace
