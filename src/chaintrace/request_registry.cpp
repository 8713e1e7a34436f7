// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/request_registry.h"

namespace chaintrace {

std::shared_ptr<RequestContext> RequestRegistry::Create(RequestDescriptor request,
                                                        const TracerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RequestId id = next_id_++;
    auto context = std::make_shared<RequestContext>(id, std::move(request), config);
    contexts_.emplace(id, context);
    return context;
}

std::shared_ptr<RequestContext> RequestRegistry::Find(RequestId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(id);
    if (it == contexts_.end()) {
        return nullptr;
    }
    return it->second;
}

bool RequestRegistry::Remove(RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.erase(id) > 0;
}

std::vector<std::shared_ptr<RequestContext>> RequestRegistry::StartedBefore(
    Clock::time_point deadline) const {
    std::vector<std::shared_ptr<RequestContext>> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, context] : contexts_) {
        if (context->started_at() < deadline) {
            expired.push_back(context);
        }
    }
    return expired;
}

std::size_t RequestRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

}  // namespace chaintrace
