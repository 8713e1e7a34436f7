// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace chaintrace {

/**
 * @brief Per-request path stack used to derive the transaction name
 *
 * Components are appended in causal order while middleware run. A name
 * trigger (response body or status assignment) snapshots the live stack with
 * MarkPath(); the reported path is the latest snapshot, or the live stack if
 * no trigger ever fired. Freeze() makes every further mutation a no-op.
 *
 * Not synchronized; the owning RequestContext serializes access.
 */
class NameState {
public:
    void AppendPath(std::string component);
    void PopPath();

    /// Snapshot the live stack as the path that names the transaction
    void MarkPath();
    bool HasMark() const { return marked_.has_value(); }

    void Freeze() { frozen_ = true; }
    bool IsFrozen() const { return frozen_; }

    /// Live stack, including components appended after the last trigger
    const std::vector<std::string>& stack() const { return stack_; }

    /// Components that name the transaction
    const std::vector<std::string>& Components() const;

    /// Components joined as "/a/b/c"; "/" when there are none
    std::string GetPath() const;

private:
    std::vector<std::string> stack_;
    std::optional<std::vector<std::string>> marked_;
    bool frozen_ = false;
};

}  // namespace chaintrace
