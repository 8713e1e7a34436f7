// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/name_state.h"

namespace chaintrace {

void NameState::AppendPath(std::string component) {
    if (frozen_) {
        return;
    }
    stack_.push_back(std::move(component));
}

void NameState::PopPath() {
    if (frozen_ || stack_.empty()) {
        return;
    }
    stack_.pop_back();
}

void NameState::MarkPath() {
    if (frozen_) {
        return;
    }
    marked_ = stack_;
}

const std::vector<std::string>& NameState::Components() const {
    return marked_ ? *marked_ : stack_;
}

std::string NameState::GetPath() const {
    std::string path;
    for (const auto& component : Components()) {
        // Route-style components ("/users") carry their own separator
        std::size_t begin = 0;
        while (begin < component.size() && component[begin] == '/') {
            ++begin;
        }
        if (begin == component.size()) {
            continue;
        }
        path.push_back('/');
        path.append(component, begin, std::string::npos);
    }
    return path.empty() ? "/" : path;
}

}  // namespace chaintrace
