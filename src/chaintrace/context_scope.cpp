// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/context_scope.h"

namespace chaintrace {

namespace {

// Holds only the binding of the continuation being executed; propagation across
// suspension points happens through captured bindings, never through this slot.
thread_local ContextBinding t_current_binding;

}  // namespace

ContextBinding CurrentBinding() {
    return t_current_binding;
}

ContextScope::ContextScope(ContextBinding binding)
    : previous_(std::exchange(t_current_binding, std::move(binding))) {}

ContextScope::~ContextScope() {
    t_current_binding = std::move(previous_);
}

}  // namespace chaintrace
