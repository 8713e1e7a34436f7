// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/segment_tree.h"

#include <spdlog/spdlog.h>

namespace chaintrace {

Clock::duration Segment::Duration() const {
    if (!end_) {
        return Clock::duration::zero();
    }
    return *end_ - start_;
}

SegmentTree::SegmentTree(std::string root_name, SegmentBudget budget)
    : budget_(budget) {
    root_ = MakeSegment(std::move(root_name), nullptr, Clock::now());
}

std::unique_ptr<Segment> SegmentTree::MakeSegment(std::string name, Segment* parent,
                                                  Clock::time_point now) {
    return std::unique_ptr<Segment>(new Segment(next_id_++, std::move(name), parent, now));
}

Segment* SegmentTree::NearestOpen(Segment* segment) const {
    while (segment && !segment->is_open()) {
        segment = segment->parent_;
    }
    return segment;
}

Segment* SegmentTree::Open(Segment* parent, const std::string& name) {
    const auto now = Clock::now();

    if (!parent) {
        parent = root_.get();
    }

    // Everything beneath a placeholder is folded into it
    if (parent->placeholder_) {
        if (parent->is_open()) {
            ++parent->collapsed_count_;
            ++parent->pending_attempts_;
            ++collapsed_total_;
            return parent;
        }
        parent = parent->parent_;
    }

    parent = NearestOpen(parent);
    if (!parent) {
        spdlog::debug("Segment '{}' opened after the tree was closed, dropping", name);
        return nullptr;
    }

    if (parent->open_children_ >= budget_.max_open_children ||
        detailed_count_ >= budget_.max_segments) {
        return Collapse(parent, name, now);
    }

    auto child = MakeSegment(name, parent, now);
    Segment* raw = child.get();
    parent->children_.push_back(std::move(child));
    ++parent->open_children_;
    ++detailed_count_;
    return raw;
}

Segment* SegmentTree::Collapse(Segment* parent, const std::string& name, Clock::time_point now) {
    Segment* placeholder = parent->placeholder_child_;
    if (!placeholder) {
        auto child = MakeSegment(kTruncatedPrefix + name, parent, now);
        child->placeholder_ = true;
        child->truncated_ = true;
        placeholder = child.get();
        parent->children_.push_back(std::move(child));
        parent->placeholder_child_ = placeholder;
        spdlog::debug("Segment budget exhausted under '{}', collapsing into '{}'",
                      parent->name_, placeholder->name_);
    }

    ++placeholder->collapsed_count_;
    ++placeholder->pending_attempts_;
    ++collapsed_total_;
    return placeholder;
}

bool SegmentTree::Close(Segment* segment) {
    if (!segment || !segment->is_open() || !Owns(segment)) {
        return false;
    }

    const auto now = Clock::now();

    if (segment->placeholder_) {
        // The placeholder stays open for later attempts; it is sealed by CloseAll
        if (segment->pending_attempts_ == 0) {
            return false;
        }
        --segment->pending_attempts_;
        segment->last_attempt_end_ = now;
        return true;
    }

    segment->end_ = now;
    if (segment->parent_ && segment->parent_->open_children_ > 0) {
        --segment->parent_->open_children_;
    }
    return true;
}

bool SegmentTree::Owns(const Segment* segment) const {
    while (segment && segment->parent_) {
        segment = segment->parent_;
    }
    return segment != nullptr && segment == root_.get();
}

void SegmentTree::RecordError(Segment* segment, const std::string& message) {
    if (segment && segment->error_.empty()) {
        segment->error_ = message;
    }
}

void SegmentTree::SetRootName(std::string name) {
    root_->name_ = std::move(name);
}

std::size_t SegmentTree::CloseAll() {
    const auto now = Clock::now();
    std::size_t forced = CloseAllBelow(root_.get(), now);
    if (root_->is_open()) {
        root_->end_ = now;
    }
    return forced;
}

std::size_t SegmentTree::CloseAllBelow(Segment* segment, Clock::time_point now) {
    std::size_t forced = 0;
    for (auto& child : segment->children_) {
        forced += CloseAllBelow(child.get(), now);

        if (!child->is_open()) {
            continue;
        }

        if (child->placeholder_) {
            if (child->pending_attempts_ > 0 || !child->last_attempt_end_) {
                child->end_ = now;
                ++forced;
            } else {
                child->end_ = child->last_attempt_end_;
            }
            child->pending_attempts_ = 0;
            continue;
        }

        child->end_ = now;
        child->truncated_ = true;
        child->name_ = kTruncatedPrefix + child->name_;
        ++forced;
    }
    segment->open_children_ = 0;
    return forced;
}

}  // namespace chaintrace
