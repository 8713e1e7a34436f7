// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chaintrace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Limits on how much of a request's execution is tracked in detail
 *
 * - max_open_children: concurrently open detailed children under one segment
 * - max_segments: detailed segments per tree (root excluded)
 *
 * Segments opened beyond either limit collapse into a single placeholder child
 * of the requested parent.
 */
struct SegmentBudget {
    std::size_t max_open_children = 64;
    std::size_t max_segments = 900;
};

/**
 * @brief One span of execution time in a request's segment tree
 *
 * Segments are created and mutated only through SegmentTree. Readers get a
 * stable view once the owning request has been finalized.
 */
class Segment {
public:
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    /// Unique within the tree, assigned in creation order (root is 0)
    std::uint32_t id() const { return id_; }

    /// Reported name, including the "Truncated/" prefix for truncated segments
    const std::string& name() const { return name_; }

    Clock::time_point start() const { return start_; }
    std::optional<Clock::time_point> end() const { return end_; }
    bool is_open() const { return !end_.has_value(); }

    /// Elapsed time between start and end; zero while still open
    Clock::duration Duration() const;

    /// True for budget placeholders and for segments still open at finalization
    bool truncated() const { return truncated_; }
    bool is_placeholder() const { return placeholder_; }

    /// Number of open attempts folded into a placeholder
    std::size_t collapsed_count() const { return collapsed_count_; }

    /// Message of an error that escaped the work this segment measures
    const std::string& error() const { return error_; }

    Segment* parent() const { return parent_; }
    const std::vector<std::unique_ptr<Segment>>& children() const { return children_; }

private:
    friend class SegmentTree;

    Segment(std::uint32_t id, std::string name, Segment* parent, Clock::time_point start)
        : id_(id), name_(std::move(name)), parent_(parent), start_(start) {}

    std::uint32_t id_;
    std::string name_;
    Segment* parent_;
    Clock::time_point start_;
    std::optional<Clock::time_point> end_;
    std::vector<std::unique_ptr<Segment>> children_;
    std::string error_;

    bool truncated_ = false;
    bool placeholder_ = false;

    // Detailed children currently open
    std::size_t open_children_ = 0;

    // Placeholder bookkeeping
    Segment* placeholder_child_ = nullptr;
    std::size_t collapsed_count_ = 0;
    std::size_t pending_attempts_ = 0;
    std::optional<Clock::time_point> last_attempt_end_;
};

/**
 * @brief Append-only tree of execution segments for a single request
 *
 * Not synchronized; the owning RequestContext serializes access.
 */
class SegmentTree {
public:
    static constexpr const char* kTruncatedPrefix = "Truncated/";

    explicit SegmentTree(std::string root_name, SegmentBudget budget = SegmentBudget{});

    SegmentTree(const SegmentTree&) = delete;
    SegmentTree& operator=(const SegmentTree&) = delete;

    Segment* root() { return root_.get(); }
    const Segment* root() const { return root_.get(); }

    /**
     * @brief Open a child segment starting now
     *
     * @param parent Parent segment, or nullptr for the root
     * @param name Segment name
     * @return The new segment, or the parent's truncation placeholder when the
     *         budget is exhausted. nullptr only once the root has been closed.
     */
    Segment* Open(Segment* parent, const std::string& name);

    /**
     * @brief Close a segment now
     * @return false if the segment was already closed or belongs to another tree
     */
    bool Close(Segment* segment);

    /// True if segment hangs off this tree's root
    bool Owns(const Segment* segment) const;

    /// Attach an error message to a segment; the first message wins
    void RecordError(Segment* segment, const std::string& message);

    /// Rename the root, used once the transaction name is known
    void SetRootName(std::string name);

    /**
     * @brief Close everything still open, marking it truncated
     *
     * Placeholders are sealed at the end of their last collapsed attempt. The
     * root is closed last and is never marked truncated.
     *
     * @return Number of non-root segments that had to be force-closed
     */
    std::size_t CloseAll();

    /// Detailed segments created (root and placeholders excluded)
    std::size_t size() const { return detailed_count_; }

    /// Open attempts folded into placeholders
    std::size_t collapsed() const { return collapsed_total_; }

    const SegmentBudget& budget() const { return budget_; }

private:
    Segment* NearestOpen(Segment* segment) const;
    Segment* Collapse(Segment* parent, const std::string& name, Clock::time_point now);
    std::size_t CloseAllBelow(Segment* segment, Clock::time_point now);
    std::unique_ptr<Segment> MakeSegment(std::string name, Segment* parent, Clock::time_point now);

    SegmentBudget budget_;
    std::uint32_t next_id_ = 0;
    std::unique_ptr<Segment> root_;
    std::size_t detailed_count_ = 0;
    std::size_t collapsed_total_ = 0;
};

}  // namespace chaintrace
