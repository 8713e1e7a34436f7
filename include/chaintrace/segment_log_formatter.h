// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

/**
 * @file segment_log_formatter.h
 * @brief spdlog formatter that tags log lines with the current request and segment
 *
 * Usage:
 * @code
 * #include "chaintrace/segment_log_formatter.h"
 *
 * chaintrace::SetSegmentLogging();
 * spdlog::info("logged from a middleware");
 * // [2025-01-01 12:00:00.000] [info] logged from a middleware [request_id=7] [segment_id=3]
 * @endcode
 *
 * Outside of a request the line is left untouched.
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"
#include "chaintrace/request_context.h"

namespace chaintrace {

/**
 * @class SegmentLogFormatter
 * @brief Wraps a pattern formatter and appends the bound request context
 *
 * Thread Safety: reads only the calling thread's binding and immutable ids.
 */
class SegmentLogFormatter : public spdlog::formatter {
public:
    /**
     * @param pattern Base pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v")
     */
    explicit SegmentLogFormatter(const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v")
        : pattern_(pattern), base_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern)) {}

    void format(const spdlog::details::log_msg& msg, spdlog::memory_buf_t& dest) override {
        spdlog::memory_buf_t base_msg;
        base_formatter_->format(msg, base_msg);

        const std::string context = segment_context();
        if (context.empty()) {
            dest.append(base_msg.data(), base_msg.data() + base_msg.size());
            return;
        }

        // Keep the trailing newline last
        const size_t base_size = base_msg.size();
        size_t insert_pos = base_size;
        if (base_size > 0 && base_msg.data()[base_size - 1] == '\n') {
            insert_pos = base_size - 1;
        }
        dest.append(base_msg.data(), base_msg.data() + insert_pos);
        dest.append(context.data(), context.data() + context.size());
        if (insert_pos < base_size) {
            dest.push_back('\n');
        }
    }

    std::unique_ptr<spdlog::formatter> clone() const override {
        return std::make_unique<SegmentLogFormatter>(pattern_);
    }

private:
    /// " [request_id=N] [segment_id=M]", or empty outside a request
    static std::string segment_context() {
        const ContextBinding binding = CurrentBinding();
        if (!binding) {
            return "";
        }
        std::string context = " [request_id=" + std::to_string(binding.request->id()) + "]";
        if (binding.segment) {
            context += " [segment_id=" + std::to_string(binding.segment->id()) + "]";
        }
        return context;
    }

    std::string pattern_;
    std::unique_ptr<spdlog::formatter> base_formatter_;
};

/**
 * @brief Install SegmentLogFormatter on the default logger
 */
inline void SetSegmentLogging() {
    spdlog::set_formatter(std::make_unique<SegmentLogFormatter>());
}

/**
 * @brief Install SegmentLogFormatter on a named logger, if it exists
 */
inline void SetSegmentLogging(const std::string& logger_name) {
    if (auto logger = spdlog::get(logger_name)) {
        logger->set_formatter(std::make_unique<SegmentLogFormatter>());
    }
}

}  // namespace chaintrace
