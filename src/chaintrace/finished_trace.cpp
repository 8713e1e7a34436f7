// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/finished_trace.h"

#include <chrono>
#include <stdexcept>

namespace chaintrace {

const char* ToString(FinalizeReason reason) {
    switch (reason) {
        case FinalizeReason::kResponseEnd:
            return "response_end";
        case FinalizeReason::kAborted:
            return "aborted";
        case FinalizeReason::kTimeout:
            return "timeout";
    }
    return "unknown";
}

double FinishedTrace::DurationMs() const {
    return std::chrono::duration<double, std::milli>(duration).count();
}

std::string DescribeError(std::exception_ptr error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& message) {
        return message;
    } catch (const char* message) {
        return message ? message : "";
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace chaintrace
