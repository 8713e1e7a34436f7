// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/tracer_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace chaintrace {

namespace {

const char* ReadEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

// Plain decimal digits only, no whitespace or sign
std::size_t ParseCount(const char* name, const std::string& value) {
    const bool digits_only = std::all_of(value.begin(), value.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits_only) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer");
    }
    const unsigned long long parsed = std::stoull(value);
    if (parsed == 0) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer");
    }
    return static_cast<std::size_t>(parsed);
}

std::vector<int> ParseStatusList(const std::string& value) {
    std::vector<int> codes;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   item.end());
        if (item.empty()) {
            continue;
        }
        std::size_t consumed = 0;
        const int code = std::stoi(item, &consumed);
        if (consumed != item.size() || code < 100 || code > 599) {
            throw std::invalid_argument("invalid HTTP status code '" + item + "'");
        }
        codes.push_back(code);
    }
    return codes;
}

template <class Apply>
void Override(const char* name, Apply&& apply) {
    const char* value = ReadEnv(name);
    if (!value) {
        return;
    }
    try {
        apply(std::string(value));
        spdlog::debug("  {}={}", name, value);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}': {}", name, value, e.what());
    }
}

}  // namespace

bool TracerConfig::IsErrorStatus(int status_code) const {
    if (status_code < 400) {
        return false;
    }
    return std::find(ignore_status_codes.begin(), ignore_status_codes.end(), status_code) ==
           ignore_status_codes.end();
}

TracerConfig LoadTracerConfig() {
    TracerConfig config;

    Override("CHAINTRACE_FRAMEWORK", [&](const std::string& value) {
        config.framework = value;
    });
    Override("CHAINTRACE_MAX_SEGMENTS", [&](const std::string& value) {
        config.budget.max_segments = ParseCount("CHAINTRACE_MAX_SEGMENTS", value);
    });
    Override("CHAINTRACE_MAX_OPEN_CHILDREN", [&](const std::string& value) {
        config.budget.max_open_children = ParseCount("CHAINTRACE_MAX_OPEN_CHILDREN", value);
    });
    Override("CHAINTRACE_REQUEST_TIMEOUT_MS", [&](const std::string& value) {
        config.request_timeout =
            std::chrono::milliseconds(ParseCount("CHAINTRACE_REQUEST_TIMEOUT_MS", value));
    });
    Override("CHAINTRACE_IGNORE_STATUS_CODES", [&](const std::string& value) {
        config.ignore_status_codes = ParseStatusList(value);
    });

    return config;
}

}  // namespace chaintrace
