// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/sdk/resource/resource.h"
#include "opentelemetry/trace/tracer.h"

namespace chaintrace {

/**
 * @brief Process-wide OpenTelemetry tracer provider used to export finished traces
 *
 * Sets up an OTLP HTTP exporter behind a BatchSpanProcessor and installs the
 * result as the global OpenTelemetry tracer provider.
 *
 * Environment Variables:
 * - OTEL_EXPORTER_OTLP_ENDPOINT: collector endpoint (default: localhost:4317, sent to :4318 over HTTP)
 * - OTEL_SERVICE_NAME: service.name resource attribute (default: chaintrace-service)
 *
 * Thread Safety: All public methods are thread-safe
 *
 * @code
 *   chaintrace::OtelProvider::Initialize();
 *   tracer.AddReporter(std::make_shared<chaintrace::OtelTraceReporter>(
 *       chaintrace::OtelProvider::GetTracer("chaintrace")));
 *   ...
 *   chaintrace::OtelProvider::Shutdown();
 * @endcode
 */
class OtelProvider {
public:
    /**
     * @brief Initialize the global tracer provider
     *
     * Idempotent. Failures are logged and leave the no-op provider in place.
     */
    static void Initialize();

    /**
     * @brief Tracer from the global provider
     *
     * Returns a no-op tracer until Initialize() succeeded.
     */
    static opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer(
        const std::string& instrumentation_scope,
        const std::string& version = "1.0.0"
    );

    /**
     * @brief Flush pending spans and stop exporting
     * @return false on timeout or error
     */
    static bool Shutdown(uint32_t timeout_millis = 5000);

    /**
     * @brief Export batched spans now
     * @return false on timeout or error
     */
    static bool ForceFlush(uint32_t timeout_millis = 5000);

    static bool IsInitialized();

    /// OTLP HTTP traces URL for an OTEL_EXPORTER_OTLP_ENDPOINT value
    static std::string TracesUrl(const std::string& otlp_endpoint);

    OtelProvider(const OtelProvider&) = delete;
    OtelProvider& operator=(const OtelProvider&) = delete;

private:
    OtelProvider() = default;

    static void ReadConfiguration(std::string& otlp_endpoint, std::string& service_name);
    static opentelemetry::sdk::resource::Resource CreateResource(const std::string& service_name);

    static std::atomic<bool> initialized_;
};

}  // namespace chaintrace
