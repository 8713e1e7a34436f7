// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/otel_provider.h"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include "opentelemetry/exporters/otlp/otlp_http_exporter_factory.h"
#include "opentelemetry/exporters/otlp/otlp_http_exporter_options.h"
#include "opentelemetry/sdk/trace/batch_span_processor_factory.h"
#include "opentelemetry/sdk/trace/batch_span_processor_options.h"
#include "opentelemetry/sdk/trace/tracer_provider.h"
#include "opentelemetry/sdk/trace/tracer_provider_factory.h"
#include "opentelemetry/semconv/incubating/host_attributes.h"
#include "opentelemetry/semconv/incubating/process_attributes.h"
#include "opentelemetry/semconv/service_attributes.h"
#include "opentelemetry/semconv/telemetry_attributes.h"
#include "opentelemetry/trace/provider.h"
#include "opentelemetry/version.h"

#include <limits.h>
#include <unistd.h>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

#include <spdlog/spdlog.h>

namespace chaintrace {

std::atomic<bool> OtelProvider::initialized_{false};

static std::mutex g_init_mutex;

void OtelProvider::Initialize() {
    if (initialized_.load(std::memory_order_acquire)) {
        spdlog::debug("OtelProvider already initialized, skipping");
        return;
    }

    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (initialized_.load(std::memory_order_relaxed)) {
        return;
    }

    try {
        std::string otlp_endpoint;
        std::string service_name;
        ReadConfiguration(otlp_endpoint, service_name);

        opentelemetry::exporter::otlp::OtlpHttpExporterOptions exporter_options;
        exporter_options.url = TracesUrl(otlp_endpoint);
        exporter_options.timeout = std::chrono::seconds(10);

        spdlog::info("Initializing OpenTelemetry export to {} as '{}'", exporter_options.url,
                     service_name);

        auto exporter = opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(exporter_options);
        if (!exporter) {
            throw std::runtime_error("Failed to create OTLP HTTP exporter");
        }

        opentelemetry::sdk::trace::BatchSpanProcessorOptions processor_options;
        processor_options.max_queue_size = 2048;
        processor_options.schedule_delay_millis = std::chrono::milliseconds(5000);
        processor_options.max_export_batch_size = 512;

        auto processor = opentelemetry::sdk::trace::BatchSpanProcessorFactory::Create(
            std::move(exporter), processor_options);
        if (!processor) {
            throw std::runtime_error("Failed to create BatchSpanProcessor");
        }

        auto provider_unique = opentelemetry::sdk::trace::TracerProviderFactory::Create(
            std::move(processor), CreateResource(service_name));
        if (!provider_unique) {
            throw std::runtime_error("Failed to create TracerProvider");
        }

        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider> provider{
            std::unique_ptr<opentelemetry::trace::TracerProvider>{std::move(provider_unique)}
        };
        opentelemetry::trace::Provider::SetTracerProvider(provider);

        initialized_.store(true, std::memory_order_release);
        spdlog::info("OpenTelemetry export initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize OtelProvider: {}", e.what());
        spdlog::warn("Finished traces will not be exported");
    }
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> OtelProvider::GetTracer(
    const std::string& instrumentation_scope,
    const std::string& version
) {
    // The global provider is a no-op provider until Initialize() succeeds
    return opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(instrumentation_scope,
                                                                         version);
}

bool OtelProvider::Shutdown(uint32_t timeout_millis) {
    if (!initialized_.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        auto provider = opentelemetry::trace::Provider::GetTracerProvider();
        auto* sdk_provider = dynamic_cast<opentelemetry::sdk::trace::TracerProvider*>(provider.get());
        if (sdk_provider) {
            const bool result = sdk_provider->Shutdown(std::chrono::milliseconds(timeout_millis));
            if (!result) {
                spdlog::warn("OtelProvider shutdown timed out or failed");
            }
            return result;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error during OtelProvider shutdown: {}", e.what());
        return false;
    }
    return true;
}

bool OtelProvider::ForceFlush(uint32_t timeout_millis) {
    if (!initialized_.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        auto provider = opentelemetry::trace::Provider::GetTracerProvider();
        auto* sdk_provider = dynamic_cast<opentelemetry::sdk::trace::TracerProvider*>(provider.get());
        if (sdk_provider) {
            const bool result = sdk_provider->ForceFlush(std::chrono::milliseconds(timeout_millis));
            if (!result) {
                spdlog::warn("OtelProvider force flush timed out or failed");
            }
            return result;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error during OtelProvider force flush: {}", e.what());
        return false;
    }
    return true;
}

bool OtelProvider::IsInitialized() {
    return initialized_.load(std::memory_order_acquire);
}

std::string OtelProvider::TracesUrl(const std::string& otlp_endpoint) {
    if (otlp_endpoint.rfind("http://", 0) == 0 || otlp_endpoint.rfind("https://", 0) == 0) {
        if (otlp_endpoint.find("/v1/traces") == std::string::npos) {
            return otlp_endpoint + "/v1/traces";
        }
        return otlp_endpoint;
    }
    if (otlp_endpoint == "localhost:4317") {
        // gRPC default port, the HTTP exporter talks to 4318
        return "http://localhost:4318/v1/traces";
    }
    return "http://" + otlp_endpoint + "/v1/traces";
}

void OtelProvider::ReadConfiguration(std::string& otlp_endpoint, std::string& service_name) {
    const char* endpoint_env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");
    otlp_endpoint = (endpoint_env && endpoint_env[0] != '\0') ? endpoint_env : "localhost:4317";

    const char* service_env = std::getenv("OTEL_SERVICE_NAME");
    service_name = (service_env && service_env[0] != '\0') ? service_env : "chaintrace-service";
}

opentelemetry::sdk::resource::Resource OtelProvider::CreateResource(const std::string& service_name) {
    namespace resource = opentelemetry::sdk::resource;
    namespace semconv_service = opentelemetry::semconv::service;
    namespace semconv_host = opentelemetry::semconv::host;
    namespace semconv_process = opentelemetry::semconv::process;
    namespace semconv_telemetry = opentelemetry::semconv::telemetry;

    char hostname[HOST_NAME_MAX + 1] = {0};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        spdlog::warn("Failed to get hostname, using 'unknown'");
        std::strncpy(hostname, "unknown", sizeof(hostname) - 1);
    }

    auto attributes = resource::ResourceAttributes{
        {semconv_service::kServiceName, service_name},
        {semconv_host::kHostName, std::string(hostname)},
        {semconv_process::kProcessPid, static_cast<int32_t>(getpid())},
        {semconv_telemetry::kTelemetrySdkName, "opentelemetry-cpp"},
        {semconv_telemetry::kTelemetrySdkLanguage, "cpp"},
        {semconv_telemetry::kTelemetrySdkVersion, OPENTELEMETRY_VERSION}
    };

    return resource::Resource::Create(attributes);
}

}  // namespace chaintrace
