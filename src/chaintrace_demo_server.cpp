// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/strings/str_format.h"
#include "spdlog/spdlog.h"

#include "chaintrace/application.h"
#include "chaintrace/chain_tracer.h"
#include "chaintrace/engine_metrics.h"
#include "chaintrace/grpc_chain_service.h"
#include "chaintrace/grpc_request_interceptor.h"
#include "chaintrace/otel_provider.h"
#include "chaintrace/otel_reporter.h"
#include "chaintrace/segment_log_formatter.h"
#include "chaintrace/worker_pool.h"

ABSL_FLAG(uint16_t, port, 50051, "Server port for the service");
ABSL_FLAG(std::string, metrics_address, "127.0.0.1:8124", "Prometheus exposer address");
ABSL_FLAG(uint32_t, workers, 4, "Threads in the offload worker pool");

namespace {

void BuildChain(chaintrace::Application& app, chaintrace::WorkerPool& pool) {
  app.Use("access_log", [](chaintrace::Context& ctx, chaintrace::NextFn next) {
    const auto start = std::chrono::steady_clock::now();
    return next().Then([&ctx, start]() {
      std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
      spdlog::info("{} {} -> {} ({:.3f}ms)", ctx.request().method, ctx.request().url,
                   ctx.response().status(), elapsed.count());
    });
  });

  app.Use("router", [&pool](chaintrace::Context& ctx, chaintrace::NextFn next) {
    const std::string& method = ctx.request().url;
    const auto slash = method.find_last_of('/');
    const std::string name = slash == std::string::npos ? method : method.substr(slash + 1);
    ctx.AppendPath(name);

    if (name == "Echo") {
      ctx.response().SetBody("echo");
      return chaintrace::Completion::Resolved();
    }
    if (name == "Slow") {
      // Offloaded work keeps the request binding of the poster
      chaintrace::Deferred done;
      pool.post([&ctx, done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ctx.response().SetBody("slow");
        done.Resolve();
      });
      return done.completion();
    }
    if (name == "Fail") {
      throw std::runtime_error("requested failure");
    }
    return next();
  });
}

void RunServer(uint16_t port, const std::string& metrics_address, uint32_t workers) {
  std::string server_address = absl::StrFormat("0.0.0.0:%d", port);

  auto exposer = std::make_unique<prometheus::Exposer>(metrics_address);
  auto registry = std::make_shared<prometheus::Registry>();
  exposer->RegisterCollectable(registry);

  chaintrace::ChainTracer tracer(chaintrace::LoadTracerConfig());
  tracer.AddReporter(std::make_shared<chaintrace::EngineMetrics>(registry));
  tracer.AddReporter(std::make_shared<chaintrace::OtelTraceReporter>(
      chaintrace::OtelProvider::GetTracer("chaintrace-demo-server")));

  chaintrace::WorkerPool pool({.thread_count = workers, .name = "offload"});
  chaintrace::Application app(tracer);
  BuildChain(app, pool);
  app.OnError([](std::exception_ptr error, chaintrace::Context& ctx) {
    spdlog::warn("{} failed: {}", ctx.request().url, chaintrace::DescribeError(error));
  });

  auto tracker = std::make_shared<chaintrace::RpcRequestTracker>();
  chaintrace::ChainGenericService service(app, tracker);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterCallbackGenericService(&service);

  std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
  interceptors.push_back(std::make_unique<chaintrace::GrpcRequestInterceptorFactory>(tracer, tracker));
  builder.experimental().SetInterceptorCreators(std::move(interceptors));

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    spdlog::error("Failed to start server on {}", server_address);
    return;
  }

  // Reclaim requests whose RPC never reached a status
  std::jthread sweeper([&tracer](std::stop_token st) {
    while (!st.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      tracer.FinalizeExpired(chaintrace::Clock::now());
    }
  });

  spdlog::info("Server listening on {}, metrics on {}", server_address, metrics_address);
  server->Wait();
}

}  // namespace

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);

  chaintrace::OtelProvider::Initialize();
  chaintrace::SetSegmentLogging();

  RunServer(absl::GetFlag(FLAGS_port), absl::GetFlag(FLAGS_metrics_address),
            absl::GetFlag(FLAGS_workers));

  chaintrace::OtelProvider::Shutdown();
  return 0;
}
