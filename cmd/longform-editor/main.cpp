#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using longform::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: longform-editor <config.yaml> OR longform-editor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = longform::config::ConfigLoader::LoadFromYaml(config_path);

    longform::observability::InitializeTracing(config);
    longform::observability::InitializeMetrics(config);
    longform::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = longform::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LONGFORM_LOG_INFO("longform editor started", {longform::observability::StringField("bind_address", config.server().bind_address()),
                                                  longform::observability::StringField("compiler_revision", config.compiler().revision())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LONGFORM_LOG_INFO("shutting down longform editor");

    server.Stop();
    longform::observability::ShutdownLogging();
    longform::observability::ShutdownMetrics();
    longform::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    LONGFORM_LOG_ERROR("fatal error", {longform::observability::StringField("error", e.what())});
    longform::observability::ShutdownLogging();
    longform::observability::ShutdownMetrics();
    longform::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
