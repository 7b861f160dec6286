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

using asyncquery::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  asyncquery::observability::ShutdownLogging();
  asyncquery::observability::ShutdownMetrics();
  asyncquery::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: async-query-dispatcher <config.yaml> OR async-query-dispatcher --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = asyncquery::config::ConfigLoader::LoadFromYaml(config_path);

    asyncquery::observability::InitializeTracing(config);
    asyncquery::observability::InitializeMetrics(config);
    asyncquery::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = asyncquery::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ASYNCQUERY_LOG_INFO("Async query dispatcher started",
                        {asyncquery::observability::StringField("bind_address", config.server().bind_address()),
                         asyncquery::observability::BoolField("sessions_enabled", config.sessions().enabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ASYNCQUERY_LOG_INFO("Shutting down async query dispatcher");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ASYNCQUERY_LOG_ERROR("Fatal error", {asyncquery::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
