#include <pthread.h>
#include <signal.h>

#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rpc/dispatcher.hpp"
#include "internal/runtime/server.hpp"

namespace {

std::optional<std::string> ConfigPath(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]).rfind("--", 0) != 0) return argv[1];
  if (argc == 3 && std::string(argv[1]) == "--config") return argv[2];
  return std::nullopt;
}

// Blocked before any thread starts so every thread inherits the mask and
// only the main thread receives the signals, through sigwait().
sigset_t BlockShutdownSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPath(argc, argv);
  if (!config_path) {
    std::cerr << "Usage: cms-admin <config.yaml> | cms-admin --config <config.yaml>\n";
    return 1;
  }

  const sigset_t shutdown_signals = BlockShutdownSignals();

  try {
    const auto config = cms::config::ConfigLoader::LoadFromYaml(*config_path);
    cms::observability::InitializeLogging(config);

    auto app = cms::factory::Build(config);

    cms::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    CMS_LOG_INFO("Admin front end ready", {cms::observability::StringField("config", *config_path),
                                           cms::observability::IntField("port", server.BoundPort())});

    int signal_number = 0;
    sigwait(&shutdown_signals, &signal_number);
    CMS_LOG_INFO("Shutting down admin front end", {cms::observability::IntField("signal", signal_number)});

    // Drain in-flight requests while the dispatcher can still finish them.
    server.Stop();
    app.dispatcher->Stop();
  } catch (const std::exception& e) {
    CMS_LOG_ERROR("Fatal error", {cms::observability::StringField("error", e.what())});
    cms::observability::ShutdownLogging();
    return 2;
  }

  cms::observability::ShutdownLogging();
  return 0;
}
