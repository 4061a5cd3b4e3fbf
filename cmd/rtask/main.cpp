#include <signal.h>

#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/console.hpp"

static volatile std::sig_atomic_t g_running = 1;

static void HandleSignal(int) {
  g_running = 0;
}

// No SA_RESTART: a signal interrupts the blocking read of stdin.
static void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = HandleSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: rtask [config.yaml] OR rtask --config <config.yaml>" << std::endl;
    return 1;
  }

  bool logging_ready = false;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    rtask::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = rtask::config::ConfigLoader::LoadFromYaml(config_path);
    }

    rtask::observability::InitializeLogging(config.logging());
    logging_ready = true;

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = rtask::factory::Build(config);

    InstallSignalHandlers();

    RTASK_LOG_INFO("rtask console started", {rtask::observability::StringField("config", config_path.empty() ? "<defaults>" : config_path)});

    rtask::runtime::Console console(app.service);
    console.Run(std::cin, std::cout, [] { return g_running != 0; });

    RTASK_LOG_INFO("Shutting down rtask");

    app.manager->Shutdown();
    rtask::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    if (!logging_ready) {
      std::cerr << "rtask: " << e.what() << std::endl;
      return 2;
    }
    RTASK_LOG_ERROR("Fatal error", {rtask::observability::StringField("error", e.what())});
    rtask::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
