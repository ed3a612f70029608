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

namespace {

namespace obs = settlement::observability;

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--check-config] [--config] <settlement-engine.yaml>\n"
            << "  --check-config  validate the file and exit\n";
}

bool ParseOptions(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) return false;
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  return !options.config_path.empty();
}

void FlushObservability() {
  obs::ShutdownLogging();
  obs::ShutdownMetrics();
  obs::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseOptions(argc, argv, options)) {
    PrintUsage(argv[0]);
    return 1;
  }

  try {
    const auto config = settlement::config::ConfigLoader::LoadFromYaml(options.config_path);
    if (options.check_only) {
      std::cout << options.config_path << ": ok" << std::endl;
      return 0;
    }

    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);
    obs::InitializeLogging(config);

    auto app = settlement::factory::Build(config);

    settlement::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before Start() so an early SIGTERM is not lost
    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    server.Start();
    for (auto& worker : app.background_workers) worker->Start();
    SETTLEMENT_LOG_INFO("settlement engine started", {obs::StringField("bind_address", config.server().bind_address()),
                                                      obs::IntField("background_workers", static_cast<int64_t>(app.background_workers.size()))});

    while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    SETTLEMENT_LOG_INFO("settlement engine stopping");
    // in-flight RPCs drain before workers stop
    server.Stop();
    for (auto& worker : app.background_workers) worker->Stop();
    FlushObservability();
  } catch (const std::exception& e) {
    if (options.check_only) {
      std::cerr << options.config_path << ": " << e.what() << std::endl;
      return 2;
    }
    SETTLEMENT_LOG_ERROR("settlement engine failed", {obs::StringField("error", e.what())});
    FlushObservability();
    return 2;
  }

  return 0;
}
