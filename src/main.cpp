#include "app/app_config.hpp"
#include "discovery/errors.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream> // CLI output and early errors before logger initialized
#include <stop_token>
#include <thread>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

extern "C" void HandleSignal(int) { g_shutdown_requested = 1; }
} // namespace

int main(int argc, char *argv[]) {
  using namespace bridgescout;

  app::CommandLine command;
  try {
    command = app::ParseCommandLine(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << app::Usage(argv[0]);
    return 2;
  }

  if (command.action == app::CommandAction::HELP) {
    std::cout << app::Usage(argv[0]);
    return 0;
  }
  if (command.action == app::CommandAction::VERSION) {
    std::cout << GetFullVersionString() << std::endl;
    std::cout << GetCopyrightString() << std::endl;
    return 0;
  }

  const app::AppConfig &config = command.config;

  util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                               config.log_file);
  for (const auto &component : config.debug_components) {
    if (component == "all") {
      util::LogManager::SetLogLevel("trace");
    } else if (!util::LogManager::SetComponentLevel(component, "trace")) {
      LOG_WARN("Unknown log component: {}", component);
    }
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  // Turns a signal into a stop request for the running discovery
  std::stop_source interrupt;
  std::jthread signal_watcher([&interrupt](std::stop_token watcher_stop) {
    while (!watcher_stop.stop_requested()) {
      if (g_shutdown_requested) {
        LOG_APP_INFO("Interrupted, stopping discovery");
        interrupt.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  int status = 0;
  try {
    auto runner = discovery::CreateBridgeDiscovery(config.discovery);
    auto bridges = runner->discover(config.mode, interrupt.get_token());
    std::cout << app::FormatBridges(bridges, config.json_output) << std::flush;

    if (config.verbose) {
      auto stats = runner->last_run();
      LOG_APP_INFO("{} candidate(s), escalated: {}, {} ms", stats.candidates,
                   stats.escalated, stats.elapsed.count());
    }
  } catch (const discovery::DiscoveryFailed &e) {
    LOG_APP_ERROR("Bridge discovery failed: {}", e.what());
    std::cerr << "No bridge found (" << e.what() << ")" << std::endl;
    status = 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    status = 2;
  }

  signal_watcher.request_stop();
  signal_watcher.join();
  util::LogManager::Shutdown();
  return status;
}
