// Main entry point for the collection daemon

#include "scheduler/gc_scheduler.hpp"
#include "service/runtime.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include <iostream>

#include <csignal>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>

using namespace chunkkeeper;

std::atomic<bool> g_daemon_running(true);
std::condition_variable g_shutdown_cv;
std::mutex g_shutdown_mutex;
const int ALERT_INTERVAL_SECONDS = 60;

extern "C" void handle_shutdown_signal(int) {
  // Only async-signal-safe work here; the main loop polls the flag.
  g_daemon_running = false;
}

int main(int argc, char *argv[]) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  std::string configPath = defaultConfigPath();
  std::chrono::seconds tick(30);
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--tick" && i + 1 < argc) {
      tick = std::chrono::seconds(std::atoi(argv[++i]));
      if (tick.count() <= 0) {
        std::cerr << "FATAL: Invalid tick: " << argv[i] << std::endl;
        return 1;
      }
    }
  }

  ChunkKeeperConfig config;
  try {
    config = loadConfig(configPath);
    initLogging(config, "chunkkeeperd");
  } catch (const std::exception &e) {
    std::cerr << "FATAL: configuration failed for chunkkeeperd: " << e.what() << std::endl;
    return 1;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Runtime options: strategy " + config.gc.strategy + ", grace " +
                                std::to_string(config.gc.gracePeriod.count() / 1000) +
                                "s, interval " +
                                std::to_string(config.gc.runInterval.count() / 1000) + "s" +
                                (config.gc.dryRun ? ", dry run" : ""));

  RealClock clock;
  try {
    Runtime rt(config, clock);
    GcScheduler scheduler(rt.service, rt.recovery, rt.store, clock, tick);

    Logger::getInstance().log(LogLevel::INFO, "Main: Starting scheduler.");
    scheduler.start();

    while (g_daemon_running.load()) {
      std::unique_lock<std::mutex> lock(g_shutdown_mutex);
      // Wake once a second so a signal is noticed promptly.
      for (int s = 0; s < ALERT_INTERVAL_SECONDS && g_daemon_running.load(); ++s) {
        g_shutdown_cv.wait_for(lock, std::chrono::seconds(1),
                               [] { return !g_daemon_running.load(); });
      }
      if (!g_daemon_running.load())
        break;
      lock.unlock();
      try {
        rt.service.checkAlerts(clock.now());
      } catch (const ChunkKeeperError &e) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  std::string("Main: alert check failed: ") + e.what());
      }
    }

    Logger::getInstance().log(LogLevel::INFO, "Main: Shutdown signal received, stopping scheduler.");
    scheduler.stop();
  } catch (const ChunkKeeperError &e) {
    Logger::getInstance().log(LogLevel::FATAL, std::string("Main: ") + e.what());
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  Logger::getInstance().log(LogLevel::INFO, "chunkkeeperd shutting down completely.");
  return 0;
}
