#include "dirsync/ApiClient.hpp"
#include "dirsync/Config.hpp"
#include "dirsync/DeviceIdentity.hpp"
#include "dirsync/DirectoryWatcher.hpp"
#include "dirsync/Logger.hpp"
#include "dirsync/UploadCoordinator.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> running{true};

static void signalHandler(int) { running.store(false); }

int main(int argc, char **argv) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  dirsync::ClientConfig config;
  try {
    config = dirsync::loadClientConfig(
        std::vector<std::string>(argv + 1, argv + argc),
        dirsync::processEnvironment());
  } catch (const std::exception &e) {
    dirsync::Logger bootLogger;
    bootLogger.error("Main", std::string("Invalid configuration: ") + e.what());
    return 1;
  }

  dirsync::Logger logger(config.verbose ? dirsync::LogLevel::Debug
                                        : dirsync::LogLevel::Info,
                         config.logDir);

  try {
    if (config.deviceId.empty())
      config.deviceId = dirsync::DeviceIdentity(logger).deviceId();

    logger.info("Main", "dirsync client starting");
    logger.info("Main", "Username: " + config.username);
    logger.info("Main", "Device ID: " + config.deviceId);
    logger.info("Main", "Watch Path: " + config.watchPath);
    logger.info("Main", "Server URL: " + config.serverUrl);

    // 1. Server connection
    dirsync::ApiClientConfig apiConfig;
    apiConfig.baseUrl = config.serverUrl;
    apiConfig.timeoutMs = config.timeoutMs;
    apiConfig.retryAttempts = config.retryAttempts;
    apiConfig.retryDelayMs = config.retryDelayMs;
    dirsync::ApiClient apiClient(apiConfig, logger);

    logger.info("Main", "Testing server connectivity...");
    if (apiClient.ping())
      logger.info("Main", "Server is reachable!");
    else
      logger.warn("Main", "Server is not reachable. Will continue anyway...");

    // 2. Uploads run on their own workers
    dirsync::UploadCoordinator coordinator(apiClient, logger, config.username,
                                           config.deviceId,
                                           config.uploadWorkers);
    coordinator.start();

    // 3. Watcher feeds the coordinator directly
    dirsync::DirectoryWatcher watcher(
        config.watchPath,
        [&coordinator, &logger](const dirsync::FileEvent &event) {
          logger.info("Watcher", std::string("Event: ") +
                                     dirsync::toString(event.kind) + " on " +
                                     event.relativePath);
          coordinator.submit(event);
        },
        config.watcher, logger);
    watcher.start();

    auto allFiles = watcher.listAllFiles();
    logger.info("Main", "Found " + std::to_string(allFiles.size()) +
                            " existing files");
    for (const auto &file : allFiles)
      logger.debug("Main", "  - " + file);

    logger.info("Main", "Running. Press Ctrl+C to exit gracefully.");
    // the signal handler only flips the flag
    while (running.load())
      std::this_thread::sleep_for(std::chrono::milliseconds(500));

    logger.info("Main", "Shutting down...");
    watcher.stop();
    coordinator.stop();
    logger.info("Main", "Finished.");
  } catch (const std::exception &e) {
    logger.error("Main", std::string("Error: ") + e.what());
    return 1;
  }

  return 0;
}
