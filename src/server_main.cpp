#include "dirsync/Config.hpp"
#include "dirsync/Logger.hpp"
#include "dirsync/UploadServer.hpp"
#include "dirsync/UploadStore.hpp"
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

  dirsync::ServerConfig config;
  try {
    config = dirsync::loadServerConfig(
        std::vector<std::string>(argv + 1, argv + argc),
        dirsync::processEnvironment());
  } catch (const std::exception &e) {
    dirsync::Logger bootLogger;
    bootLogger.error("Server", std::string("Invalid configuration: ") + e.what());
    return 1;
  }

  dirsync::Logger logger(config.verbose ? dirsync::LogLevel::Debug
                                        : dirsync::LogLevel::Info,
                         config.logDir);

  try {
    logger.info("Server", "Starting server...");
    dirsync::UploadStore store(config.databasePath, config.uploadDir, logger);
    store.initializeSchema();
    logger.debug("Server", "Directories ensured");

    dirsync::UploadServer server(store, logger);
    std::thread serverThread([&] {
      if (!server.listen(config.host, config.port)) {
        logger.error("Server", "Failed to listen on " + config.host + ":" +
                                   std::to_string(config.port));
        running.store(false);
      }
    });

    while (running.load())
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

    logger.info("Server", "Shutting down...");
    server.stop();
    serverThread.join();
  } catch (const std::exception &e) {
    logger.error("Server", std::string("Failed to start server: ") + e.what());
    return 1;
  }
  return 0;
}
