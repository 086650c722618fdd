#pragma once

#include "dirsync/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dirsync {

struct ClientConfig {
  std::string watchPath;
  std::string serverUrl = "http://localhost:3000";
  std::string username;
  std::string deviceId; // detected when empty
  int timeoutMs = 5000;
  int retryAttempts = 1;
  int retryDelayMs = 100;
  std::size_t uploadWorkers = 2;
  std::string logDir;
  bool verbose = false;
  DirectoryWatcherConfig watcher;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 3000;
  std::string uploadDir = "./uploads";
  std::string databasePath = "./metadata/uploads.db";
  std::string logDir;
  bool verbose = false;
};

using Environment =
    std::function<std::optional<std::string>(const std::string &name)>;

Environment processEnvironment();

// Precedence: arguments, environment, JSON file named by DIRSYNC_CONFIG,
// defaults. Throws std::invalid_argument on malformed values.
ClientConfig loadClientConfig(const std::vector<std::string> &args,
                              const Environment &env);

// Precedence: arguments (port), environment, JSON file named by
// DIRSYNC_SERVER_CONFIG, defaults.
ServerConfig loadServerConfig(const std::vector<std::string> &args,
                              const Environment &env);

} // namespace dirsync
