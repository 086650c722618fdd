#include "dirsync/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace dirsync {

namespace {

int parseInt(const std::string &name, const std::string &value) {
  try {
    std::size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used == value.size())
      return parsed;
  } catch (const std::exception &) {
  }
  throw std::invalid_argument("Invalid value for " + name + ": " + value);
}

json loadJsonFile(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::invalid_argument("Cannot open config file: " + path);
  auto data = json::parse(in, nullptr, false);
  if (data.is_discarded() || !data.is_object())
    throw std::invalid_argument("Malformed config file: " + path);
  return data;
}

template <typename T>
void readJson(const json &data, const char *key, T &target) {
  if (!data.contains(key))
    return;
  try {
    target = data.at(key).get<T>();
  } catch (const json::exception &e) {
    throw std::invalid_argument(std::string("Invalid config value for ") +
                                key + ": " + e.what());
  }
}

void applyWatcherJson(const json &data, DirectoryWatcherConfig &watcher) {
  readJson(data, "ignoreHidden", watcher.ignoreHidden);
  readJson(data, "debounceDelayMs", watcher.debounceDelayMs);
  std::vector<std::string> list;
  if (data.contains("fileExtensions")) {
    readJson(data, "fileExtensions", list);
    watcher.fileExtensionFilter = {list.begin(), list.end()};
  }
  if (data.contains("excludeDirs")) {
    list.clear();
    readJson(data, "excludeDirs", list);
    watcher.excludedDirNames = {list.begin(), list.end()};
  }
}

} // namespace

Environment processEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    const char *value = std::getenv(name.c_str());
    if (!value || !*value)
      return std::nullopt;
    return std::string(value);
  };
}

ClientConfig loadClientConfig(const std::vector<std::string> &args,
                              const Environment &env) {
  ClientConfig config;
  if (auto home = env("HOME"))
    config.watchPath = *home + "/Documents/dirsync/target";
  config.username = env("USER").value_or("unknown-user");

  if (auto file = env("DIRSYNC_CONFIG")) {
    json data = loadJsonFile(*file);
    readJson(data, "watchPath", config.watchPath);
    readJson(data, "serverUrl", config.serverUrl);
    readJson(data, "username", config.username);
    readJson(data, "deviceId", config.deviceId);
    readJson(data, "timeoutMs", config.timeoutMs);
    readJson(data, "retryAttempts", config.retryAttempts);
    readJson(data, "retryDelayMs", config.retryDelayMs);
    readJson(data, "uploadWorkers", config.uploadWorkers);
    readJson(data, "logDir", config.logDir);
    readJson(data, "verbose", config.verbose);
    if (data.contains("watcher") && data["watcher"].is_object())
      applyWatcherJson(data["watcher"], config.watcher);
  }

  if (auto v = env("DIRSYNC_WATCH_PATH"))
    config.watchPath = *v;
  if (auto v = env("DIRSYNC_SERVER_URL"))
    config.serverUrl = *v;
  if (auto v = env("DIRSYNC_USERNAME"))
    config.username = *v;
  if (auto v = env("DIRSYNC_DEVICE_ID"))
    config.deviceId = *v;
  if (auto v = env("DIRSYNC_LOG_DIR"))
    config.logDir = *v;
  if (auto v = env("DIRSYNC_DEBOUNCE_MS"))
    config.watcher.debounceDelayMs = parseInt("DIRSYNC_DEBOUNCE_MS", *v);

  if (args.size() > 0)
    config.watchPath = args[0];
  if (args.size() > 1)
    config.serverUrl = args[1];

  if (config.watchPath.empty())
    throw std::invalid_argument("No watch path given");
  if (config.timeoutMs <= 0 || config.retryAttempts < 0 ||
      config.retryDelayMs < 0 || config.watcher.debounceDelayMs < 0)
    throw std::invalid_argument("Timeouts, retries and delays must not be negative");
  return config;
}

ServerConfig loadServerConfig(const std::vector<std::string> &args,
                              const Environment &env) {
  ServerConfig config;

  if (auto file = env("DIRSYNC_SERVER_CONFIG")) {
    json data = loadJsonFile(*file);
    readJson(data, "host", config.host);
    readJson(data, "port", config.port);
    readJson(data, "uploadDir", config.uploadDir);
    readJson(data, "databasePath", config.databasePath);
    readJson(data, "logDir", config.logDir);
    readJson(data, "verbose", config.verbose);
  }

  if (auto v = env("PORT"))
    config.port = parseInt("PORT", *v);
  if (auto v = env("DIRSYNC_HOST"))
    config.host = *v;
  if (auto v = env("DIRSYNC_UPLOAD_DIR"))
    config.uploadDir = *v;
  if (auto v = env("DIRSYNC_DB_PATH"))
    config.databasePath = *v;
  if (auto v = env("DIRSYNC_LOG_DIR"))
    config.logDir = *v;

  if (args.size() > 0)
    config.port = parseInt("port", args[0]);

  if (config.port <= 0 || config.port > 65535)
    throw std::invalid_argument("Port out of range: " +
                                std::to_string(config.port));
  return config;
}

} // namespace dirsync
