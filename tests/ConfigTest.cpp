#include "TestSupport.hpp"
#include "dirsync/Config.hpp"
#include <gtest/gtest.h>
#include <map>

using namespace dirsync;
using namespace dirsync::test;

namespace {

Environment fakeEnv(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const std::string &name)
             -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end())
      return std::nullopt;
    return it->second;
  };
}

} // namespace

TEST(ConfigTest, ClientDefaultsComeFromHomeAndUser) {
  auto config = loadClientConfig({}, fakeEnv({{"HOME", "/home/dana"}, {"USER", "dana"}}));
  EXPECT_EQ(config.watchPath, "/home/dana/Documents/dirsync/target");
  EXPECT_EQ(config.username, "dana");
  EXPECT_EQ(config.serverUrl, "http://localhost:3000");
  EXPECT_TRUE(config.deviceId.empty());
  EXPECT_EQ(config.watcher.debounceDelayMs, 100);
  EXPECT_TRUE(config.watcher.ignoreHidden);
}

TEST(ConfigTest, ClientWithoutAnyWatchPathIsRejected) {
  EXPECT_THROW(loadClientConfig({}, fakeEnv({})), std::invalid_argument);
}

TEST(ConfigTest, ArgumentsBeatEnvironmentBeatFile) {
  TempDir dir;
  writeFile(dir / "client.json", R"({
    "watchPath": "/from/file",
    "serverUrl": "http://file:1",
    "username": "file-user",
    "retryAttempts": 4,
    "uploadWorkers": 3,
    "watcher": {
      "ignoreHidden": false,
      "debounceDelayMs": 250,
      "fileExtensions": [".txt", ".md"],
      "excludeDirs": ["build"]
    }
  })");

  auto env = fakeEnv({{"HOME", "/home/dana"},
                      {"DIRSYNC_CONFIG", (dir / "client.json").string()},
                      {"DIRSYNC_SERVER_URL", "http://env:2"},
                      {"DIRSYNC_DEBOUNCE_MS", "40"}});

  auto fromFile = loadClientConfig({}, env);
  EXPECT_EQ(fromFile.watchPath, "/from/file");
  EXPECT_EQ(fromFile.serverUrl, "http://env:2");
  EXPECT_EQ(fromFile.username, "file-user");
  EXPECT_EQ(fromFile.retryAttempts, 4);
  EXPECT_EQ(fromFile.uploadWorkers, 3u);
  EXPECT_FALSE(fromFile.watcher.ignoreHidden);
  EXPECT_EQ(fromFile.watcher.debounceDelayMs, 40);
  EXPECT_EQ(fromFile.watcher.fileExtensionFilter,
            (std::set<std::string>{".md", ".txt"}));
  EXPECT_EQ(fromFile.watcher.excludedDirNames, std::set<std::string>{"build"});

  auto fromArgs = loadClientConfig({"/from/args", "http://args:3"}, env);
  EXPECT_EQ(fromArgs.watchPath, "/from/args");
  EXPECT_EQ(fromArgs.serverUrl, "http://args:3");
}

TEST(ConfigTest, MalformedValuesAreRejected) {
  TempDir dir;
  writeFile(dir / "bad.json", R"({"timeoutMs": "soon"})");
  writeFile(dir / "broken.json", "{ not json");

  EXPECT_THROW(loadClientConfig({"/w"}, fakeEnv({{"DIRSYNC_CONFIG", (dir / "bad.json").string()}})),
               std::invalid_argument);
  EXPECT_THROW(loadClientConfig({"/w"}, fakeEnv({{"DIRSYNC_CONFIG", (dir / "broken.json").string()}})),
               std::invalid_argument);
  EXPECT_THROW(loadClientConfig({"/w"}, fakeEnv({{"DIRSYNC_CONFIG", (dir / "missing.json").string()}})),
               std::invalid_argument);
  EXPECT_THROW(loadClientConfig({"/w"}, fakeEnv({{"DIRSYNC_DEBOUNCE_MS", "fast"}})),
               std::invalid_argument);
}

TEST(ConfigTest, ServerDefaults) {
  auto config = loadServerConfig({}, fakeEnv({}));
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 3000);
  EXPECT_EQ(config.uploadDir, "./uploads");
  EXPECT_EQ(config.databasePath, "./metadata/uploads.db");
}

TEST(ConfigTest, ServerPortPrecedenceAndRange) {
  auto env = fakeEnv({{"PORT", "8080"}, {"DIRSYNC_UPLOAD_DIR", "/srv/up"}});
  EXPECT_EQ(loadServerConfig({}, env).port, 8080);
  EXPECT_EQ(loadServerConfig({}, env).uploadDir, "/srv/up");
  EXPECT_EQ(loadServerConfig({"9090"}, env).port, 9090);

  EXPECT_THROW(loadServerConfig({"70000"}, env), std::invalid_argument);
  EXPECT_THROW(loadServerConfig({"0"}, env), std::invalid_argument);
  EXPECT_THROW(loadServerConfig({"http"}, env), std::invalid_argument);
}
