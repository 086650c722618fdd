#pragma once

#include "dirsync/Logger.hpp"
#include "dirsync/UploadServer.hpp"
#include "dirsync/UploadStore.hpp"
#include "dirsync/UuidUtils.hpp"
#include "dirsync/WatchBackend.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dirsync::test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir()
      : m_path(fs::temp_directory_path() /
               ("dirsync-test-" + UuidUtils::generate())) {
    fs::create_directories(m_path);
    m_path = fs::canonical(m_path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return m_path; }
  fs::path operator/(const std::string &rel) const { return m_path / rel; }

private:
  fs::path m_path;
};

inline void writeFile(const fs::path &p, const std::string &content) {
  fs::create_directories(p.parent_path());
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << content;
}

inline void appendFile(const fs::path &p, const std::string &content) {
  std::ofstream o(p, std::ios::binary | std::ios::app);
  o << content;
}

inline std::string readFile(const fs::path &p) {
  std::ifstream i(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(i)),
                     std::istreambuf_iterator<char>());
}

inline bool waitFor(const std::function<bool()> &condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

// Keeps test output quiet and lets tests look at what was logged.
class CapturingLogger : public Logger {
public:
  CapturingLogger() : Logger(LogLevel::Debug) {}

  std::vector<std::string> lines() const {
    std::lock_guard<std::mutex> lock(m_linesMtx);
    return m_lines;
  }

  bool contains(const std::string &needle) const {
    for (const auto &line : lines()) {
      if (line.find(needle) != std::string::npos)
        return true;
    }
    return false;
  }

protected:
  void write(LogLevel, const std::string &line) override {
    std::lock_guard<std::mutex> lock(m_linesMtx);
    m_lines.push_back(line);
  }

private:
  mutable std::mutex m_linesMtx;
  std::vector<std::string> m_lines;
};

// Backend driven by the test instead of the OS.
class FakeWatchBackend : public WatchBackend {
public:
  struct State {
    std::mutex mtx;
    Sink sink;
    std::vector<fs::path> watched;
    bool recursive = true;
    bool failAdd = false;
    int removeAllCalls = 0;
  };

  explicit FakeWatchBackend(std::shared_ptr<State> state)
      : m_state(std::move(state)) {}

  void setSink(Sink sink) override {
    std::lock_guard<std::mutex> lock(m_state->mtx);
    m_state->sink = std::move(sink);
  }
  bool addWatch(const fs::path &directory) override {
    std::lock_guard<std::mutex> lock(m_state->mtx);
    if (m_state->failAdd)
      return false;
    m_state->watched.push_back(directory);
    return true;
  }
  void removeAll() override {
    std::lock_guard<std::mutex> lock(m_state->mtx);
    m_state->watched.clear();
    ++m_state->removeAllCalls;
  }
  bool isRecursive() const override { return m_state->recursive; }

private:
  std::shared_ptr<State> m_state;
};

// Raw notification for an absolute path, the way the OS would send it.
// A non-empty oldName reports a move within the same directory.
inline void notify(FakeWatchBackend::State &state, const fs::path &absPath,
                   const std::string &oldName = std::string()) {
  WatchBackend::Sink sink;
  {
    std::lock_guard<std::mutex> lock(state.mtx);
    sink = state.sink;
  }
  if (sink)
    sink(absPath.parent_path().string() + "/", absPath.filename().string(),
         oldName);
}

// UploadServer on an ephemeral loopback port, served from a background thread.
class TestServer {
public:
  TestServer(const fs::path &dir, Logger &logger)
      : store((dir / "metadata" / "uploads.db").string(),
              (dir / "uploads").string(), logger),
        server(store, logger) {
    store.initializeSchema();
    port = server.bindToAnyPort("127.0.0.1");
    thread = std::thread([this] { server.listenAfterBind(); });
    server.waitUntilReady();
  }
  ~TestServer() {
    server.stop();
    if (thread.joinable())
      thread.join();
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }

  UploadStore store;
  UploadServer server;
  int port = -1;
  std::thread thread;
};

} // namespace dirsync::test
