#pragma once

#include "dirsync/Logger.hpp"
#include "dirsync/WatchBackend.hpp"
#include "dirsync/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dirsync {

/**
 * DirectoryWatcher monitors a directory tree and reports settled changes as
 * INSERT, UPDATE or DELETE events.
 *
 * Raw notifications only arm a per-path debounce timer. When the timer fires
 * the path is re-stat'ed and compared against the last known snapshot; the
 * kind reported by the OS is never trusted. Events are delivered one at a
 * time from a single worker thread.
 */
class DirectoryWatcher {
public:
  using Callback = std::function<void(const FileEvent &event)>;

  // Throws std::invalid_argument if path is missing or not a directory.
  // Without a backend an efsw backend is created.
  DirectoryWatcher(const std::string &path, Callback callback,
                   DirectoryWatcherConfig config, Logger &logger,
                   std::unique_ptr<WatchBackend> backend = nullptr);
  ~DirectoryWatcher();

  DirectoryWatcher(const DirectoryWatcher &) = delete;
  DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

  void start();
  void stop();
  bool isActive() const;
  const std::string &getWatchPath() const;

  // Relative paths (to the watch root) of all included files below
  // rootOverride, or below the watch root.
  std::vector<std::string>
  listAllFiles(const std::optional<std::string> &rootOverride = std::nullopt);

  // Relative paths the watcher currently believes exist.
  std::vector<std::string> trackedFiles() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_path;
};

} // namespace dirsync
