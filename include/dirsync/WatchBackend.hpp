#pragma once

#include "dirsync/Logger.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace dirsync {

/**
 * WatchBackend hides the OS notification primitive. It only reports that
 * something happened to (directory, fileName); the watcher decides what.
 * For a move, oldFileName names the source (relative to directory, or
 * absolute); it is empty otherwise.
 */
class WatchBackend {
public:
  using Sink = std::function<void(const std::string &directory,
                                  const std::string &fileName,
                                  const std::string &oldFileName)>;

  virtual ~WatchBackend() = default;

  virtual void setSink(Sink sink) = 0;
  // Returns false if the directory could not be registered.
  virtual bool addWatch(const std::filesystem::path &directory) = 0;
  // Releases every registration before returning.
  virtual void removeAll() = 0;
  // True when one addWatch() covers the whole subtree, including
  // directories created later.
  virtual bool isRecursive() const = 0;
};

/**
 * efsw-backed implementation: one recursive watch per registered root.
 */
class EfswWatchBackend : public WatchBackend {
public:
  explicit EfswWatchBackend(Logger &logger);
  ~EfswWatchBackend() override;

  void setSink(Sink sink) override;
  bool addWatch(const std::filesystem::path &directory) override;
  void removeAll() override;
  bool isRecursive() const override { return true; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace dirsync
