#include "dirsync/DirectoryWatcher.hpp"
#include "dirsync/Checksum.hpp"
#include "dirsync/Debouncer.hpp"
#include "dirsync/FileStateTable.hpp"
#include "dirsync/FileSystemScanner.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dirsync {

struct DirectoryWatcher::Impl {
  Impl(const fs::path &root, Callback cb, DirectoryWatcherConfig config,
       Logger &log, std::unique_ptr<WatchBackend> watchBackend)
      : logger(log), callback(std::move(cb)),
        scanner(root, std::move(config), log),
        backend(std::move(watchBackend)),
        debouncer(std::chrono::milliseconds(scanner.config().debounceDelayMs),
                  [this](const std::string &relPath) {
                    processSettled(relPath);
                  },
                  log) {
    backend->setSink([this](const std::string &dir, const std::string &name,
                            const std::string &oldName) {
      handleRawNotification(dir, name, oldName);
    });
  }

  Logger &logger;
  Callback callback;
  FileSystemScanner scanner;
  FileStateTable states;
  std::unique_ptr<WatchBackend> backend;
  Debouncer debouncer;

  std::mutex lifecycleMtx;
  std::atomic<bool> running{false};

  std::mutex dirsMtx;
  std::set<std::string> knownDirs;
  // new names of tracked directories that were moved within the tree
  std::set<std::string> movedInDirs;

  // Relative path below the root, or empty when outside it or filtered.
  std::string watchedRelativePath(const fs::path &absPath) const {
    std::string relPath = scanner.toRelativePath(absPath.lexically_normal());
    if (relPath.empty() || relPath == "." || relPath.rfind("..", 0) == 0)
      return {};
    if (!scanner.isPathIncluded(relPath))
      return {};
    return relPath;
  }

  void handleRawNotification(const std::string &dir,
                             const std::string &fileName,
                             const std::string &oldFileName) {
    if (!running)
      return;
    std::string relPath = watchedRelativePath(fs::path(dir) / fileName);

    if (!oldFileName.empty()) {
      fs::path oldAbs = fs::path(oldFileName).is_absolute()
                            ? fs::path(oldFileName)
                            : fs::path(dir) / oldFileName;
      std::string oldRel = watchedRelativePath(oldAbs);
      if (!oldRel.empty()) {
        {
          std::lock_guard<std::mutex> lock(dirsMtx);
          if (!relPath.empty() && knownDirs.count(oldRel))
            movedInDirs.insert(relPath);
        }
        debouncer.touch(oldRel);
      }
    }

    if (!relPath.empty())
      debouncer.touch(relPath);
  }

  void processSettled(const std::string &relPath) {
    fs::path absPath = scanner.toAbsolutePath(relPath);
    std::error_code ec;
    fs::file_status st = fs::status(absPath, ec);

    if (fs::is_directory(st)) {
      handleDirectory(relPath, absPath);
      return;
    }

    std::optional<FileSnapshot> current;
    if (fs::exists(st)) {
      if (!fs::is_regular_file(st))
        return;
      if (!scanner.passesExtensionFilter(absPath.filename().string()))
        return;

      FileSnapshot snap;
      snap.exists = true;
      std::error_code sizeEc, timeEc;
      snap.sizeBytes = fs::file_size(absPath, sizeEc);
      snap.modifiedTime = fs::last_write_time(absPath, timeEc);
      // vanished between status() and here: handled like a delete
      if (!sizeEc && !timeEc)
        current = snap;
    }

    if (!current && !states.get(relPath)) {
      handleRemovedDirectory(relPath);
      return;
    }

    classifyAndEmit(relPath, absPath, current);
  }

  void classifyAndEmit(const std::string &relPath, const fs::path &absPath,
                       const std::optional<FileSnapshot> &current) {
    // stopped from inside the callback
    if (!running)
      return;
    auto kind = states.classify(relPath, current);
    if (!kind)
      return;

    FileEvent event;
    event.kind = *kind;
    event.relativePath = relPath;
    event.absolutePath = absPath.string();
    event.timestamp = std::chrono::system_clock::now();
    event.fileName = absPath.filename().string();

    if (*kind != FileEventKind::Delete) {
      std::ifstream in(absPath, std::ios::binary);
      if (!in.is_open()) {
        logger.error("Watcher", "Error reading file buffer/checksum for " +
                                    relPath + ": cannot open file");
        return;
      }
      std::string content((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
      if (in.bad()) {
        logger.error("Watcher", "Error reading file buffer/checksum for " +
                                    relPath + ": read failed");
        return;
      }
      event.checksum = sha256Hex(content);
      event.content = std::move(content);
      event.lastModified = FileSystemScanner::toIsoTimestamp(current->modifiedTime);
    }

    deliver(event);
  }

  void deliver(const FileEvent &event) {
    logger.debug("Watcher", std::string("Event ") + toString(event.kind) +
                                " on " + event.relativePath);
    try {
      callback(event);
    } catch (const std::exception &e) {
      logger.error("Watcher", "Error in callback for " + event.relativePath +
                                  ": " + e.what());
    } catch (...) {
      logger.error("Watcher", "Error in callback for " + event.relativePath +
                                  ": unknown exception");
    }
  }

  // A settled directory that was not known yet: start monitoring it and
  // take its current files as baseline without emitting INSERT. A directory
  // moved here from inside the tree reports its files as INSERT instead,
  // since its old location reported them deleted.
  void handleDirectory(const std::string &relPath, const fs::path &absPath) {
    bool movedIn = false;
    {
      std::lock_guard<std::mutex> lock(dirsMtx);
      movedIn = movedInDirs.erase(relPath) > 0;
      if (!knownDirs.insert(relPath).second)
        return;
    }

    if (!backend->isRecursive()) {
      backend->addWatch(absPath);
      for (const auto &sub : scanner.listDirectories(absPath)) {
        {
          std::lock_guard<std::mutex> lock(dirsMtx);
          knownDirs.insert(sub);
        }
        backend->addWatch(scanner.toAbsolutePath(sub));
      }
    } else {
      std::lock_guard<std::mutex> lock(dirsMtx);
      for (const auto &sub : scanner.listDirectories(absPath))
        knownDirs.insert(sub);
    }

    int baselined = 0;
    for (const auto &[path, snap] : scanner.scan(absPath)) {
      // its own settle will report it
      if (debouncer.isPending(path))
        continue;
      auto prev = states.get(path);
      if (prev && prev->exists)
        continue;
      if (movedIn)
        classifyAndEmit(path, scanner.toAbsolutePath(path), snap);
      else
        states.record(path, snap);
      ++baselined;
    }
    logger.info("Watcher", std::string(movedIn ? "Monitoring moved directory "
                                               : "Monitoring new directory ") +
                               relPath + " (" + std::to_string(baselined) +
                               " existing files)");
  }

  // The path is gone and was never a tracked file: if it was a directory,
  // every file we knew below it is deleted now.
  void handleRemovedDirectory(const std::string &relPath) {
    {
      std::lock_guard<std::mutex> lock(dirsMtx);
      std::string prefix = relPath + "/";
      knownDirs.erase(relPath);
      for (auto it = knownDirs.lower_bound(prefix);
           it != knownDirs.end() && it->compare(0, prefix.size(), prefix) == 0;)
        it = knownDirs.erase(it);
    }

    for (const auto &child : states.existingPathsUnder(relPath)) {
      fs::path childAbs = scanner.toAbsolutePath(child);
      std::error_code ec;
      if (fs::exists(childAbs, ec))
        continue;
      classifyAndEmit(child, childAbs, std::nullopt);
    }
  }
};

const char *toString(FileEventKind kind) {
  switch (kind) {
  case FileEventKind::Insert:
    return "INSERT";
  case FileEventKind::Update:
    return "UPDATE";
  case FileEventKind::Delete:
    return "DELETE";
  }
  return "UNKNOWN";
}

DirectoryWatcher::DirectoryWatcher(const std::string &path, Callback callback,
                                   DirectoryWatcherConfig config,
                                   Logger &logger,
                                   std::unique_ptr<WatchBackend> backend) {
  std::error_code ec;
  if (!fs::exists(path, ec))
    throw std::invalid_argument("Watch path does not exist: " + path);
  if (!fs::is_directory(path, ec))
    throw std::invalid_argument("Watch path is not a directory: " + path);

  fs::path root = fs::canonical(path);
  m_path = root.string();
  if (!backend)
    backend = std::make_unique<EfswWatchBackend>(logger);
  m_impl = std::make_unique<Impl>(root, std::move(callback), std::move(config),
                                  logger, std::move(backend));
}

DirectoryWatcher::~DirectoryWatcher() {
  if (isActive())
    stop();
  // joins a worker whose callback stopped the watcher
  m_impl->debouncer.stop();
}

void DirectoryWatcher::start() {
  std::lock_guard<std::mutex> lock(m_impl->lifecycleMtx);
  if (m_impl->running) {
    m_impl->logger.info("Watcher", "Already watching: " + m_path);
    return;
  }

  // wait for a worker whose callback stopped the watcher
  m_impl->debouncer.stop();

  // Baseline first, so the first notification for an existing file is an UPDATE.
  m_impl->states.recordAll(m_impl->scanner.scan(m_path));
  std::vector<std::string> dirs = m_impl->scanner.listDirectories(m_path);
  {
    std::lock_guard<std::mutex> dirsLock(m_impl->dirsMtx);
    m_impl->knownDirs.clear();
    m_impl->movedInDirs.clear();
    m_impl->knownDirs.insert(dirs.begin(), dirs.end());
  }

  m_impl->running = true;
  m_impl->debouncer.start();

  bool ok = m_impl->backend->addWatch(m_path);
  if (ok && !m_impl->backend->isRecursive()) {
    for (const auto &dir : dirs)
      ok = m_impl->backend->addWatch(m_impl->scanner.toAbsolutePath(dir)) && ok;
  }
  if (!ok) {
    m_impl->backend->removeAll();
    m_impl->debouncer.stop();
    m_impl->running = false;
    m_impl->states.clear();
    m_impl->logger.error("Watcher", "Failed to start watching: " + m_path);
    throw std::runtime_error("Failed to start watching: " + m_path);
  }

  m_impl->logger.info("Watcher", "Started watching: " + m_path + " (" +
                                     std::to_string(m_impl->states.size()) +
                                     " files)");
}

void DirectoryWatcher::stop() {
  std::lock_guard<std::mutex> lock(m_impl->lifecycleMtx);
  if (!m_impl->running) {
    m_impl->logger.info("Watcher", "Not currently watching");
    return;
  }

  m_impl->running = false;
  m_impl->backend->removeAll();
  m_impl->debouncer.stop();
  m_impl->states.clear();
  {
    std::lock_guard<std::mutex> dirsLock(m_impl->dirsMtx);
    m_impl->knownDirs.clear();
    m_impl->movedInDirs.clear();
  }
  m_impl->logger.info("Watcher", "Stopped watching: " + m_path);
}

bool DirectoryWatcher::isActive() const { return m_impl->running; }

const std::string &DirectoryWatcher::getWatchPath() const { return m_path; }

std::vector<std::string>
DirectoryWatcher::listAllFiles(const std::optional<std::string> &rootOverride) {
  fs::path scanRoot = m_path;
  if (rootOverride) {
    std::error_code ec;
    scanRoot = fs::weakly_canonical(*rootOverride, ec);
    if (ec) {
      m_impl->logger.error("Watcher", "Error getting all files: " +
                                          ec.message());
      return {};
    }
    std::string relRoot = m_impl->scanner.toRelativePath(scanRoot);
    if (!relRoot.empty() && relRoot != "." && relRoot.rfind("..", 0) != 0 &&
        !m_impl->scanner.isPathIncluded(relRoot))
      return {};
  }
  return m_impl->scanner.listFiles(scanRoot);
}

std::vector<std::string> DirectoryWatcher::trackedFiles() const {
  return m_impl->states.existingPaths();
}

} // namespace dirsync
