#include "dirsync/WatchBackend.hpp"
#include <efsw/efsw.hpp>
#include <mutex>
#include <vector>

namespace dirsync {

struct EfswWatchBackend::Impl : public efsw::FileWatchListener {
  explicit Impl(Logger &log) : logger(log) {}

  Logger &logger;
  efsw::FileWatcher watcher;
  std::vector<efsw::WatchID> watchIds;
  bool watching = false;

  std::mutex sinkMtx;
  WatchBackend::Sink sink;
  bool enabled = false;

  void notify(const std::string &dir, const std::string &filename,
              const std::string &oldFilename = std::string()) {
    std::lock_guard<std::mutex> lock(sinkMtx);
    if (enabled && sink)
      sink(dir, filename, oldFilename);
  }

  // Implement FileWatchListener
  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename) override {
    switch (action) {
    case efsw::Actions::Add:
    case efsw::Actions::Delete:
    case efsw::Actions::Modified:
      notify(dir, filename);
      break;
    case efsw::Actions::Moved:
      notify(dir, filename, oldFilename);
      break;
    default:
      break;
    }
  }
};

EfswWatchBackend::EfswWatchBackend(Logger &logger)
    : m_impl(std::make_unique<Impl>(logger)) {}

EfswWatchBackend::~EfswWatchBackend() { removeAll(); }

void EfswWatchBackend::setSink(Sink sink) {
  std::lock_guard<std::mutex> lock(m_impl->sinkMtx);
  m_impl->sink = std::move(sink);
}

bool EfswWatchBackend::addWatch(const std::filesystem::path &directory) {
  efsw::WatchID id =
      m_impl->watcher.addWatch(directory.string(), m_impl.get(), true);
  if (id < 0) {
    m_impl->logger.error("Watcher", "Error adding watch on " +
                                        directory.string() + ": " +
                                        efsw::Errors::Log::getLastErrorLog());
    return false;
  }
  m_impl->watchIds.push_back(id);

  {
    std::lock_guard<std::mutex> lock(m_impl->sinkMtx);
    m_impl->enabled = true;
  }
  if (!m_impl->watching) {
    m_impl->watcher.watch();
    m_impl->watching = true;
  }
  return true;
}

void EfswWatchBackend::removeAll() {
  {
    // waits for a notification that is being delivered right now
    std::lock_guard<std::mutex> lock(m_impl->sinkMtx);
    m_impl->enabled = false;
  }
  for (efsw::WatchID id : m_impl->watchIds)
    m_impl->watcher.removeWatch(id);
  m_impl->watchIds.clear();
}

} // namespace dirsync
