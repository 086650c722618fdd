#pragma once
#include "dirsync/ApiClient.hpp"
#include "dirsync/Logger.hpp"
#include "dirsync/types.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace dirsync {

/**
 * UploadCoordinator turns watcher events into server calls on its own
 * worker threads, so a slow upload never holds up change detection.
 * Events for one path run in order and one at a time. At most one event per
 * path waits in the queue; a newer one replaces it.
 */
class UploadCoordinator {
public:
  UploadCoordinator(ApiClient &client, Logger &logger, std::string username,
                    std::string deviceId, std::size_t workerCount = 2);
  ~UploadCoordinator();

  void start();
  // Waits for in-flight work, drops whatever is still queued.
  void stop();

  void submit(FileEvent event);
  void waitIdle();

  // Synchronous handling of one event. Returns false if it was abandoned.
  bool process(const FileEvent &event);

  void setProgressCallback(ApiClient::ProgressCallback callback);

private:
  bool handleUpsert(const FileEvent &event);
  bool handleDelete(const FileEvent &event);
  bool restartFromScratch(const FileEvent &event);
  void workerLoop();

  ApiClient &m_client;
  Logger &m_logger;
  std::string m_username;
  std::string m_deviceId;
  std::size_t m_workerCount;
  ApiClient::ProgressCallback m_onProgress;

  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idleCv;
  std::deque<FileEvent> m_queue;
  std::set<std::string> m_inFlight;
  bool m_running = false;
  std::vector<std::thread> m_workers;
};

} // namespace dirsync
