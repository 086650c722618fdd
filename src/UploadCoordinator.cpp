#include "dirsync/UploadCoordinator.hpp"
#include <exception>

namespace dirsync {

UploadCoordinator::UploadCoordinator(ApiClient &client, Logger &logger,
                                     std::string username,
                                     std::string deviceId,
                                     std::size_t workerCount)
    : m_client(client), m_logger(logger), m_username(std::move(username)),
      m_deviceId(std::move(deviceId)),
      m_workerCount(workerCount == 0 ? 1 : workerCount) {}

UploadCoordinator::~UploadCoordinator() { stop(); }

void UploadCoordinator::start() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_running)
    return;
  m_running = true;
  for (std::size_t i = 0; i < m_workerCount; ++i)
    m_workers.emplace_back(&UploadCoordinator::workerLoop, this);
}

void UploadCoordinator::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running)
      return;
    m_running = false;
    if (!m_queue.empty())
      m_logger.warn("Coordinator", "Dropping " + std::to_string(m_queue.size()) +
                                       " queued events on shutdown");
    m_queue.clear();
  }
  m_cv.notify_all();
  for (auto &worker : m_workers) {
    if (worker.joinable())
      worker.join();
  }
  m_workers.clear();
  m_idleCv.notify_all();
}

void UploadCoordinator::submit(FileEvent event) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
      m_logger.warn("Coordinator", "Not running, ignoring event for " +
                                       event.relativePath);
      return;
    }
    // a newer event for a queued path replaces the older one in place
    for (auto &queued : m_queue) {
      if (queued.relativePath == event.relativePath) {
        m_logger.debug("Coordinator", "Replacing queued " +
                                          std::string(toString(queued.kind)) +
                                          " for " + event.relativePath);
        queued = std::move(event);
        return;
      }
    }
    m_queue.push_back(std::move(event));
  }
  m_cv.notify_one();
}

void UploadCoordinator::waitIdle() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idleCv.wait(lock, [this] {
    return (m_queue.empty() && m_inFlight.empty()) || !m_running;
  });
}

void UploadCoordinator::setProgressCallback(
    ApiClient::ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_onProgress = std::move(callback);
}

void UploadCoordinator::workerLoop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (true) {
    // first queued event whose path is not being handled by another worker
    auto next = m_queue.end();
    std::set<std::string> blocked = m_inFlight;
    for (auto it = m_queue.begin(); it != m_queue.end(); ++it) {
      if (!blocked.count(it->relativePath)) {
        next = it;
        break;
      }
      // keep later events of a busy path behind the earlier ones
      blocked.insert(it->relativePath);
    }

    if (next == m_queue.end()) {
      if (!m_running)
        return;
      m_cv.wait(lock);
      continue;
    }

    FileEvent event = std::move(*next);
    m_queue.erase(next);
    m_inFlight.insert(event.relativePath);

    lock.unlock();
    process(event);
    lock.lock();

    m_inFlight.erase(event.relativePath);
    m_cv.notify_all();
    if (m_queue.empty() && m_inFlight.empty())
      m_idleCv.notify_all();
  }
}

bool UploadCoordinator::process(const FileEvent &event) {
  try {
    switch (event.kind) {
    case FileEventKind::Insert:
    case FileEventKind::Update:
      return handleUpsert(event);
    case FileEventKind::Delete:
      return handleDelete(event);
    }
  } catch (const ServerApiError &e) {
    m_logger.error("Coordinator",
                   std::string(toString(event.kind)) + " " +
                       event.relativePath + " failed" +
                       (e.statusCode() ? " (status " +
                                             std::to_string(*e.statusCode()) +
                                             ")"
                                       : "") +
                       ": " + e.what());
  } catch (const std::exception &e) {
    m_logger.error("Coordinator", std::string(toString(event.kind)) + " " +
                                      event.relativePath + " failed: " +
                                      e.what());
  }
  return false;
}

bool UploadCoordinator::handleUpsert(const FileEvent &event) {
  if (!event.content || !event.checksum) {
    m_logger.warn("Coordinator", "No content for " + event.relativePath +
                                     ", skipping upload");
    return false;
  }

  ResumableUploadMetadata meta;
  meta.username = m_username;
  meta.deviceId = m_deviceId;
  meta.fileName = event.relativePath;
  meta.checksum = *event.checksum;
  meta.lastModified = event.lastModified.value_or("");

  ApiClient::ProgressCallback onProgress;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    onProgress = m_onProgress;
  }

  UploadResponse response;
  try {
    response = m_client.uploadFileResumable(*event.content, meta, onProgress);
  } catch (const ServerApiError &e) {
    if (e.statusCode() != 416)
      throw;
    m_logger.warn("Coordinator", "Resume rejected for " + event.relativePath +
                                     " (" + e.what() +
                                     "), restarting from byte 0");
    return restartFromScratch(event);
  }

  m_logger.info("Coordinator", "Uploaded " + event.relativePath + " (" +
                                   std::to_string(response.bytesUploaded) +
                                   "/" + std::to_string(event.content->size()) +
                                   " bytes, complete=" +
                                   (response.isComplete ? "true" : "false") +
                                   ")");
  return response.success;
}

bool UploadCoordinator::restartFromScratch(const FileEvent &event) {
  UploadRequest request;
  request.username = m_username;
  request.deviceId = m_deviceId;
  request.fileName = event.relativePath;
  request.fileSize = static_cast<std::int64_t>(event.content->size());
  request.checksum = *event.checksum;
  request.lastModified = event.lastModified.value_or("");
  request.data = *event.content;

  UploadResponse response = m_client.uploadFile(request);
  m_logger.info("Coordinator", "Re-uploaded " + event.relativePath + " (" +
                                   std::to_string(response.bytesUploaded) +
                                   " bytes)");
  return response.success;
}

bool UploadCoordinator::handleDelete(const FileEvent &event) {
  DeleteRequest request;
  request.username = m_username;
  request.deviceId = m_deviceId;
  request.fileName = event.relativePath;

  DeleteResponse response = m_client.deleteFile(request);
  m_logger.info("Coordinator", "Deleted " + event.relativePath + " on server" +
                                   (response.message ? ": " + *response.message
                                                     : ""));
  return response.success;
}

} // namespace dirsync
