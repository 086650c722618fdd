#pragma once
#include "dirsync/Logger.hpp"
#include "dirsync/types.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dirsync {

// Internal failure: I/O error or bytes on disk disagreeing with metadata.
class UploadStoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class UploadStatus { Ok, RangeInvalid, ChecksumMismatch };

struct ChunkRequest {
  std::string username;
  std::string deviceId;
  std::string fileName;
  std::int64_t declaredSize = 0;
  std::string checksum;
  std::string lastModified;
  std::int64_t startByte = 0;
  std::string payload;
};

struct ChunkResult {
  UploadStatus status = UploadStatus::Ok;
  std::string uploadId;
  std::int64_t bytesPersisted = 0;
  bool isComplete = false;
  std::string message;
  std::optional<std::int64_t> actualSize; // RangeInvalid only
};

/**
 * UploadStore persists upload sessions keyed by (deviceId, checksum).
 * Metadata lives in SQLite (sqlite_orm), bytes in one file per session under
 * <uploadDir>/<username>/<deviceId>/<uploadId>.
 *
 * Every operation on a session holds that session's mutex, so chunks for one
 * key never interleave while different keys proceed in parallel.
 */
class UploadStore {
public:
  UploadStore(const std::string &dbPath, const std::string &uploadDir,
              Logger &logger);
  ~UploadStore();

  void initializeSchema();

  // isComplete=true in the answer means "already there" (HTTP 409).
  UploadCheckResponse check(const UploadCheckRequest &request);
  ChunkResult writeChunk(const ChunkRequest &request);
  // Idempotent; returns how many sessions were removed.
  std::size_t remove(const DeleteRequest &request);

  std::optional<UploadSession> getSession(const std::string &deviceId,
                                          const std::string &checksum);
  std::vector<UploadSession> getAllSessions();
  std::filesystem::path bytesPath(const UploadSession &session) const;
  // Per-session mutexes currently held or waited on.
  std::size_t sessionLockCount() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_dbPath;
  std::filesystem::path m_uploadDir;
  Logger &m_logger;

  void discard(const UploadSession &session);
  std::vector<UploadSession> findByFileName(const std::string &deviceId,
                                            const std::string &fileName);
  void save(const UploadSession &session);
};

} // namespace dirsync
