#include "dirsync/UploadStore.hpp"
#include "dirsync/Checksum.hpp"
#include "dirsync/UuidUtils.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>
#include <sstream>

using namespace sqlite_orm;
namespace fs = std::filesystem;

namespace dirsync {

// Helper to deduce the storage type.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<UploadSession>(
          "UploadSession", make_column("deviceId", &UploadSession::deviceId),
          make_column("checksum", &UploadSession::checksum),
          make_column("uploadId", &UploadSession::uploadId, unique()),
          make_column("username", &UploadSession::username),
          make_column("fileName", &UploadSession::fileName),
          make_column("declaredSize", &UploadSession::declaredSize),
          make_column("bytesPersisted", &UploadSession::bytesPersisted),
          make_column("isComplete", &UploadSession::isComplete),
          make_column("lastModified", &UploadSession::lastModified),
          make_column("createdAt", &UploadSession::createdAt),
          primary_key(&UploadSession::deviceId, &UploadSession::checksum)));
}

using Storage = decltype(create_storage_impl(""));

namespace {

std::string isoNow() {
  std::time_t t =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

// Keeps a client supplied name usable as a single path component.
std::string sanitizeComponent(const std::string &value) {
  std::string out;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '@' ||
        c == ':')
      out += static_cast<char>(c);
    else
      out += '_';
  }
  if (out.empty() || out == "." || out == "..")
    return "_";
  return out;
}

std::string sessionKey(const std::string &deviceId,
                       const std::string &checksum) {
  return deviceId + '\n' + checksum;
}

} // namespace

struct UploadStore::Impl {
  Storage storage;
  std::mutex dbMtx;
  std::mutex locksMtx;
  std::map<std::string, std::shared_ptr<std::mutex>> sessionLocks;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}

  // Holds one session's mutex. The map entry goes away with its last user.
  class SessionGuard {
  public:
    SessionGuard(Impl &impl, const std::string &deviceId,
                 const std::string &checksum)
        : m_impl(impl), m_key(sessionKey(deviceId, checksum)) {
      {
        std::lock_guard<std::mutex> lock(m_impl.locksMtx);
        auto &slot = m_impl.sessionLocks[m_key];
        if (!slot)
          slot = std::make_shared<std::mutex>();
        m_mutex = slot;
      }
      m_mutex->lock();
    }

    ~SessionGuard() {
      m_mutex->unlock();
      std::lock_guard<std::mutex> lock(m_impl.locksMtx);
      m_mutex.reset();
      auto it = m_impl.sessionLocks.find(m_key);
      if (it != m_impl.sessionLocks.end() && it->second.use_count() == 1)
        m_impl.sessionLocks.erase(it);
    }

    SessionGuard(const SessionGuard &) = delete;
    SessionGuard &operator=(const SessionGuard &) = delete;

  private:
    Impl &m_impl;
    std::string m_key;
    std::shared_ptr<std::mutex> m_mutex;
  };
};

UploadStore::UploadStore(const std::string &dbPath,
                         const std::string &uploadDir, Logger &logger)
    : m_dbPath(dbPath), m_uploadDir(uploadDir), m_logger(logger) {
  fs::path parent = fs::path(dbPath).parent_path();
  if (!parent.empty())
    fs::create_directories(parent);
  fs::create_directories(m_uploadDir);
  m_impl = std::make_unique<Impl>(dbPath);
}

UploadStore::~UploadStore() = default;

void UploadStore::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  m_logger.info("Store", "Synchronizing schema via sqlite_orm: " + m_dbPath);
  m_impl->storage.sync_schema();
}

std::size_t UploadStore::sessionLockCount() const {
  std::lock_guard<std::mutex> lock(m_impl->locksMtx);
  return m_impl->sessionLocks.size();
}

std::optional<UploadSession> UploadStore::getSession(const std::string &deviceId,
                                                     const std::string &checksum) {
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  auto row = m_impl->storage.get_pointer<UploadSession>(deviceId, checksum);
  if (!row)
    return std::nullopt;
  return *row;
}

std::vector<UploadSession> UploadStore::getAllSessions() {
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  return m_impl->storage.get_all<UploadSession>();
}

std::vector<UploadSession>
UploadStore::findByFileName(const std::string &deviceId,
                            const std::string &fileName) {
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  return m_impl->storage.get_all<UploadSession>(
      where(c(&UploadSession::deviceId) == deviceId and
            c(&UploadSession::fileName) == fileName));
}

void UploadStore::save(const UploadSession &session) {
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  m_impl->storage.replace(session);
}

fs::path UploadStore::bytesPath(const UploadSession &session) const {
  return m_uploadDir / sanitizeComponent(session.username) /
         sanitizeComponent(session.deviceId) / session.uploadId;
}

// Caller holds the session lock.
void UploadStore::discard(const UploadSession &session) {
  std::error_code ec;
  fs::remove(bytesPath(session), ec);
  if (ec)
    m_logger.error("Store", "Failed to remove bytes of " + session.fileName +
                                ": " + ec.message());
  std::lock_guard<std::mutex> lock(m_impl->dbMtx);
  m_impl->storage.remove<UploadSession>(session.deviceId, session.checksum);
}

UploadCheckResponse UploadStore::check(const UploadCheckRequest &request) {
  UploadCheckResponse response;
  {
    Impl::SessionGuard guard(*m_impl, request.deviceId, request.checksum);

    auto session = getSession(request.deviceId, request.checksum);
    if (session) {
      if (session->declaredSize != request.fileSize) {
        m_logger.info("Store", "Size mismatch for " + request.fileName +
                                   ", upload will restart");
        discard(*session);
        response.shouldRestart = true;
        return response;
      }

      response.uploadId = session->uploadId;
      if (session->isComplete) {
        response.exists = true;
        response.uploadedSize = session->declaredSize;
        response.isComplete = true;
        return response;
      }

      fs::path path = bytesPath(*session);
      std::error_code ec;
      auto onDisk = fs::file_size(path, ec);
      if (ec || static_cast<std::int64_t>(onDisk) != session->bytesPersisted) {
        discard(*session);
        throw UploadStoreError("Partial upload of " + session->fileName +
                               " does not match its metadata (" +
                               std::to_string(session->bytesPersisted) +
                               " bytes recorded)");
      }
      response.exists = true;
      response.uploadedSize = session->bytesPersisted;
      return response;
    }
  }

  // Same slot, different content: the old partial bytes are useless now.
  for (const auto &candidate :
       findByFileName(request.deviceId, request.fileName)) {
    if (candidate.isComplete || candidate.checksum == request.checksum)
      continue;
    Impl::SessionGuard guard(*m_impl, candidate.deviceId, candidate.checksum);
    // a concurrent chunk may have completed, renamed or removed it meanwhile
    auto stale = getSession(candidate.deviceId, candidate.checksum);
    if (!stale || stale->isComplete || stale->fileName != request.fileName)
      continue;
    m_logger.info("Store", "Content of " + request.fileName +
                               " changed, dropping partial upload " +
                               stale->uploadId);
    discard(*stale);
    response.shouldRestart = true;
  }
  return response;
}

ChunkResult UploadStore::writeChunk(const ChunkRequest &request) {
  Impl::SessionGuard guard(*m_impl, request.deviceId, request.checksum);

  ChunkResult result;
  auto existing = getSession(request.deviceId, request.checksum);
  UploadSession session;
  fs::path path;

  if (request.startByte > 0) {
    if (!existing) {
      result.status = UploadStatus::RangeInvalid;
      result.message = "Upload file not found for resume";
      return result;
    }
    session = *existing;
    path = bytesPath(session);

    std::error_code ec;
    auto onDisk = fs::file_size(path, ec);
    if (ec) {
      discard(session);
      result.status = UploadStatus::RangeInvalid;
      result.message = "Upload file not found for resume";
      return result;
    }
    if (static_cast<std::int64_t>(onDisk) != session.bytesPersisted) {
      discard(session);
      throw UploadStoreError("Partial upload of " + session.fileName +
                             " does not match its metadata");
    }
    if (request.startByte != session.bytesPersisted) {
      m_logger.error("Store", "Range mismatch: expected " +
                                  std::to_string(request.startByte) +
                                  ", actual " +
                                  std::to_string(session.bytesPersisted) +
                                  " for " + request.fileName);
      result.status = UploadStatus::RangeInvalid;
      result.message = "Invalid range for resumable upload";
      result.actualSize = session.bytesPersisted;
      result.uploadId = session.uploadId;
      result.bytesPersisted = session.bytesPersisted;
      return result;
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    out.write(request.payload.data(),
              static_cast<std::streamsize>(request.payload.size()));
    out.close();
    if (!out) {
      discard(session);
      throw UploadStoreError("Failed to append to " + path.string());
    }
  } else {
    if (existing) {
      session = *existing;
    } else {
      session.deviceId = request.deviceId;
      session.checksum = request.checksum;
      session.uploadId = UuidUtils::generate();
      session.username = request.username;
      session.createdAt = isoNow();
    }
    session.fileName = request.fileName;
    session.declaredSize = request.declaredSize;
    session.isComplete = false;
    path = bytesPath(session);

    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(request.payload.data(),
              static_cast<std::streamsize>(request.payload.size()));
    out.close();
    if (!out) {
      discard(session);
      throw UploadStoreError("Failed to write " + path.string());
    }
  }

  session.lastModified = request.lastModified;
  session.bytesPersisted = static_cast<std::int64_t>(fs::file_size(path));

  if (session.bytesPersisted >= session.declaredSize) {
    auto actual = sha256File(path);
    if (!actual || *actual != session.checksum) {
      m_logger.error("Store", "Checksum verification failed for file: " +
                                  session.fileName + " for user " +
                                  session.username);
      discard(session);
      result.status = UploadStatus::ChecksumMismatch;
      result.message = "Checksum verification failed";
      return result;
    }
    session.isComplete = true;
    m_logger.info("Store", "File upload completed successfully: " +
                               session.fileName + " for user " +
                               session.username);
  }

  save(session);

  result.uploadId = session.uploadId;
  result.bytesPersisted = session.bytesPersisted;
  result.isComplete = session.isComplete;
  return result;
}

std::size_t UploadStore::remove(const DeleteRequest &request) {
  std::vector<UploadSession> targets;
  if (request.checksum) {
    if (auto session = getSession(request.deviceId, *request.checksum))
      targets.push_back(*session);
  } else {
    targets = findByFileName(request.deviceId, request.fileName);
  }

  std::size_t removed = 0;
  for (const auto &target : targets) {
    Impl::SessionGuard guard(*m_impl, target.deviceId, target.checksum);
    // another request may have replaced or removed it meanwhile
    auto current = getSession(target.deviceId, target.checksum);
    if (!current)
      continue;
    discard(*current);
    ++removed;
  }
  return removed;
}

} // namespace dirsync
