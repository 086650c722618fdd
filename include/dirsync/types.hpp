#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dirsync {

/**
 * Last known state of one watched file.
 * A deleted file keeps its entry with exists=false.
 */
struct FileSnapshot {
  bool exists = false;
  std::filesystem::file_time_type modifiedTime{};
  std::uintmax_t sizeBytes = 0;
};

enum class FileEventKind { Insert, Update, Delete };

const char *toString(FileEventKind kind);

/**
 * FileEvent is handed to the watcher callback once per settled change.
 * content, checksum and lastModified are only set for Insert and Update.
 */
struct FileEvent {
  FileEventKind kind;
  std::string relativePath; // generic separators, e.g. "docs/a.txt"
  std::string absolutePath;
  std::chrono::system_clock::time_point timestamp;
  std::string fileName;
  std::optional<std::string> content;
  std::optional<std::string> checksum;
  std::optional<std::string> lastModified; // ISO-8601 UTC
};

struct DirectoryWatcherConfig {
  bool ignoreHidden = true;
  int debounceDelayMs = 100;
  std::set<std::string> fileExtensionFilter; // e.g. ".txt"; empty = all
  std::set<std::string> excludedDirNames{"node_modules", ".git"};
};

// Wire types of the upload protocol

struct UploadCheckRequest {
  std::string username;
  std::string deviceId;
  std::string fileName;
  std::int64_t fileSize = 0;
  std::string checksum;
};

struct UploadCheckResponse {
  bool exists = false;
  std::int64_t uploadedSize = 0;
  bool isComplete = false;
  std::optional<std::string> uploadId;
  bool shouldRestart = false;
};

struct UploadRequest {
  std::string username;
  std::string deviceId;
  std::string fileName;
  std::int64_t fileSize = 0;
  std::string checksum;
  std::string lastModified;
  std::optional<std::int64_t> startByte;
  std::optional<std::string> uploadId;
  std::string data;
};

struct UploadResponse {
  bool success = false;
  std::string uploadId;
  std::int64_t bytesUploaded = 0;
  bool isComplete = false;
  std::optional<std::string> message;
  std::optional<std::int64_t> actualSize;
  std::optional<std::int64_t> expectedStartByte;
};

struct DeleteRequest {
  std::string username;
  std::string deviceId;
  std::string fileName;
  std::optional<std::string> checksum;
};

struct DeleteResponse {
  bool success = false;
  std::optional<std::string> message;
};

/**
 * Server side record of one resumable upload, keyed by (deviceId, checksum).
 * Columns are mapped with sqlite_orm in UploadStore.cpp.
 */
struct UploadSession {
  std::string deviceId;
  std::string checksum;
  std::string uploadId;
  std::string username;
  std::string fileName;
  std::int64_t declaredSize = 0;
  std::int64_t bytesPersisted = 0;
  bool isComplete = false;
  std::string lastModified;
  std::string createdAt;
};

} // namespace dirsync
