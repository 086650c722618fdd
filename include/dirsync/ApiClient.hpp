#pragma once

#include "dirsync/Logger.hpp"
#include "dirsync/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace dirsync {

/**
 * Error raised by every failed ApiClient call. statusCode is empty when no
 * response arrived at all (connection refused, timeout).
 */
class ServerApiError : public std::runtime_error {
public:
  ServerApiError(const std::string &message,
                 std::optional<int> statusCode = std::nullopt,
                 std::string responseBody = "");

  const std::optional<int> &statusCode() const { return m_statusCode; }
  const std::string &responseBody() const { return m_responseBody; }
  bool isNetworkError() const { return !m_statusCode.has_value(); }

private:
  std::optional<int> m_statusCode;
  std::string m_responseBody;
};

struct ApiClientConfig {
  std::string baseUrl;
  int timeoutMs = 30000;
  int retryAttempts = 3;
  int retryDelayMs = 1000;
};

struct ResumableUploadMetadata {
  std::string username;
  std::string deviceId;
  std::string fileName;
  std::string checksum;
  std::string lastModified; // now, if empty
};

/**
 * ApiClient handles communication with the upload server.
 * Uses cpp-httplib for networking and nlohmann/json for serialization.
 *
 * Only 5xx responses and missing responses are retried, with a linear
 * backoff of retryDelayMs * attempt. 4xx responses are protocol signals and
 * are returned (check) or thrown (everything else) immediately.
 */
class ApiClient {
public:
  using ProgressCallback =
      std::function<void(std::int64_t bytesUploaded, std::int64_t totalBytes)>;

  ApiClient(ApiClientConfig config, Logger &logger);
  ~ApiClient();

  bool ping();

  // A 409 (already complete) comes back as a response with isComplete=true.
  UploadCheckResponse checkUpload(const UploadCheckRequest &request);
  UploadResponse uploadFile(const UploadRequest &request);
  DeleteResponse deleteFile(const DeleteRequest &request);

  // Check, then a single upload call: from the server's offset when it has a
  // partial copy, from byte 0 otherwise. A 416 is thrown, not retried.
  UploadResponse uploadFileResumable(const std::string &content,
                                     const ResumableUploadMetadata &metadata,
                                     const ProgressCallback &onProgress = {});

  const ApiClientConfig &config() const { return m_config; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  ApiClientConfig m_config;
  Logger &m_logger;
};

} // namespace dirsync
