#include "dirsync/ApiClient.hpp"
#include "httplib.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace dirsync {

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

UploadCheckResponse parseCheckResponse(const json &data) {
  UploadCheckResponse result;
  result.exists = data.value("exists", false);
  result.uploadedSize = data.value("uploadedSize", std::int64_t{0});
  result.isComplete = data.value("isComplete", false);
  result.shouldRestart = data.value("shouldRestart", false);
  if (data.contains("uploadId") && data["uploadId"].is_string())
    result.uploadId = data["uploadId"].get<std::string>();
  return result;
}

UploadResponse parseUploadResponse(const json &data) {
  UploadResponse result;
  result.success = data.value("success", false);
  result.uploadId = data.value("uploadId", std::string());
  result.bytesUploaded = data.value("bytesUploaded", std::int64_t{0});
  result.isComplete = data.value("isComplete", false);
  if (data.contains("message") && data["message"].is_string())
    result.message = data["message"].get<std::string>();
  if (data.contains("actualSize") && data["actualSize"].is_number())
    result.actualSize = data["actualSize"].get<std::int64_t>();
  if (data.contains("expectedStartByte") &&
      data["expectedStartByte"].is_number())
    result.expectedStartByte = data["expectedStartByte"].get<std::int64_t>();
  return result;
}

ServerApiError toError(const httplib::Result &res) {
  if (!res) {
    return ServerApiError("Network error: No response from server (" +
                          httplib::to_string(res.error()) + ")");
  }

  std::string message =
      "Request failed with status " + std::to_string(res->status);
  auto body = json::parse(res->body, nullptr, false);
  if (!body.is_discarded() && body.is_object()) {
    if (body.contains("message") && body["message"].is_string())
      message = body["message"].get<std::string>();
    else if (body.contains("error") && body["error"].is_string())
      message = body["error"].get<std::string>();
  }
  return ServerApiError(message, res->status, res->body);
}

json parseBody(const httplib::Result &res) {
  auto data = json::parse(res->body, nullptr, false);
  if (data.is_discarded() || !data.is_object())
    throw ServerApiError("Malformed response body", res->status, res->body);
  return data;
}

} // namespace

ServerApiError::ServerApiError(const std::string &message,
                               std::optional<int> statusCode,
                               std::string responseBody)
    : std::runtime_error(message), m_statusCode(statusCode),
      m_responseBody(std::move(responseBody)) {}

struct ApiClient::Impl {
  httplib::Client client;
  Impl(const ApiClientConfig &config) : client(config.baseUrl) {
    time_t sec = config.timeoutMs / 1000;
    time_t usec = (config.timeoutMs % 1000) * 1000;
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
    client.set_follow_location(true);
  }

  // 5xx and missing responses are retried; the attempt counter lives here,
  // not on the request.
  template <typename Send>
  httplib::Result sendWithRetry(const ApiClientConfig &config, Logger &logger,
                                const std::string &what, Send &&send) {
    for (int attempt = 1;; ++attempt) {
      httplib::Result res = send();
      bool transient = !res || res->status >= 500;
      if (!transient || attempt > config.retryAttempts)
        return res;

      int delayMs = config.retryDelayMs * attempt;
      logger.warn("ApiClient",
                  what + " failed (" +
                      (res ? "status " + std::to_string(res->status)
                           : httplib::to_string(res.error())) +
                      "), retry " + std::to_string(attempt) + "/" +
                      std::to_string(config.retryAttempts) + " in " +
                      std::to_string(delayMs) + "ms");
      std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
  }
};

ApiClient::ApiClient(ApiClientConfig config, Logger &logger)
    : m_impl(std::make_unique<Impl>(config)), m_config(std::move(config)),
      m_logger(logger) {}

ApiClient::~ApiClient() = default;

bool ApiClient::ping() {
  auto res = m_impl->sendWithRetry(m_config, m_logger, "Ping", [&] {
    return m_impl->client.Get("/api/ping");
  });
  if (res && res->status == 200)
    return true;

  m_logger.error("ApiClient", "Ping to " + m_config.baseUrl + " failed: " +
                                  toError(res).what());
  return false;
}

UploadCheckResponse ApiClient::checkUpload(const UploadCheckRequest &request) {
  json body;
  body["username"] = request.username;
  body["deviceId"] = request.deviceId;
  body["fileName"] = request.fileName;
  body["fileSize"] = request.fileSize;
  body["checksum"] = request.checksum;

  auto res = m_impl->sendWithRetry(m_config, m_logger, "Upload check", [&] {
    return m_impl->client.Post("/api/upload/check", body.dump(),
                               "application/json");
  });

  // 409: already uploaded and complete
  if (res && (res->status == 200 || res->status == 409))
    return parseCheckResponse(parseBody(res));

  throw toError(res);
}

UploadResponse ApiClient::uploadFile(const UploadRequest &request) {
  httplib::UploadFormDataItems items = {
      {"username", request.username, "", ""},
      {"deviceId", request.deviceId, "", ""},
      {"fileName", request.fileName, "", ""},
      {"fileSize", std::to_string(request.fileSize), "", ""},
      {"checksum", request.checksum, "", ""},
      {"lastModified", request.lastModified, "", ""}};

  httplib::Headers headers;
  if (request.startByte && *request.startByte > 0) {
    items.push_back({"startByte", std::to_string(*request.startByte), "", ""});
    if (!request.data.empty()) {
      std::int64_t endByte =
          *request.startByte + static_cast<std::int64_t>(request.data.size()) - 1;
      headers.emplace("Content-Range",
                      "bytes " + std::to_string(*request.startByte) + "-" +
                          std::to_string(endByte) + "/" +
                          std::to_string(request.fileSize));
    }
  }
  if (request.uploadId)
    items.push_back({"uploadId", *request.uploadId, "", ""});
  items.push_back(
      {"file", request.data, request.fileName, "application/octet-stream"});

  m_logger.debug("ApiClient", "Uploading " + request.fileName + " bytes " +
                                  std::to_string(request.startByte.value_or(0)) +
                                  "+" + std::to_string(request.data.size()) +
                                  "/" + std::to_string(request.fileSize));

  auto res = m_impl->sendWithRetry(m_config, m_logger, "Upload", [&] {
    return m_impl->client.Post("/api/upload", headers, items);
  });

  if (res && res->status == 200)
    return parseUploadResponse(parseBody(res));

  throw toError(res);
}

DeleteResponse ApiClient::deleteFile(const DeleteRequest &request) {
  json body;
  body["username"] = request.username;
  body["deviceId"] = request.deviceId;
  body["fileName"] = request.fileName;
  if (request.checksum)
    body["checksum"] = *request.checksum;

  auto res = m_impl->sendWithRetry(m_config, m_logger, "Delete", [&] {
    return m_impl->client.Post("/api/delete", body.dump(), "application/json");
  });

  if (res && res->status == 200) {
    auto data = parseBody(res);
    DeleteResponse result;
    result.success = data.value("success", false);
    if (data.contains("message") && data["message"].is_string())
      result.message = data["message"].get<std::string>();
    return result;
  }

  throw toError(res);
}

UploadResponse
ApiClient::uploadFileResumable(const std::string &content,
                               const ResumableUploadMetadata &metadata,
                               const ProgressCallback &onProgress) {
  const auto fileSize = static_cast<std::int64_t>(content.size());

  UploadCheckRequest check;
  check.username = metadata.username;
  check.deviceId = metadata.deviceId;
  check.fileName = metadata.fileName;
  check.fileSize = fileSize;
  check.checksum = metadata.checksum;
  UploadCheckResponse checkResponse = checkUpload(check);

  if (checkResponse.isComplete) {
    UploadResponse done;
    done.success = true;
    done.uploadId = checkResponse.uploadId.value_or("");
    done.bytesUploaded = fileSize;
    done.isComplete = true;
    return done;
  }

  UploadRequest upload;
  upload.username = metadata.username;
  upload.deviceId = metadata.deviceId;
  upload.fileName = metadata.fileName;
  upload.fileSize = fileSize;
  upload.checksum = metadata.checksum;
  upload.lastModified =
      metadata.lastModified.empty() ? isoNow() : metadata.lastModified;

  if (checkResponse.exists && checkResponse.uploadedSize > 0 &&
      checkResponse.uploadedSize < fileSize) {
    const std::int64_t startByte = checkResponse.uploadedSize;
    m_logger.info("ApiClient", "Resuming " + metadata.fileName + " at byte " +
                                   std::to_string(startByte) + "/" +
                                   std::to_string(fileSize));
    upload.data = content.substr(static_cast<std::size_t>(startByte));
    upload.startByte = startByte;
    upload.uploadId = checkResponse.uploadId;
  } else {
    upload.data = content;
  }

  UploadResponse response = uploadFile(upload);
  if (onProgress)
    onProgress(response.bytesUploaded, fileSize);
  return response;
}

} // namespace dirsync
