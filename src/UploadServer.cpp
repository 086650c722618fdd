#include "dirsync/UploadServer.hpp"
#include "httplib.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>

using json = nlohmann::json;

namespace dirsync {

namespace {

void sendJson(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

std::optional<std::int64_t> parseInt64(const std::string &value) {
  if (value.empty())
    return std::nullopt;
  try {
    std::size_t used = 0;
    long long parsed = std::stoll(value, &used);
    if (used != value.size() || parsed < 0)
      return std::nullopt;
    return static_cast<std::int64_t>(parsed);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool hasString(const json &body, const char *key) {
  return body.contains(key) && body[key].is_string() &&
         !body[key].get<std::string>().empty();
}

struct ContentRange {
  std::int64_t start;
  std::int64_t end;
  std::int64_t total;
};

std::optional<ContentRange> parseContentRange(const std::string &header) {
  static const std::regex pattern(R"(^bytes (\d+)-(\d+)/(\d+)$)");
  std::smatch m;
  if (!std::regex_match(header, m, pattern))
    return std::nullopt;
  auto start = parseInt64(m[1].str());
  auto end = parseInt64(m[2].str());
  auto total = parseInt64(m[3].str());
  if (!start || !end || !total || *end < *start)
    return std::nullopt;
  return ContentRange{*start, *end, *total};
}

} // namespace

struct UploadServer::Impl {
  httplib::Server server;
};

UploadServer::UploadServer(UploadStore &store, Logger &logger)
    : m_impl(std::make_unique<Impl>()), m_store(store), m_logger(logger) {
  registerRoutes();
}

UploadServer::~UploadServer() { stop(); }

bool UploadServer::listen(const std::string &host, int port) {
  m_logger.info("Server", "Server running on http://" + host + ":" +
                              std::to_string(port));
  return m_impl->server.listen(host, port);
}

int UploadServer::bindToAnyPort(const std::string &host) {
  return m_impl->server.bind_to_any_port(host);
}

bool UploadServer::listenAfterBind() {
  return m_impl->server.listen_after_bind();
}

void UploadServer::waitUntilReady() const { m_impl->server.wait_until_ready(); }

void UploadServer::stop() {
  if (m_impl->server.is_running())
    m_impl->server.stop();
}

bool UploadServer::isRunning() const { return m_impl->server.is_running(); }

void UploadServer::registerRoutes() {
  auto &server = m_impl->server;

  server.set_exception_handler(
      [this](const httplib::Request &req, httplib::Response &res,
             std::exception_ptr ep) {
        std::string what;
        try {
          std::rethrow_exception(ep);
        } catch (const std::exception &e) {
          what = e.what();
        } catch (...) {
          what = "unknown exception";
        }
        m_logger.error("Server", req.method + " " + req.path + " failed: " + what);
        sendJson(res, 500,
                 {{"success", false}, {"message", "Internal server error"}});
      });

  // Health check endpoint
  server.Get("/api/ping",
             [this](const httplib::Request &, httplib::Response &res) {
               m_logger.debug("HealthCheck", "Ping request received");
               res.status = 200;
               res.set_content("", "text/plain");
             });

  server.Post("/api/upload/check", [this](const httplib::Request &req,
                                          httplib::Response &res) {
    auto body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !hasString(body, "username") ||
        !hasString(body, "deviceId") || !hasString(body, "fileName") ||
        !hasString(body, "checksum") || !body.contains("fileSize") ||
        !body["fileSize"].is_number_integer() ||
        body["fileSize"].get<std::int64_t>() < 0) {
      sendJson(res, 400, {{"error", "Missing required fields"}});
      return;
    }

    UploadCheckRequest request;
    request.username = body["username"].get<std::string>();
    request.deviceId = body["deviceId"].get<std::string>();
    request.fileName = body["fileName"].get<std::string>();
    request.fileSize = body["fileSize"].get<std::int64_t>();
    request.checksum = body["checksum"].get<std::string>();
    m_logger.debug("UploadCheckEndpoint",
                   "Upload check request for " + request.fileName +
                       " from user " + request.username);

    try {
      UploadCheckResponse result = m_store.check(request);
      json out = {{"exists", result.exists},
                  {"uploadedSize", result.uploadedSize},
                  {"isComplete", result.isComplete}};
      if (result.uploadId)
        out["uploadId"] = *result.uploadId;
      if (result.shouldRestart)
        out["shouldRestart"] = true;

      if (result.isComplete) {
        m_logger.info("UploadCheckEndpoint",
                      "File already exists and complete: " + request.fileName +
                          " for user " + request.username);
        sendJson(res, 409, out);
        return;
      }
      sendJson(res, 200, out);
    } catch (const UploadStoreError &e) {
      m_logger.error("UploadCheckEndpoint",
                     "Upload check error: " + std::string(e.what()));
      sendJson(res, 500, {{"error", "Internal server error"}});
    }
  });

  server.Post("/api/upload", [this](const httplib::Request &req,
                                    httplib::Response &res) {
    const auto &form = req.form;
    const char *required[] = {"username", "deviceId", "fileName", "fileSize",
                              "checksum"};
    bool complete = req.is_multipart_form_data() && form.has_file("file");
    for (const char *field : required) {
      if (!complete)
        break;
      complete = form.has_field(field) && !form.get_field(field).empty();
    }
    if (!complete) {
      sendJson(res, 400,
               {{"success", false}, {"message", "Missing required fields"}});
      return;
    }

    ChunkRequest chunk;
    chunk.username = form.get_field("username");
    chunk.deviceId = form.get_field("deviceId");
    chunk.fileName = form.get_field("fileName");
    chunk.checksum = form.get_field("checksum");
    if (form.has_field("lastModified"))
      chunk.lastModified = form.get_field("lastModified");
    chunk.payload = form.get_file("file").content;

    auto fileSize = parseInt64(form.get_field("fileSize"));
    if (!fileSize) {
      sendJson(res, 400, {{"success", false}, {"message", "Invalid fileSize"}});
      return;
    }
    chunk.declaredSize = *fileSize;

    std::optional<std::int64_t> startByte;
    if (form.has_field("startByte") && !form.get_field("startByte").empty()) {
      startByte = parseInt64(form.get_field("startByte"));
      if (!startByte) {
        sendJson(res, 400,
                 {{"success", false}, {"message", "Invalid startByte"}});
        return;
      }
    }

    if (req.has_header("Content-Range")) {
      auto range = parseContentRange(req.get_header_value("Content-Range"));
      if (!startByte && range)
        startByte = range->start;
      if (!range || range->start != *startByte ||
          range->end - range->start + 1 !=
              static_cast<std::int64_t>(chunk.payload.size()) ||
          range->total != chunk.declaredSize) {
        sendJson(res, 400,
                 {{"success", false},
                  {"message", "Content-Range does not match upload"}});
        return;
      }
    }
    chunk.startByte = startByte.value_or(0);

    m_logger.info("UploadEndpoint",
                  "Upload request for " + chunk.fileName + " from user " +
                      chunk.username + ", startByte: " +
                      std::to_string(chunk.startByte) + ", bytes: " +
                      std::to_string(chunk.payload.size()));

    try {
      ChunkResult result = m_store.writeChunk(chunk);
      switch (result.status) {
      case UploadStatus::Ok:
        sendJson(res, 200,
                 {{"success", true},
                  {"uploadId", result.uploadId},
                  {"bytesUploaded", result.bytesPersisted},
                  {"isComplete", result.isComplete}});
        return;
      case UploadStatus::RangeInvalid: {
        json out = {{"success", false}, {"message", result.message}};
        if (result.actualSize) {
          out["actualSize"] = *result.actualSize;
          out["expectedStartByte"] = chunk.startByte;
        }
        sendJson(res, 416, out);
        return;
      }
      case UploadStatus::ChecksumMismatch:
        sendJson(res, 400, {{"success", false}, {"message", result.message}});
        return;
      }
    } catch (const std::exception &e) {
      m_logger.error("UploadEndpoint", "Upload error for " + chunk.fileName +
                                           ": " + e.what());
      sendJson(res, 500,
               {{"success", false}, {"message", "Internal server error"}});
    }
  });

  server.Post("/api/delete", [this](const httplib::Request &req,
                                    httplib::Response &res) {
    auto body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !hasString(body, "username") ||
        !hasString(body, "deviceId") || !hasString(body, "fileName")) {
      sendJson(res, 400,
               {{"success", false}, {"message", "Missing required fields"}});
      return;
    }

    DeleteRequest request;
    request.username = body["username"].get<std::string>();
    request.deviceId = body["deviceId"].get<std::string>();
    request.fileName = body["fileName"].get<std::string>();
    if (hasString(body, "checksum"))
      request.checksum = body["checksum"].get<std::string>();
    m_logger.info("DeleteEndpoint", "Delete request for " + request.fileName +
                                        " from user " + request.username);

    try {
      std::size_t removed = m_store.remove(request);
      sendJson(res, 200,
               {{"success", true},
                {"message", removed ? "File deleted successfully"
                                    : "File not found, nothing to delete"}});
    } catch (const std::exception &e) {
      m_logger.error("DeleteEndpoint", "Delete error: " + std::string(e.what()));
      sendJson(res, 500,
               {{"success", false}, {"message", "Internal server error"}});
    }
  });
}

} // namespace dirsync
