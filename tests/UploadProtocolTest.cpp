#include "TestSupport.hpp"
#include "dirsync/ApiClient.hpp"
#include "dirsync/Checksum.hpp"
#include "httplib.h"
#include <atomic>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace dirsync;
using namespace dirsync::test;
using json = nlohmann::json;

namespace {

ApiClientConfig clientConfig(const std::string &url) {
  ApiClientConfig config;
  config.baseUrl = url;
  config.timeoutMs = 2000;
  config.retryAttempts = 2;
  config.retryDelayMs = 10;
  return config;
}

class UploadProtocolTest : public ::testing::Test {
protected:
  UploadProtocolTest()
      : server(dir.path(), logger), client(clientConfig(server.url()), logger) {
    content.resize(100);
    for (std::size_t i = 0; i < content.size(); ++i)
      content[i] = static_cast<char>(i);
    checksum = sha256Hex(content);
  }

  UploadRequest uploadRequest(std::int64_t startByte, std::size_t length) {
    UploadRequest req;
    req.username = "bob";
    req.deviceId = "host-11:22";
    req.fileName = "notes/todo.txt";
    req.fileSize = static_cast<std::int64_t>(content.size());
    req.checksum = checksum;
    req.lastModified = "2026-02-03T04:05:06Z";
    if (startByte > 0)
      req.startByte = startByte;
    req.data = content.substr(static_cast<std::size_t>(startByte), length);
    return req;
  }

  ResumableUploadMetadata metadata() {
    ResumableUploadMetadata meta;
    meta.username = "bob";
    meta.deviceId = "host-11:22";
    meta.fileName = "notes/todo.txt";
    meta.checksum = checksum;
    return meta;
  }

  UploadCheckRequest checkRequest() {
    UploadCheckRequest req;
    req.username = "bob";
    req.deviceId = "host-11:22";
    req.fileName = "notes/todo.txt";
    req.fileSize = static_cast<std::int64_t>(content.size());
    req.checksum = checksum;
    return req;
  }

  TempDir dir;
  CapturingLogger logger;
  TestServer server;
  ApiClient client;
  std::string content;
  std::string checksum;
};

// Plain httplib server answering every request with a scripted status.
class ScriptedServer {
public:
  explicit ScriptedServer(std::vector<int> statuses)
      : m_statuses(std::move(statuses)) {
    auto handler = [this](const httplib::Request &, httplib::Response &res) {
      int index = hits++;
      int status = index < static_cast<int>(m_statuses.size())
                       ? m_statuses[index]
                       : m_statuses.back();
      res.status = status;
      if (status == 409)
        res.set_content(R"({"exists":true,"uploadedSize":5,"isComplete":true})",
                        "application/json");
      else if (status >= 400)
        res.set_content(R"({"success":false,"message":"scripted failure"})",
                        "application/json");
      else
        res.set_content(R"({"success":true})", "application/json");
    };
    m_server.Get("/api/ping", handler);
    m_server.Post("/api/upload/check", handler);
    m_server.Post("/api/delete", handler);
    port = m_server.bind_to_any_port("127.0.0.1");
    m_thread = std::thread([this] { m_server.listen_after_bind(); });
    m_server.wait_until_ready();
  }
  ~ScriptedServer() {
    m_server.stop();
    m_thread.join();
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }

  std::atomic<int> hits{0};
  int port = -1;

private:
  std::vector<int> m_statuses;
  httplib::Server m_server;
  std::thread m_thread;
};

} // namespace

TEST_F(UploadProtocolTest, PingReachesServer) { EXPECT_TRUE(client.ping()); }

TEST_F(UploadProtocolTest, PartialUploadResumesToCompletion) {
  UploadResponse partial = client.uploadFile(uploadRequest(0, 50));
  EXPECT_TRUE(partial.success);
  EXPECT_FALSE(partial.isComplete);
  EXPECT_EQ(partial.bytesUploaded, 50);

  UploadCheckResponse check = client.checkUpload(checkRequest());
  EXPECT_TRUE(check.exists);
  EXPECT_EQ(check.uploadedSize, 50);
  EXPECT_FALSE(check.isComplete);
  EXPECT_EQ(check.uploadId, std::optional<std::string>(partial.uploadId));

  std::vector<std::pair<std::int64_t, std::int64_t>> progress;
  UploadResponse done = client.uploadFileResumable(
      content, metadata(),
      [&](std::int64_t sent, std::int64_t total) { progress.emplace_back(sent, total); });
  EXPECT_TRUE(done.success);
  EXPECT_TRUE(done.isComplete);
  EXPECT_EQ(done.bytesUploaded, 100);
  EXPECT_EQ(done.uploadId, partial.uploadId);
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0], std::make_pair(std::int64_t{100}, std::int64_t{100}));

  auto session = server.store.getSession("host-11:22", checksum);
  ASSERT_TRUE(session.has_value());
  EXPECT_TRUE(session->isComplete);
  EXPECT_EQ(readFile(server.store.bytesPath(*session)), content);
}

TEST_F(UploadProtocolTest, CompletedFileChecksAsConflictAndSkipsUpload) {
  client.uploadFile(uploadRequest(0, 100));

  UploadCheckResponse check = client.checkUpload(checkRequest());
  EXPECT_TRUE(check.exists);
  EXPECT_TRUE(check.isComplete);
  EXPECT_EQ(check.uploadedSize, 100);

  UploadResponse again = client.uploadFileResumable(content, metadata());
  EXPECT_TRUE(again.isComplete);
  EXPECT_TRUE(logger.contains("File already exists and complete"));
}

TEST_F(UploadProtocolTest, WrongOffsetIsRangeNotSatisfiable) {
  client.uploadFile(uploadRequest(0, 30));

  try {
    client.uploadFile(uploadRequest(60, 40));
    FAIL() << "expected a 416";
  } catch (const ServerApiError &e) {
    EXPECT_EQ(e.statusCode(), std::optional<int>(416));
    EXPECT_STREQ(e.what(), "Invalid range for resumable upload");
    auto body = json::parse(e.responseBody());
    EXPECT_EQ(body["actualSize"].get<std::int64_t>(), 30);
    EXPECT_EQ(body["expectedStartByte"].get<std::int64_t>(), 60);
    EXPECT_FALSE(body["success"].get<bool>());
  }
}

TEST_F(UploadProtocolTest, CorruptedContentIsRejected) {
  UploadRequest req = uploadRequest(0, 100);
  req.data[0] = static_cast<char>(0x7f);

  try {
    client.uploadFile(req);
    FAIL() << "expected a 400";
  } catch (const ServerApiError &e) {
    EXPECT_EQ(e.statusCode(), std::optional<int>(400));
    EXPECT_STREQ(e.what(), "Checksum verification failed");
  }
  EXPECT_TRUE(server.store.getAllSessions().empty());
}

TEST_F(UploadProtocolTest, ContentRangeMustAgreeWithBody) {
  client.uploadFile(uploadRequest(0, 30));

  httplib::Client raw(server.url());
  httplib::UploadFormDataItems items = {
      {"username", "bob", "", ""},
      {"deviceId", "host-11:22", "", ""},
      {"fileName", "notes/todo.txt", "", ""},
      {"fileSize", "100", "", ""},
      {"checksum", checksum, "", ""},
      {"startByte", "30", "", ""},
      {"file", content.substr(30), "todo.txt", "application/octet-stream"}};
  httplib::Headers headers = {{"Content-Range", "bytes 30-80/100"}};

  auto res = raw.Post("/api/upload", headers, items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  httplib::Headers matching = {{"Content-Range", "bytes 30-99/100"}};
  auto accepted = raw.Post("/api/upload", matching, items);
  ASSERT_TRUE(accepted);
  EXPECT_EQ(accepted->status, 200);
  EXPECT_TRUE(json::parse(accepted->body)["isComplete"].get<bool>());
}

TEST_F(UploadProtocolTest, MissingFieldsAreBadRequests) {
  httplib::Client raw(server.url());

  auto check = raw.Post("/api/upload/check", R"({"username":"bob"})",
                        "application/json");
  ASSERT_TRUE(check);
  EXPECT_EQ(check->status, 400);
  EXPECT_EQ(json::parse(check->body)["error"], "Missing required fields");

  auto del = raw.Post("/api/delete", "not json", "application/json");
  ASSERT_TRUE(del);
  EXPECT_EQ(del->status, 400);

  httplib::UploadFormDataItems items = {{"username", "bob", "", ""}};
  auto upload = raw.Post("/api/upload", items);
  ASSERT_TRUE(upload);
  EXPECT_EQ(upload->status, 400);
  EXPECT_EQ(json::parse(upload->body)["message"], "Missing required fields");
}

TEST_F(UploadProtocolTest, DeleteTwiceSucceedsBothTimes) {
  client.uploadFile(uploadRequest(0, 100));

  DeleteRequest del;
  del.username = "bob";
  del.deviceId = "host-11:22";
  del.fileName = "notes/todo.txt";

  DeleteResponse first = client.deleteFile(del);
  EXPECT_TRUE(first.success);
  EXPECT_EQ(first.message, std::optional<std::string>("File deleted successfully"));

  DeleteResponse second = client.deleteFile(del);
  EXPECT_TRUE(second.success);
  EXPECT_EQ(second.message,
            std::optional<std::string>("File not found, nothing to delete"));

  EXPECT_FALSE(client.checkUpload(checkRequest()).exists);
}

TEST_F(UploadProtocolTest, BrokenPartialIsAnInternalError) {
  client.uploadFile(uploadRequest(0, 30));
  auto session = server.store.getSession("host-11:22", checksum);
  ASSERT_TRUE(session.has_value());
  std::filesystem::resize_file(server.store.bytesPath(*session), 3);

  ApiClientConfig noRetry = clientConfig(server.url());
  noRetry.retryAttempts = 0;
  ApiClient impatient(noRetry, logger);
  try {
    impatient.checkUpload(checkRequest());
    FAIL() << "expected a 500";
  } catch (const ServerApiError &e) {
    EXPECT_EQ(e.statusCode(), std::optional<int>(500));
  }
  EXPECT_FALSE(client.checkUpload(checkRequest()).exists);
}

TEST(ApiClientRetryTest, ServerErrorsAreRetriedThenSucceed) {
  CapturingLogger logger;
  ScriptedServer scripted({500, 503, 200});
  ApiClient client(clientConfig(scripted.url()), logger);

  EXPECT_TRUE(client.ping());
  EXPECT_EQ(scripted.hits.load(), 3);
  EXPECT_TRUE(logger.contains("retry 2/2"));
}

TEST(ApiClientRetryTest, ServerErrorsExhaustRetries) {
  CapturingLogger logger;
  ScriptedServer scripted({500});
  ApiClient client(clientConfig(scripted.url()), logger);

  DeleteRequest del;
  del.username = "u";
  del.deviceId = "d";
  del.fileName = "f";
  try {
    client.deleteFile(del);
    FAIL() << "expected an error";
  } catch (const ServerApiError &e) {
    EXPECT_EQ(e.statusCode(), std::optional<int>(500));
    EXPECT_STREQ(e.what(), "scripted failure");
  }
  EXPECT_EQ(scripted.hits.load(), 3);
}

TEST(ApiClientRetryTest, ClientErrorsAreNotRetried) {
  CapturingLogger logger;
  ScriptedServer scripted({400});
  ApiClient client(clientConfig(scripted.url()), logger);

  UploadCheckRequest req;
  req.username = "u";
  EXPECT_THROW(client.checkUpload(req), ServerApiError);
  EXPECT_EQ(scripted.hits.load(), 1);
}

TEST(ApiClientRetryTest, ConflictIsAnAnswerNotAnError) {
  CapturingLogger logger;
  ScriptedServer scripted({409});
  ApiClient client(clientConfig(scripted.url()), logger);

  UploadCheckResponse res = client.checkUpload(UploadCheckRequest{});
  EXPECT_TRUE(res.isComplete);
  EXPECT_EQ(res.uploadedSize, 5);
  EXPECT_EQ(scripted.hits.load(), 1);
}

TEST(ApiClientRetryTest, NoResponseIsANetworkError) {
  CapturingLogger logger;
  int deadPort;
  {
    httplib::Server placeholder;
    deadPort = placeholder.bind_to_any_port("127.0.0.1");
  }
  ApiClient client(clientConfig("http://127.0.0.1:" + std::to_string(deadPort)),
                   logger);

  EXPECT_FALSE(client.ping());

  try {
    client.deleteFile(DeleteRequest{});
    FAIL() << "expected a network error";
  } catch (const ServerApiError &e) {
    EXPECT_TRUE(e.isNetworkError());
    EXPECT_NE(std::string(e.what()).find("No response from server"),
              std::string::npos);
  }
}
