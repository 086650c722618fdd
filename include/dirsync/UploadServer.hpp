#pragma once

#include "dirsync/Logger.hpp"
#include "dirsync/UploadStore.hpp"
#include <memory>
#include <string>

namespace dirsync {

/**
 * UploadServer exposes the UploadStore over HTTP (cpp-httplib):
 *   GET  /api/ping
 *   POST /api/upload/check   JSON
 *   POST /api/upload         multipart/form-data
 *   POST /api/delete         JSON
 * Every error answer carries a JSON body.
 */
class UploadServer {
public:
  UploadServer(UploadStore &store, Logger &logger);
  ~UploadServer();

  // Blocks until stop().
  bool listen(const std::string &host, int port);
  // Binds an ephemeral port and returns it (or -1); serve with listenAfterBind().
  int bindToAnyPort(const std::string &host);
  bool listenAfterBind();
  void waitUntilReady() const;
  void stop();
  bool isRunning() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  UploadStore &m_store;
  Logger &m_logger;

  void registerRoutes();
};

} // namespace dirsync
