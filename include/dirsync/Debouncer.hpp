#pragma once

#include "dirsync/Logger.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace dirsync {

/**
 * Debouncer keeps one deadline per key. touch() replaces the deadline under
 * the lock, so re-arming a timer is a single step. A single worker thread
 * fires expired keys one at a time in deadline order.
 */
class Debouncer {
public:
  using Handler = std::function<void(const std::string &key)>;

  Debouncer(std::chrono::milliseconds delay, Handler handler, Logger &logger);
  ~Debouncer();

  Debouncer(const Debouncer &) = delete;
  Debouncer &operator=(const Debouncer &) = delete;

  // start() and stop() must not race each other.
  void start();
  // Drops every pending deadline without firing it and joins the worker,
  // unless called from a handler.
  void stop();

  void touch(const std::string &key);
  void cancelAll();
  bool isPending(const std::string &key) const;
  std::size_t pendingCount() const;

private:
  void workerLoop();

  std::chrono::milliseconds m_delay;
  Handler m_handler;
  Logger &m_logger;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::map<std::string, std::chrono::steady_clock::time_point> m_deadlines;
  bool m_running = false;
  std::thread m_worker;
};

} // namespace dirsync
