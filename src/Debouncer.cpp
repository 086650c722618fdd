#include "dirsync/Debouncer.hpp"
#include <exception>

namespace dirsync {

Debouncer::Debouncer(std::chrono::milliseconds delay, Handler handler,
                     Logger &logger)
    : m_delay(delay), m_handler(std::move(handler)), m_logger(logger) {}

Debouncer::~Debouncer() { stop(); }

void Debouncer::start() {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (m_running)
    return;
  if (m_worker.joinable()) {
    if (m_worker.get_id() == std::this_thread::get_id()) {
      // restarted from inside a handler: the current loop keeps going
      m_running = true;
      return;
    }
    // a worker stopped from its own handler may still be finishing
    lock.unlock();
    m_worker.join();
    lock.lock();
  }
  m_running = true;
  m_worker = std::thread(&Debouncer::workerLoop, this);
}

void Debouncer::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_deadlines.clear();
    m_running = false;
  }
  m_cv.notify_all();

  // From inside a handler the worker cannot join itself; it leaves the loop
  // once the handler returns and the next start(), stop() or the destructor
  // joins it.
  if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id())
    m_worker.join();
}

void Debouncer::touch(const std::string &key) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running)
      return;
    m_deadlines[key] = std::chrono::steady_clock::now() + m_delay;
  }
  m_cv.notify_all();
}

void Debouncer::cancelAll() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_deadlines.clear();
}

bool Debouncer::isPending(const std::string &key) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_deadlines.count(key) > 0;
}

std::size_t Debouncer::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_deadlines.size();
}

void Debouncer::workerLoop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (m_running) {
    if (m_deadlines.empty()) {
      m_cv.wait(lock, [this] { return !m_running || !m_deadlines.empty(); });
      continue;
    }

    auto earliest = m_deadlines.begin();
    for (auto it = m_deadlines.begin(); it != m_deadlines.end(); ++it) {
      if (it->second < earliest->second)
        earliest = it;
    }

    auto deadline = earliest->second;
    if (std::chrono::steady_clock::now() < deadline) {
      // touch()/stop() may wake us early; re-evaluate either way
      m_cv.wait_until(lock, deadline);
      continue;
    }

    std::string key = earliest->first;
    m_deadlines.erase(earliest);

    lock.unlock();
    try {
      m_handler(key);
    } catch (const std::exception &e) {
      m_logger.error("Debouncer", "Handler failed for " + key + ": " + e.what());
    } catch (...) {
      m_logger.error("Debouncer", "Handler failed for " + key +
                                      ": unknown exception");
    }
    lock.lock();
  }
}

} // namespace dirsync
