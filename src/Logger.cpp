#include "dirsync/Logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace dirsync {

namespace {

char levelCode(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return 'D';
  case LogLevel::Info:
    return 'I';
  case LogLevel::Warn:
    return 'W';
  case LogLevel::Error:
    return 'E';
  }
  return '?';
}

std::tm utcNow(long &millis) {
  auto now = std::chrono::system_clock::now();
  millis = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch())
          .count() %
      1000);
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

} // namespace

Logger::Logger(LogLevel minLevel, std::string logDir)
    : m_minLevel(minLevel), m_logDir(std::move(logDir)) {
  if (!m_logDir.empty()) {
    std::error_code ec;
    fs::create_directories(m_logDir, ec);
  }
}

Logger::~Logger() = default;

void Logger::debug(const std::string &tag, const std::string &message) {
  log(LogLevel::Debug, tag, message);
}

void Logger::info(const std::string &tag, const std::string &message) {
  log(LogLevel::Info, tag, message);
}

void Logger::warn(const std::string &tag, const std::string &message) {
  log(LogLevel::Warn, tag, message);
}

void Logger::error(const std::string &tag, const std::string &message) {
  log(LogLevel::Error, tag, message);
}

void Logger::setMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_minLevel = level;
}

LogLevel Logger::minLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_minLevel;
}

void Logger::log(LogLevel level, const std::string &tag,
                 const std::string &message) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (level < m_minLevel)
    return;

  long millis = 0;
  std::tm tm = utcNow(millis);
  std::ostringstream line;
  line << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
       << std::setfill('0') << millis << "Z | " << levelCode(level) << " | ["
       << tag << "] " << message;

  write(level, line.str());
  if (!m_logDir.empty())
    appendToFile(line.str());
}

void Logger::write(LogLevel level, const std::string &line) {
  if (level == LogLevel::Error)
    std::cerr << line << std::endl;
  else
    std::cout << line << std::endl;
}

void Logger::appendToFile(const std::string &line) {
  long millis = 0;
  std::tm tm = utcNow(millis);
  std::ostringstream name;
  name << std::put_time(&tm, "%Y-%m-%d-%H") << ".log";

  std::ofstream out(fs::path(m_logDir) / name.str(), std::ios::app);
  if (out)
    out << line << '\n';
}

} // namespace dirsync
