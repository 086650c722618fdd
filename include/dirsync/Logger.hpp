#pragma once

#include <mutex>
#include <string>

namespace dirsync {

enum class LogLevel { Debug, Info, Warn, Error };

/**
 * Logger writes "[Tag] message" lines to the console and, when a log
 * directory is configured, to an hourly file. One instance is created in
 * main and handed to every component by reference.
 */
class Logger {
public:
  explicit Logger(LogLevel minLevel = LogLevel::Info, std::string logDir = "");
  virtual ~Logger();

  void debug(const std::string &tag, const std::string &message);
  void info(const std::string &tag, const std::string &message);
  void warn(const std::string &tag, const std::string &message);
  void error(const std::string &tag, const std::string &message);

  void setMinLevel(LogLevel level);
  LogLevel minLevel() const;

protected:
  virtual void write(LogLevel level, const std::string &line);

private:
  void log(LogLevel level, const std::string &tag, const std::string &message);
  void appendToFile(const std::string &line);

  mutable std::mutex m_mutex;
  LogLevel m_minLevel;
  std::string m_logDir;
};

} // namespace dirsync
