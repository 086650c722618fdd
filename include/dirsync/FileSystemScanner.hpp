#ifndef DIRSYNC_FILESYSTEMSCANNER_HPP
#define DIRSYNC_FILESYSTEMSCANNER_HPP

#include "dirsync/Logger.hpp"
#include "dirsync/types.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dirsync {

/**
 * FileSystemScanner owns the watch filters (hidden files, excluded
 * directories, extension whitelist) and applies them the same way for the
 * startup scan, live notifications and listings.
 */
class FileSystemScanner {
public:
  FileSystemScanner(std::filesystem::path root, DirectoryWatcherConfig config,
                    Logger &logger);
  ~FileSystemScanner();

  const std::filesystem::path &root() const { return m_root; }
  const DirectoryWatcherConfig &config() const { return m_config; }

  // Snapshot of every included file below dir (recursive).
  std::map<std::string, FileSnapshot> scan(const std::filesystem::path &dir);

  // Sorted relative paths of every included file below dir.
  std::vector<std::string> listFiles(const std::filesystem::path &dir);

  // Relative paths of every included directory below dir.
  std::vector<std::string> listDirectories(const std::filesystem::path &dir);

  // Directory components only: exclusion list and hidden rule.
  bool isPathIncluded(const std::string &relPath) const;
  bool passesExtensionFilter(const std::string &fileName) const;
  bool isExcludedComponent(const std::string &name) const;

  std::string toRelativePath(const std::filesystem::path &absPath) const;
  std::filesystem::path toAbsolutePath(const std::string &relPath) const;

  static std::int64_t
  getUnixTimeStamp(const std::filesystem::file_time_type &ftime);
  static std::string toIsoTimestamp(const std::filesystem::file_time_type &ftime);

private:
  template <typename FileVisitor, typename DirVisitor>
  void walk(const std::filesystem::path &dir, FileVisitor &&visitFile,
            DirVisitor &&visitDir);

  std::filesystem::path m_root;
  DirectoryWatcherConfig m_config;
  Logger &m_logger;
};

} // namespace dirsync

#endif // DIRSYNC_FILESYSTEMSCANNER_HPP
