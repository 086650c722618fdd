#include "dirsync/FileSystemScanner.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace dirsync {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string normalizeExtension(const std::string &ext) {
  std::string lowered = toLower(ext);
  if (!lowered.empty() && lowered.front() != '.')
    lowered.insert(lowered.begin(), '.');
  return lowered;
}

} // namespace

FileSystemScanner::FileSystemScanner(fs::path root,
                                     DirectoryWatcherConfig config,
                                     Logger &logger)
    : m_root(std::move(root)), m_config(std::move(config)), m_logger(logger) {
  std::set<std::string> normalized;
  for (const auto &ext : m_config.fileExtensionFilter)
    normalized.insert(normalizeExtension(ext));
  m_config.fileExtensionFilter = std::move(normalized);
}

FileSystemScanner::~FileSystemScanner() = default;

bool FileSystemScanner::isExcludedComponent(const std::string &name) const {
  if (m_config.excludedDirNames.count(name))
    return true;
  return m_config.ignoreHidden && !name.empty() && name.front() == '.';
}

bool FileSystemScanner::passesExtensionFilter(
    const std::string &fileName) const {
  if (m_config.fileExtensionFilter.empty())
    return true;
  std::string ext = toLower(fs::path(fileName).extension().string());
  return m_config.fileExtensionFilter.count(ext) > 0;
}

bool FileSystemScanner::isPathIncluded(const std::string &relPath) const {
  for (const auto &part : fs::path(relPath)) {
    std::string name = part.string();
    if (name.empty() || name == "." || name == "/")
      continue;
    if (name == "..")
      return false;
    if (isExcludedComponent(name))
      return false;
  }
  return true;
}

std::string FileSystemScanner::toRelativePath(const fs::path &absPath) const {
  return absPath.lexically_normal()
      .lexically_relative(m_root.lexically_normal())
      .generic_string();
}

fs::path FileSystemScanner::toAbsolutePath(const std::string &relPath) const {
  return (m_root / fs::path(relPath)).lexically_normal();
}

std::int64_t FileSystemScanner::getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys_time.time_since_epoch())
      .count();
}

std::string FileSystemScanner::toIsoTimestamp(const fs::file_time_type &ftime) {
  std::time_t t = static_cast<std::time_t>(getUnixTimeStamp(ftime));
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

template <typename FileVisitor, typename DirVisitor>
void FileSystemScanner::walk(const fs::path &dir, FileVisitor &&visitFile,
                             DirVisitor &&visitDir) {
  std::error_code ec;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    m_logger.error("Scanner",
                   "Error reading directory " + dir.string() + ": " +
                       ec.message());
    return;
  }

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      m_logger.error("Scanner", "Error scanning below " + dir.string() +
                                    ": " + ec.message());
      ec.clear();
      continue;
    }
    const fs::directory_entry &entry = *it;
    std::string name = entry.path().filename().string();

    std::error_code typeEc;
    if (entry.is_directory(typeEc)) {
      if (isExcludedComponent(name))
        it.disable_recursion_pending();
      else
        visitDir(entry);
      continue;
    }
    if (!entry.is_regular_file(typeEc))
      continue;
    if (isExcludedComponent(name) || !passesExtensionFilter(name))
      continue;

    visitFile(entry);
  }
}

std::map<std::string, FileSnapshot> FileSystemScanner::scan(const fs::path &dir) {
  std::map<std::string, FileSnapshot> result;
  walk(dir, [&](const fs::directory_entry &entry) {
    std::error_code ec;
    FileSnapshot snap;
    snap.exists = true;
    snap.sizeBytes = entry.file_size(ec);
    if (ec)
      return;
    snap.modifiedTime = entry.last_write_time(ec);
    if (ec)
      return;
    result[toRelativePath(entry.path())] = snap;
  }, [](const fs::directory_entry &) {});
  return result;
}

std::vector<std::string> FileSystemScanner::listFiles(const fs::path &dir) {
  std::vector<std::string> files;
  walk(dir, [&](const fs::directory_entry &entry) {
    files.push_back(toRelativePath(entry.path()));
  }, [](const fs::directory_entry &) {});
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string> FileSystemScanner::listDirectories(const fs::path &dir) {
  std::vector<std::string> dirs;
  walk(dir, [](const fs::directory_entry &) {},
       [&](const fs::directory_entry &entry) {
         dirs.push_back(toRelativePath(entry.path()));
       });
  return dirs;
}

} // namespace dirsync
