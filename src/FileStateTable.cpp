#include "dirsync/FileStateTable.hpp"

namespace dirsync {

void FileStateTable::record(const std::string &relPath,
                            const FileSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_states[relPath] = snapshot;
}

void FileStateTable::recordAll(
    const std::map<std::string, FileSnapshot> &snapshots) {
  std::lock_guard<std::mutex> lock(m_mutex);
  for (const auto &[path, snap] : snapshots)
    m_states[path] = snap;
}

std::optional<FileSnapshot>
FileStateTable::get(const std::string &relPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_states.find(relPath);
  if (it == m_states.end())
    return std::nullopt;
  return it->second;
}

std::optional<FileEventKind>
FileStateTable::classify(const std::string &relPath,
                         const std::optional<FileSnapshot> &current) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_states.find(relPath);
  bool existedBefore = it != m_states.end() && it->second.exists;

  if (!current || !current->exists) {
    if (!existedBefore)
      return std::nullopt; // duplicate delete
    it->second = FileSnapshot{};
    return FileEventKind::Delete;
  }

  if (!existedBefore) {
    m_states[relPath] = *current;
    return FileEventKind::Insert;
  }

  if (it->second.modifiedTime == current->modifiedTime &&
      it->second.sizeBytes == current->sizeBytes)
    return std::nullopt;

  it->second = *current;
  return FileEventKind::Update;
}

std::vector<std::string> FileStateTable::existingPaths() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> paths;
  for (const auto &[path, snap] : m_states) {
    if (snap.exists)
      paths.push_back(path);
  }
  return paths;
}

std::vector<std::string>
FileStateTable::existingPathsUnder(const std::string &dirRelPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::string prefix = dirRelPath;
  if (!prefix.empty() && prefix.back() != '/')
    prefix += '/';

  std::vector<std::string> paths;
  for (auto it = m_states.lower_bound(prefix); it != m_states.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0)
      break;
    if (it->second.exists)
      paths.push_back(it->first);
  }
  return paths;
}

void FileStateTable::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_states.clear();
}

std::size_t FileStateTable::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_states.size();
}

} // namespace dirsync
