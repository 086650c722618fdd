#pragma once

#include "dirsync/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dirsync {

/**
 * FileStateTable maps relative paths to their last known snapshot.
 * classify() is the only read-modify-write entry point and runs under the
 * table lock, so two classifications of one path never race.
 */
class FileStateTable {
public:
  // Overwrites the entry without classifying (baseline scans).
  void record(const std::string &relPath, const FileSnapshot &snapshot);
  void recordAll(const std::map<std::string, FileSnapshot> &snapshots);

  std::optional<FileSnapshot> get(const std::string &relPath) const;

  // current is empty when the path no longer exists. Returns the event kind
  // to emit (and stores the new state), or nothing for a spurious change.
  std::optional<FileEventKind>
  classify(const std::string &relPath,
           const std::optional<FileSnapshot> &current);

  std::vector<std::string> existingPaths() const;
  // Existing files strictly below the directory relPath.
  std::vector<std::string> existingPathsUnder(const std::string &dirRelPath) const;

  void clear();
  std::size_t size() const;

private:
  mutable std::mutex m_mutex;
  std::map<std::string, FileSnapshot> m_states;
};

} // namespace dirsync
