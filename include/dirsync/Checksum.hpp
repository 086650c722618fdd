#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dirsync {

// Lowercase hex SHA-256 of an in-memory byte sequence.
std::string sha256Hex(const std::string &bytes);

// Streams the file through SHA-256. Empty if the file cannot be opened.
std::optional<std::string> sha256File(const std::filesystem::path &path);

} // namespace dirsync
