#include "dirsync/Checksum.hpp"
#include <fstream>
#include <vector>

#include <picosha2.h>

namespace dirsync {

std::string sha256Hex(const std::string &bytes) {
  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(bytes.begin(), bytes.end(), hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::optional<std::string> sha256File(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
    return std::nullopt;

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace dirsync
