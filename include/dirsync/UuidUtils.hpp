#pragma once
#include <string>

namespace dirsync {

class UuidUtils {
public:
  // Random RFC 4122 version 4 UUID, lowercase.
  static std::string generate();
};

} // namespace dirsync
