#include "dirsync/DeviceIdentity.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dirsync {

namespace {

std::string readFirstLine(const fs::path &path) {
  std::ifstream in(path);
  std::string line;
  std::getline(in, line);
  return line;
}

} // namespace

DeviceIdentity::DeviceIdentity(Logger &logger, fs::path netClassDir)
    : m_logger(logger), m_netClassDir(std::move(netClassDir)) {}

std::string DeviceIdentity::deviceId() {
  return hostName() + "-" + macAddress();
}

std::string DeviceIdentity::hostName() {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0) {
    m_logger.error("DeviceIdentity", "Error getting host name");
    return "unknown-device";
  }
  return std::string(buf);
}

std::string DeviceIdentity::macAddress() {
  const std::string none = "00:00:00:00:00:00";
  std::error_code ec;
  std::set<std::string> interfaces; // sorted for a stable pick
  for (fs::directory_iterator it(m_netClassDir, ec), end; !ec && it != end;
       it.increment(ec))
    interfaces.insert(it->path().filename().string());
  if (ec) {
    m_logger.error("DeviceIdentity",
                   "Error listing network interfaces: " + ec.message());
    return none;
  }

  for (const auto &name : interfaces) {
    if (name == "lo")
      continue;
    fs::path dir = m_netClassDir / name;
    if (readFirstLine(dir / "operstate") != "up")
      continue;
    std::string mac = readFirstLine(dir / "address");
    if (mac.empty() || mac == none)
      continue;
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return mac;
  }
  return none;
}

} // namespace dirsync
