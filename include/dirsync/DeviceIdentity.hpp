#pragma once
#include "dirsync/Logger.hpp"
#include <filesystem>
#include <string>

namespace dirsync {

class DeviceIdentity {
public:
  explicit DeviceIdentity(Logger &logger,
                          std::filesystem::path netClassDir = "/sys/class/net");

  // "<hostname>-<MAC>", stable across runs on the same machine.
  std::string deviceId();
  std::string hostName();
  // First non-loopback interface that is up, "AA:BB:CC:DD:EE:FF".
  std::string macAddress();

private:
  Logger &m_logger;
  std::filesystem::path m_netClassDir;
};

} // namespace dirsync
