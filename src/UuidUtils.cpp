#include "dirsync/UuidUtils.hpp"
#include <array>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace dirsync {

std::string UuidUtils::generate() {
  static std::mutex mtx;
  static std::mt19937_64 engine{std::random_device{}()};

  std::array<std::uint8_t, 16> bytes;
  {
    std::lock_guard<std::mutex> lock(mtx);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &b : bytes)
      b = static_cast<std::uint8_t>(dist(engine));
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
  bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 10xx

  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(buf);
}

} // namespace dirsync
