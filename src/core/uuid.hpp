#pragma once

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace taskstream {

// UUID v4 generator, safe to call from concurrent worker threads
class UUID {
 public:
  static std::string generate() {
    uint64_t ab = 0;
    uint64_t cd = 0;
    {
      std::lock_guard<std::mutex> lock(mutex());
      ab = dist()(engine());
      cd = dist()(engine());
    }

    // Set version to 4 (random)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Set variant to RFC 4122
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  // "msg_3f9a01c2" style ids: prefix + first 8 hex digits of a fresh UUID
  static std::string prefixed(const std::string &prefix) {
    return prefix + "_" + generate().substr(0, 8);
  }

 private:
  static std::mutex &mutex() {
    static std::mutex m;
    return m;
  }

  static std::mt19937_64 &engine() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    return gen;
  }

  static std::uniform_int_distribution<uint64_t> &dist() {
    static std::uniform_int_distribution<uint64_t> d;
    return d;
  }
};

}  // namespace taskstream
