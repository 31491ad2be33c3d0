#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "core/types.hpp"

namespace taskstream::engine {

// Recorded activity results of one caller, in dispatch order
class ReplayLog {
 public:
  struct Entry {
    uint64_t sequence = 0;
    ActivityName activity;
    json result;
  };

  ReplayLog() = default;
  ReplayLog(const ReplayLog &other);
  ReplayLog &operator=(const ReplayLog &) = delete;

  void record(uint64_t sequence, const ActivityName &activity, const json &result);

  std::optional<Entry> find(uint64_t sequence) const;

  std::vector<Entry> entries() const;
  size_t size() const;

  json to_json() const;
  static ReplayLog from_json(const json &j);

 private:
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

}  // namespace taskstream::engine
