#include "engine/replay_log.hpp"

#include <algorithm>

namespace taskstream::engine {

ReplayLog::ReplayLog(const ReplayLog &other) : entries_(other.entries()) {}

void ReplayLog::record(uint64_t sequence, const ActivityName &activity, const json &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(entries_.begin(), entries_.end(), [sequence](const Entry &e) {
    return e.sequence == sequence;
  });
  if (it != entries_.end()) {
    it->activity = activity;
    it->result = result;
    return;
  }
  entries_.push_back({sequence, activity, result});
}

std::optional<ReplayLog::Entry> ReplayLog::find(uint64_t sequence) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : entries_) {
    if (entry.sequence == sequence) {
      return entry;
    }
  }
  return std::nullopt;
}

std::vector<ReplayLog::Entry> ReplayLog::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

size_t ReplayLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

json ReplayLog::to_json() const {
  json j = json::array();
  for (const auto &entry : entries()) {
    j.push_back({{"sequence", entry.sequence}, {"activity", entry.activity}, {"result", entry.result}});
  }
  return j;
}

ReplayLog ReplayLog::from_json(const json &j) {
  ReplayLog log;
  for (const auto &e : j) {
    log.record(e.value("sequence", uint64_t{0}), e.value("activity", ""), e.value("result", json()));
  }
  return log;
}

}  // namespace taskstream::engine
