#include "streaming/channel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace taskstream {

uint64_t InMemoryStreamChannel::publish(const std::string &topic, const json &payload) {
  ChannelEntry entry;
  std::vector<Subscriber> to_call;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &t = topics_[topic];
    entry.id = t.next_id++;
    entry.payload = payload;
    t.entries.push_back(entry);

    for (const auto &sub : subscribers_) {
      if (sub.topic == topic) {
        to_call.push_back(sub.callback);
      }
    }
  }

  spdlog::trace("[Channel] {} <- #{}", topic, entry.id);

  // Call subscribers outside the lock
  for (const auto &callback : to_call) {
    callback(topic, entry);
  }

  return entry.id;
}

std::vector<ChannelEntry> InMemoryStreamChannel::read(const std::string &topic, uint64_t from) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<ChannelEntry> result;
  auto it = topics_.find(topic);
  if (it == topics_.end()) {
    return result;
  }

  for (const auto &entry : it->second.entries) {
    if (entry.id > from) {
      result.push_back(entry);
    }
  }
  return result;
}

void InMemoryStreamChannel::cleanup(const std::string &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  topics_.erase(topic);
  spdlog::debug("[Channel] Cleaned up topic {}", topic);
}

InMemoryStreamChannel::SubscriptionId InMemoryStreamChannel::subscribe(const std::string &topic, Subscriber subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscription_++;
  subscribers_.push_back({id, topic, std::move(subscriber)});
  return id;
}

void InMemoryStreamChannel::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const SubscriberEntry &entry) {
                                      return entry.id == id;
                                    }),
                     subscribers_.end());
}

std::vector<std::string> InMemoryStreamChannel::topics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto &[name, topic] : topics_) {
    names.push_back(name);
  }
  return names;
}

size_t InMemoryStreamChannel::size(const std::string &topic) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = topics_.find(topic);
  return it == topics_.end() ? 0 : it->second.entries.size();
}

}  // namespace taskstream
