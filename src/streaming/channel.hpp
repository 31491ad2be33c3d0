#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace taskstream {

// One entry of a channel topic
struct ChannelEntry {
  uint64_t id = 0;
  json payload;
};

// External ordered channel. Entries of a topic are delivered in publish order.
class StreamChannel {
 public:
  virtual ~StreamChannel() = default;

  // Append to a topic; returns the entry id. May throw on transport failure.
  virtual uint64_t publish(const std::string &topic, const json &payload) = 0;

  // Entries with id > from, in order
  virtual std::vector<ChannelEntry> read(const std::string &topic, uint64_t from = 0) = 0;

  // Drop a topic and its entries
  virtual void cleanup(const std::string &topic) = 0;
};

// Per-topic append-only log held in memory
class InMemoryStreamChannel : public StreamChannel {
 public:
  using SubscriptionId = uint64_t;
  using Subscriber = std::function<void(const std::string &topic, const ChannelEntry &entry)>;

  uint64_t publish(const std::string &topic, const json &payload) override;
  std::vector<ChannelEntry> read(const std::string &topic, uint64_t from = 0) override;
  void cleanup(const std::string &topic) override;

  // Called after every publish to the topic, outside the lock. A session
  // publishing to the topic must not be published to from inside the callback.
  SubscriptionId subscribe(const std::string &topic, Subscriber subscriber);
  void unsubscribe(SubscriptionId id);

  std::vector<std::string> topics() const;
  size_t size(const std::string &topic) const;

 private:
  struct Topic {
    uint64_t next_id = 1;
    std::vector<ChannelEntry> entries;
  };

  struct SubscriberEntry {
    SubscriptionId id;
    std::string topic;
    Subscriber callback;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Topic> topics_;
  std::vector<SubscriberEntry> subscribers_;
  SubscriptionId next_subscription_ = 1;
};

}  // namespace taskstream
