#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"
#include "streaming/accumulator.hpp"
#include "streaming/channel.hpp"
#include "streaming/stream_event.hpp"

namespace taskstream {

// Rebuilds messages from channel envelopes on the consumer side.
// Duplicate deliveries of the same (message_id, sequence) are ignored.
class StreamReader {
 public:
  // Returns true if the envelope was new and applied
  bool ingest(const json &payload, Timestamp received_at = std::chrono::system_clock::now());

  // Read and ingest everything published to the topic since the last poll.
  // Returns the number of entries read.
  size_t poll(StreamChannel &channel, const std::string &topic);

  // Messages in order of first appearance
  std::vector<AccumulatedMessage> messages() const;
  std::optional<AccumulatedMessage> message(const MessageId &message_id) const;

  bool completed(const MessageId &message_id) const;

  // Sessions without a terminal marker that have been silent for longer than timeout
  std::vector<MessageId> abandoned(Timestamp now, std::chrono::milliseconds timeout) const;

  size_t duplicates() const {
    return duplicates_;
  }

  size_t rejected() const {
    return rejected_;
  }

 private:
  struct Tracked {
    TaskId task_id;
    ContentAccumulator accumulator;
    std::set<uint64_t> seen;
    bool done = false;
    Timestamp last_seen;
  };

  AccumulatedMessage build(const MessageId &message_id, const Tracked &tracked) const;

  std::map<MessageId, Tracked> tracked_;
  std::vector<MessageId> order_;
  std::map<std::string, uint64_t> cursors_;
  size_t duplicates_ = 0;
  size_t rejected_ = 0;
};

}  // namespace taskstream
