#include "streaming/stream_reader.hpp"

#include <spdlog/spdlog.h>

namespace taskstream {

bool StreamReader::ingest(const json &payload, Timestamp received_at) {
  auto update = StreamUpdate::from_json(payload);
  if (!update) {
    ++rejected_;
    spdlog::warn("[StreamReader] Ignoring malformed envelope");
    return false;
  }

  auto it = tracked_.find(update->message_id);
  if (it == tracked_.end()) {
    it = tracked_.emplace(update->message_id, Tracked{update->task_id, ContentAccumulator{}, {}, false, received_at}).first;
    order_.push_back(update->message_id);
  }
  auto &tracked = it->second;

  if (!tracked.seen.insert(update->sequence).second) {
    ++duplicates_;
    spdlog::debug("[StreamReader] Duplicate #{} for {}", update->sequence, update->message_id);
    return false;
  }
  tracked.last_seen = received_at;

  if (update->type == UpdateType::Start) {
    if (update->content && tracked.accumulator.empty()) {
      tracked.accumulator = ContentAccumulator(update->content);
    }
    return true;
  }

  if (auto event = update->event()) {
    tracked.accumulator.apply(*event);
  }
  if (update->type == UpdateType::Done) {
    tracked.done = true;
  }
  return true;
}

size_t StreamReader::poll(StreamChannel &channel, const std::string &topic) {
  auto &cursor = cursors_[topic];
  auto entries = channel.read(topic, cursor);
  for (const auto &entry : entries) {
    ingest(entry.payload);
    cursor = entry.id;
  }
  return entries.size();
}

AccumulatedMessage StreamReader::build(const MessageId &message_id, const Tracked &tracked) const {
  AccumulatedMessage msg(tracked.task_id, message_id, Author::Agent);
  msg.set_blocks(tracked.accumulator.blocks());
  msg.set_final(tracked.done);
  msg.set_status(tracked.done ? StreamingStatus::Done : StreamingStatus::InProgress);
  return msg;
}

std::vector<AccumulatedMessage> StreamReader::messages() const {
  std::vector<AccumulatedMessage> result;
  for (const auto &id : order_) {
    result.push_back(build(id, tracked_.at(id)));
  }
  return result;
}

std::optional<AccumulatedMessage> StreamReader::message(const MessageId &message_id) const {
  auto it = tracked_.find(message_id);
  if (it == tracked_.end()) {
    return std::nullopt;
  }
  return build(message_id, it->second);
}

bool StreamReader::completed(const MessageId &message_id) const {
  auto it = tracked_.find(message_id);
  return it != tracked_.end() && it->second.done;
}

std::vector<MessageId> StreamReader::abandoned(Timestamp now, std::chrono::milliseconds timeout) const {
  std::vector<MessageId> result;
  for (const auto &id : order_) {
    const auto &tracked = tracked_.at(id);
    if (!tracked.done && now - tracked.last_seen > timeout) {
      result.push_back(id);
    }
  }
  return result;
}

}  // namespace taskstream
