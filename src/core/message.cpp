#include "core/message.hpp"

#include <algorithm>

namespace taskstream {

// --- Timestamp helpers ---

static int64_t timestamp_to_epoch_ms(const Timestamp &ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

static Timestamp epoch_ms_to_timestamp(int64_t epoch_ms) {
  return Timestamp(std::chrono::milliseconds(epoch_ms));
}

// --- AccumulatedMessage ---

AccumulatedMessage::AccumulatedMessage(TaskId task_id, MessageId message_id, Author author)
    : task_id_(std::move(task_id)), message_id_(std::move(message_id)), author_(author) {}

void AccumulatedMessage::add_block(ContentBlock block) {
  blocks_.push_back(std::move(block));
}

void AccumulatedMessage::set_blocks(std::vector<ContentBlock> blocks) {
  blocks_ = std::move(blocks);
}

std::string AccumulatedMessage::text() const {
  std::string result;
  for (const auto &block : blocks_) {
    if (auto *text = std::get_if<TextContent>(&block)) {
      result += text->text;
    }
  }
  return result;
}

std::vector<const ToolRequestContent *> AccumulatedMessage::tool_requests() const {
  std::vector<const ToolRequestContent *> result;
  for (const auto &block : blocks_) {
    if (auto *req = std::get_if<ToolRequestContent>(&block)) {
      result.push_back(req);
    }
  }
  return result;
}

bool AccumulatedMessage::same_content(const AccumulatedMessage &other) const {
  return task_id_ == other.task_id_ && message_id_ == other.message_id_ && author_ == other.author_ && final_ == other.final_ &&
         status_ == other.status_ && blocks_ == other.blocks_;
}

json AccumulatedMessage::to_json() const {
  json j;
  j["task_id"] = task_id_;
  j["message_id"] = message_id_;
  j["author"] = to_string(author_);
  j["final"] = final_;
  j["streaming_status"] = to_string(status_);
  j["created_at"] = timestamp_to_epoch_ms(created_at_);

  json blocks_json = json::array();
  for (const auto &block : blocks_) {
    blocks_json.push_back(content_to_json(block));
  }
  j["content"] = blocks_json;

  return j;
}

AccumulatedMessage AccumulatedMessage::from_json(const json &j) {
  AccumulatedMessage msg;
  msg.task_id_ = j.value("task_id", "");
  msg.message_id_ = j.value("message_id", "");
  msg.author_ = author_from_string(j.value("author", "agent"));
  msg.final_ = j.value("final", false);
  msg.status_ = streaming_status_from_string(j.value("streaming_status", "IN_PROGRESS"));
  msg.created_at_ = epoch_ms_to_timestamp(j.value("created_at", int64_t(0)));

  if (j.contains("content")) {
    for (const auto &block_json : j["content"]) {
      if (auto block = content_from_json(block_json)) {
        msg.blocks_.push_back(std::move(*block));
      }
    }
  }

  return msg;
}

// --- InMemoryMessageSink ---

bool InMemoryMessageSink::upsert(const TaskId &task_id, const MessageId &message_id, const AccumulatedMessage &msg) {
  std::lock_guard lock(mutex_);
  upsert_calls_++;

  Key key{task_id, message_id};
  auto it = messages_.find(key);
  if (it != messages_.end()) {
    if (it->second.same_content(msg)) {
      return false;
    }
    it->second = msg;
    return true;
  }

  messages_.emplace(key, msg);
  task_messages_[task_id].push_back(message_id);
  return true;
}

std::optional<AccumulatedMessage> InMemoryMessageSink::get(const TaskId &task_id, const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  auto it = messages_.find(Key{task_id, message_id});
  if (it != messages_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<AccumulatedMessage> InMemoryMessageSink::list(const TaskId &task_id) {
  std::lock_guard lock(mutex_);
  std::vector<AccumulatedMessage> result;
  auto it = task_messages_.find(task_id);
  if (it != task_messages_.end()) {
    for (const auto &id : it->second) {
      auto msg_it = messages_.find(Key{task_id, id});
      if (msg_it != messages_.end()) {
        result.push_back(msg_it->second);
      }
    }
  }
  return result;
}

void InMemoryMessageSink::remove(const TaskId &task_id, const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  if (messages_.erase(Key{task_id, message_id}) > 0) {
    auto &ids = task_messages_[task_id];
    ids.erase(std::remove(ids.begin(), ids.end(), message_id), ids.end());
  }
}

size_t InMemoryMessageSink::upsert_calls() const {
  std::lock_guard lock(mutex_);
  return upsert_calls_;
}

size_t InMemoryMessageSink::size() const {
  std::lock_guard lock(mutex_);
  return messages_.size();
}

}  // namespace taskstream
