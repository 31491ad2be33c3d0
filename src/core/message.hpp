#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/content.hpp"
#include "core/types.hpp"

namespace taskstream {

// The composed result of one streaming session
class AccumulatedMessage {
 public:
  AccumulatedMessage() = default;
  AccumulatedMessage(TaskId task_id, MessageId message_id, Author author = Author::Agent);

  // Accessors
  const TaskId &task_id() const {
    return task_id_;
  }
  const MessageId &message_id() const {
    return message_id_;
  }
  Author author() const {
    return author_;
  }
  const std::vector<ContentBlock> &blocks() const {
    return blocks_;
  }

  bool is_final() const {
    return final_;
  }
  void set_final(bool final) {
    final_ = final;
  }

  StreamingStatus status() const {
    return status_;
  }
  void set_status(StreamingStatus status) {
    status_ = status;
  }

  Timestamp created_at() const {
    return created_at_;
  }

  void add_block(ContentBlock block);
  void set_blocks(std::vector<ContentBlock> blocks);

  // Concatenation of all text blocks, in order
  std::string text() const;

  // Tool requests carried by this message
  std::vector<const ToolRequestContent *> tool_requests() const;

  // Equality of everything a reader can observe, timestamps excluded
  bool same_content(const AccumulatedMessage &other) const;

  // Serialization
  json to_json() const;
  static AccumulatedMessage from_json(const json &j);

 private:
  TaskId task_id_;
  MessageId message_id_;
  Author author_ = Author::Agent;
  std::vector<ContentBlock> blocks_;
  bool final_ = false;
  StreamingStatus status_ = StreamingStatus::InProgress;
  Timestamp created_at_ = std::chrono::system_clock::now();
};

// Durable sink for final messages, keyed by (task_id, message_id)
class MessageSink {
 public:
  virtual ~MessageSink() = default;

  // Insert or replace. Writing identical content to an existing key is a
  // no-op. Returns true if the stored record changed. Throws PersistenceError.
  virtual bool upsert(const TaskId &task_id, const MessageId &message_id, const AccumulatedMessage &msg) = 0;
  virtual std::optional<AccumulatedMessage> get(const TaskId &task_id, const MessageId &message_id) = 0;
  virtual std::vector<AccumulatedMessage> list(const TaskId &task_id) = 0;
  virtual void remove(const TaskId &task_id, const MessageId &message_id) = 0;
};

// In-memory message sink
class InMemoryMessageSink : public MessageSink {
 public:
  bool upsert(const TaskId &task_id, const MessageId &message_id, const AccumulatedMessage &msg) override;
  std::optional<AccumulatedMessage> get(const TaskId &task_id, const MessageId &message_id) override;
  std::vector<AccumulatedMessage> list(const TaskId &task_id) override;
  void remove(const TaskId &task_id, const MessageId &message_id) override;

  // Number of upsert calls received, effective or not
  size_t upsert_calls() const;

  // Total number of stored records across tasks
  size_t size() const;

 private:
  using Key = std::pair<TaskId, MessageId>;

  mutable std::mutex mutex_;
  std::map<Key, AccumulatedMessage> messages_;
  std::map<TaskId, std::vector<MessageId>> task_messages_;
  size_t upsert_calls_ = 0;
};

}  // namespace taskstream
