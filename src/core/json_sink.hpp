#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace taskstream {

// JSON file-based message sink
// Storage layout:
//   base_dir/
//     {task_id}/
//       messages.json  final messages of that task, in insertion order
//
// Task ids must be plain directory names; any other id throws PersistenceError.
// upsert() and remove() refuse to rewrite a messages file they cannot parse.
class JsonMessageSink : public MessageSink {
 public:
  explicit JsonMessageSink(const std::filesystem::path &base_dir);

  // MessageSink interface
  bool upsert(const TaskId &task_id, const MessageId &message_id, const AccumulatedMessage &msg) override;
  std::optional<AccumulatedMessage> get(const TaskId &task_id, const MessageId &message_id) override;
  std::vector<AccumulatedMessage> list(const TaskId &task_id) override;
  void remove(const TaskId &task_id, const MessageId &message_id) override;

  // Task ids that have a messages file
  std::vector<TaskId> list_tasks();

  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

 private:
  std::filesystem::path base_dir_;
  mutable std::mutex mutex_;

  // Path helpers
  std::filesystem::path task_dir(const TaskId &id) const;
  std::filesystem::path messages_file(const TaskId &id) const;

  // Atomic write: write to .tmp then rename. Throws PersistenceError.
  void atomic_write(const std::filesystem::path &path, const std::string &content);

  // Internal: load/save messages.json for a task. A strict load throws
  // PersistenceError on an unreadable file instead of returning nothing.
  std::vector<AccumulatedMessage> load_messages(const TaskId &task_id, bool strict = false);
  void save_messages(const TaskId &task_id, const std::vector<AccumulatedMessage> &messages);
};

}  // namespace taskstream
