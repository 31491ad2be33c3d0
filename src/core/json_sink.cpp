#include "core/json_sink.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "core/errors.hpp"

namespace taskstream {

namespace fs = std::filesystem;

JsonMessageSink::JsonMessageSink(const fs::path &base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("[Sink] Failed to create message directory {}: {}", base_dir_.string(), ec.message());
  }
}

// --- Path helpers ---

fs::path JsonMessageSink::task_dir(const TaskId &id) const {
  // task id 来自调用方，只接受单个普通目录名
  fs::path name(id);
  if (id.empty() || id == "." || id == ".." || id.find('\0') != std::string::npos || name.has_root_path() ||
      name != name.filename()) {
    throw PersistenceError("Task id is not a plain directory name: " + id);
  }
  return base_dir_ / name;
}

fs::path JsonMessageSink::messages_file(const TaskId &id) const {
  return task_dir(id) / "messages.json";
}

// --- Atomic write ---

void JsonMessageSink::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    throw PersistenceError("Failed to open temp file for writing: " + tmp_path.string());
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    fs::remove(tmp_path, ec);
    throw PersistenceError("Failed to write temp file: " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    throw PersistenceError("Failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message());
  }
}

// --- Internal: messages.json ---

std::vector<AccumulatedMessage> JsonMessageSink::load_messages(const TaskId &task_id, bool strict) {
  auto path = messages_file(task_id);
  if (!fs::exists(path)) {
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    if (strict) {
      throw PersistenceError("Failed to open messages file: " + path.string());
    }
    spdlog::warn("[Sink] Failed to open messages file: {}", path.string());
    return {};
  }

  try {
    json j = json::parse(file);
    if (!j.is_array()) {
      throw std::runtime_error("expected an array of messages");
    }
    std::vector<AccumulatedMessage> messages;
    for (const auto &msg_json : j) {
      messages.push_back(AccumulatedMessage::from_json(msg_json));
    }
    return messages;
  } catch (const std::exception &e) {
    // 写路径上不能用空列表覆盖已有的消息
    if (strict) {
      throw PersistenceError("Corrupt messages file " + path.string() + ": " + e.what());
    }
    spdlog::warn("[Sink] Failed to parse messages file {}: {}", path.string(), e.what());
    return {};
  }
}

void JsonMessageSink::save_messages(const TaskId &task_id, const std::vector<AccumulatedMessage> &messages) {
  auto dir = task_dir(task_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw PersistenceError("Failed to create task directory " + dir.string() + ": " + ec.message());
  }

  json j = json::array();
  for (const auto &msg : messages) {
    j.push_back(msg.to_json());
  }

  atomic_write(messages_file(task_id), j.dump(2));
}

// --- MessageSink interface ---

bool JsonMessageSink::upsert(const TaskId &task_id, const MessageId &message_id, const AccumulatedMessage &msg) {
  std::lock_guard lock(mutex_);

  auto messages = load_messages(task_id, true);
  auto it = std::find_if(messages.begin(), messages.end(), [&message_id](const AccumulatedMessage &m) {
    return m.message_id() == message_id;
  });

  if (it != messages.end()) {
    if (it->same_content(msg)) {
      spdlog::debug("[Sink] Upsert {}/{} unchanged, skipping write", task_id, message_id);
      return false;
    }
    *it = msg;
  } else {
    messages.push_back(msg);
  }

  save_messages(task_id, messages);
  spdlog::debug("[Sink] Stored {}/{} ({} message(s) in task)", task_id, message_id, messages.size());
  return true;
}

std::optional<AccumulatedMessage> JsonMessageSink::get(const TaskId &task_id, const MessageId &message_id) {
  std::lock_guard lock(mutex_);

  for (auto &msg : load_messages(task_id)) {
    if (msg.message_id() == message_id) {
      return msg;
    }
  }
  return std::nullopt;
}

std::vector<AccumulatedMessage> JsonMessageSink::list(const TaskId &task_id) {
  std::lock_guard lock(mutex_);
  return load_messages(task_id);
}

void JsonMessageSink::remove(const TaskId &task_id, const MessageId &message_id) {
  std::lock_guard lock(mutex_);

  auto messages = load_messages(task_id, true);
  auto it = std::remove_if(messages.begin(), messages.end(), [&message_id](const AccumulatedMessage &msg) {
    return msg.message_id() == message_id;
  });

  if (it != messages.end()) {
    messages.erase(it, messages.end());
    save_messages(task_id, messages);
  }
}

std::vector<TaskId> JsonMessageSink::list_tasks() {
  std::lock_guard lock(mutex_);

  std::vector<TaskId> tasks;
  if (!fs::exists(base_dir_)) {
    return tasks;
  }

  for (const auto &entry : fs::directory_iterator(base_dir_)) {
    if (!entry.is_directory()) continue;
    if (fs::exists(entry.path() / "messages.json")) {
      tasks.push_back(entry.path().filename().string());
    }
  }
  std::sort(tasks.begin(), tasks.end());
  return tasks;
}

}  // namespace taskstream
