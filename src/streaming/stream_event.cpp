#include "streaming/stream_event.hpp"

#include <spdlog/spdlog.h>

namespace taskstream {

std::string event_type(const StreamEvent &event) {
  return std::visit(
      [](auto &&e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Delta>) {
          return "delta";
        } else if constexpr (std::is_same_v<T, Full>) {
          return "full";
        } else {
          return "done";
        }
      },
      event);
}

std::string to_string(UpdateType type) {
  switch (type) {
    case UpdateType::Start:
      return "start";
    case UpdateType::Delta:
      return "delta";
    case UpdateType::Full:
      return "full";
    case UpdateType::Done:
      return "done";
  }
  return "unknown";
}

std::optional<UpdateType> update_type_from_string(const std::string &str) {
  if (str == "start") return UpdateType::Start;
  if (str == "delta") return UpdateType::Delta;
  if (str == "full") return UpdateType::Full;
  if (str == "done") return UpdateType::Done;
  return std::nullopt;
}

StreamUpdate StreamUpdate::start(const TaskId &task_id, const MessageId &message_id, const std::optional<ContentBlock> &seed) {
  StreamUpdate update;
  update.type = UpdateType::Start;
  update.task_id = task_id;
  update.message_id = message_id;
  update.sequence = 0;
  update.content = seed;
  return update;
}

StreamUpdate StreamUpdate::from_event(const TaskId &task_id, const MessageId &message_id, uint64_t sequence, const StreamEvent &event) {
  StreamUpdate update;
  update.task_id = task_id;
  update.message_id = message_id;
  update.sequence = sequence;

  std::visit(
      [&update](auto &&e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Delta>) {
          update.type = UpdateType::Delta;
          update.delta = e;
        } else if constexpr (std::is_same_v<T, Full>) {
          update.type = UpdateType::Full;
          update.content = e.content;
        } else if constexpr (std::is_same_v<T, Done>) {
          update.type = UpdateType::Done;
        }
      },
      event);

  return update;
}

std::optional<StreamEvent> StreamUpdate::event() const {
  switch (type) {
    case UpdateType::Delta:
      if (delta) return StreamEvent{*delta};
      return std::nullopt;
    case UpdateType::Full:
      if (content) return StreamEvent{Full{*content}};
      return std::nullopt;
    case UpdateType::Done:
      return StreamEvent{Done{}};
    case UpdateType::Start:
      break;
  }
  return std::nullopt;
}

json StreamUpdate::to_json() const {
  json j;
  j["type"] = to_string(type);
  j["task_id"] = task_id;
  j["message_id"] = message_id;
  j["sequence"] = sequence;

  switch (type) {
    case UpdateType::Start:
      j["content"] = content ? content_to_json(*content) : json(nullptr);
      break;
    case UpdateType::Full:
      if (content) j["content"] = content_to_json(*content);
      break;
    case UpdateType::Delta:
      if (delta) {
        j["delta"] = {{"kind", taskstream::to_string(delta->kind)}, {"text", sanitize_utf8(delta->text)}};
      }
      break;
    case UpdateType::Done:
      break;
  }
  return j;
}

std::optional<StreamUpdate> StreamUpdate::from_json(const json &j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    return std::nullopt;
  }

  auto type = update_type_from_string(j["type"].get<std::string>());
  if (!type) {
    spdlog::debug("[Stream] Unknown update type: {}", j["type"].get<std::string>());
    return std::nullopt;
  }

  StreamUpdate update;
  update.type = *type;
  try {
    update.task_id = j.at("task_id").get<std::string>();
    update.message_id = j.at("message_id").get<std::string>();
    update.sequence = j.at("sequence").get<uint64_t>();
  } catch (const json::exception &e) {
    spdlog::debug("[Stream] Malformed envelope: {}", e.what());
    return std::nullopt;
  }

  switch (update.type) {
    case UpdateType::Start:
      if (j.contains("content") && !j["content"].is_null()) {
        update.content = content_from_json(j["content"]);
        if (!update.content) return std::nullopt;
      }
      break;
    case UpdateType::Full:
      if (!j.contains("content")) return std::nullopt;
      update.content = content_from_json(j["content"]);
      if (!update.content) return std::nullopt;
      break;
    case UpdateType::Delta: {
      if (!j.contains("delta") || !j["delta"].is_object()) return std::nullopt;
      const auto &d = j["delta"];
      auto kind = delta_kind_from_string(d.value("kind", ""));
      if (!kind) return std::nullopt;
      update.delta = Delta{*kind, d.value("text", "")};
      break;
    }
    case UpdateType::Done:
      break;
  }

  return update;
}

}  // namespace taskstream
