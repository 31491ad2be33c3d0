#pragma once

#include <optional>
#include <string>
#include <variant>

#include "core/content.hpp"
#include "core/types.hpp"

namespace taskstream {

// Incremental fragment of a text or reasoning block
struct Delta {
  DeltaKind kind = DeltaKind::Text;
  std::string text;
};

// One complete, non-incremental content unit
struct Full {
  ContentBlock content;
};

// Terminal marker
struct Done {};

using StreamEvent = std::variant<Delta, Full, Done>;

// "delta", "full" or "done"
std::string event_type(const StreamEvent &event);

// Envelope kinds on the channel. Start is channel-only and carries the seed.
enum class UpdateType {
  Start,
  Delta,
  Full,
  Done
};

std::string to_string(UpdateType type);

std::optional<UpdateType> update_type_from_string(const std::string &str);

// One envelope published to the channel.
// Wire format: {"type", "task_id", "message_id", "sequence", "content" | "delta"}
struct StreamUpdate {
  UpdateType type = UpdateType::Start;
  TaskId task_id;
  MessageId message_id;
  uint64_t sequence = 0;

  std::optional<ContentBlock> content;  // Start (seed) and Full
  std::optional<Delta> delta;           // Delta

  static StreamUpdate start(const TaskId &task_id, const MessageId &message_id, const std::optional<ContentBlock> &seed);
  static StreamUpdate from_event(const TaskId &task_id, const MessageId &message_id, uint64_t sequence, const StreamEvent &event);

  // The StreamEvent this envelope carries; nullopt for Start
  std::optional<StreamEvent> event() const;

  json to_json() const;

  // nullopt if the payload is not a well-formed envelope
  static std::optional<StreamUpdate> from_json(const json &j);
};

}  // namespace taskstream
