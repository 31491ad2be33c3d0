#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace taskstream {

// Content block types
struct TextContent {
  Author author = Author::Agent;
  std::string text;

  bool operator==(const TextContent &) const = default;
};

struct ReasoningContent {
  Author author = Author::Agent;
  std::string summary;

  bool operator==(const ReasoningContent &) const = default;
};

struct ToolRequestContent {
  Author author = Author::Agent;
  std::string tool_call_id;
  std::string name;
  json arguments = json::object();

  bool operator==(const ToolRequestContent &) const = default;
};

struct ToolResponseContent {
  Author author = Author::Agent;
  std::string tool_call_id;
  std::string name;
  std::string content;

  bool operator==(const ToolResponseContent &) const = default;
};

// Moderation / guardrail notice
struct GuardrailContent {
  Author author = Author::Agent;
  std::string guardrail;
  std::string message;

  bool operator==(const GuardrailContent &) const = default;
};

using ContentBlock = std::variant<TextContent, ReasoningContent, ToolRequestContent, ToolResponseContent, GuardrailContent>;

// Wire name of the block type ("text", "reasoning", "tool_request", ...)
std::string content_type(const ContentBlock &block);

// The delta kind a block can be extended with, if any
std::optional<DeltaKind> appendable_kind(const ContentBlock &block);

json content_to_json(const ContentBlock &block);

// Returns nullopt for unknown types or missing required fields
std::optional<ContentBlock> content_from_json(const json &j);

}  // namespace taskstream
