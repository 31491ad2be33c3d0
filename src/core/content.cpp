#include "core/content.hpp"

namespace taskstream {

std::string content_type(const ContentBlock &block) {
  if (std::holds_alternative<TextContent>(block)) return "text";
  if (std::holds_alternative<ReasoningContent>(block)) return "reasoning";
  if (std::holds_alternative<ToolRequestContent>(block)) return "tool_request";
  if (std::holds_alternative<ToolResponseContent>(block)) return "tool_response";
  return "guardrail";
}

std::optional<DeltaKind> appendable_kind(const ContentBlock &block) {
  if (std::holds_alternative<TextContent>(block)) return DeltaKind::Text;
  if (std::holds_alternative<ReasoningContent>(block)) return DeltaKind::Reasoning;
  return std::nullopt;
}

json content_to_json(const ContentBlock &block) {
  json j;
  j["type"] = content_type(block);

  if (auto *text = std::get_if<TextContent>(&block)) {
    j["author"] = to_string(text->author);
    j["content"] = sanitize_utf8(text->text);
  } else if (auto *reasoning = std::get_if<ReasoningContent>(&block)) {
    j["author"] = to_string(reasoning->author);
    j["summary"] = sanitize_utf8(reasoning->summary);
  } else if (auto *req = std::get_if<ToolRequestContent>(&block)) {
    j["author"] = to_string(req->author);
    j["tool_call_id"] = req->tool_call_id;
    j["name"] = req->name;
    j["arguments"] = req->arguments;
  } else if (auto *resp = std::get_if<ToolResponseContent>(&block)) {
    j["author"] = to_string(resp->author);
    j["tool_call_id"] = resp->tool_call_id;
    j["name"] = resp->name;
    j["content"] = sanitize_utf8(resp->content);
  } else if (auto *guard = std::get_if<GuardrailContent>(&block)) {
    j["author"] = to_string(guard->author);
    j["guardrail"] = guard->guardrail;
    j["message"] = sanitize_utf8(guard->message);
  }

  return j;
}

std::optional<ContentBlock> content_from_json(const json &j) {
  if (!j.is_object()) return std::nullopt;

  try {
    std::string type = j.value("type", "");
    Author author = author_from_string(j.value("author", "agent"));

    if (type == "text") {
      return TextContent{author, j.value("content", "")};
    }
    if (type == "reasoning") {
      return ReasoningContent{author, j.value("summary", "")};
    }
    if (type == "tool_request") {
      if (!j.contains("name")) return std::nullopt;
      return ToolRequestContent{author, j.value("tool_call_id", ""), j["name"].get<std::string>(), j.value("arguments", json::object())};
    }
    if (type == "tool_response") {
      if (!j.contains("name")) return std::nullopt;
      return ToolResponseContent{author, j.value("tool_call_id", ""), j["name"].get<std::string>(), j.value("content", "")};
    }
    if (type == "guardrail") {
      return GuardrailContent{author, j.value("guardrail", ""), j.value("message", "")};
    }
  } catch (const json::exception &) {
    // Wrong field types are reported as undecodable content
  }

  return std::nullopt;
}

}  // namespace taskstream
