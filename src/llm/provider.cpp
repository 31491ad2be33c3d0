#include "llm/provider.hpp"

#include <spdlog/spdlog.h>

#include "llm/scripted_provider.hpp"

namespace taskstream::llm {

json chunk_to_json(const StreamEvent &event) {
  return std::visit(
      [](auto &&e) -> json {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, TextDelta>) {
          return {{"type", "text"}, {"text", sanitize_utf8(e.text)}};
        } else if constexpr (std::is_same_v<T, ThinkingDelta>) {
          return {{"type", "thinking"}, {"text", sanitize_utf8(e.text)}};
        } else if constexpr (std::is_same_v<T, ToolCallDelta>) {
          return {{"type", "tool_call_delta"}, {"id", e.id}, {"name", e.name}, {"arguments_delta", e.arguments_delta}};
        } else if constexpr (std::is_same_v<T, ToolCallComplete>) {
          return {{"type", "tool_call"}, {"id", e.id}, {"name", e.name}, {"arguments", e.arguments}};
        } else if constexpr (std::is_same_v<T, ToolResultChunk>) {
          return {{"type", "tool_result"}, {"tool_call_id", e.tool_call_id}, {"name", e.name}, {"output", e.output}};
        } else if constexpr (std::is_same_v<T, GuardrailTripped>) {
          return {{"type", "guardrail"}, {"guardrail", e.guardrail}, {"message", e.message}};
        } else if constexpr (std::is_same_v<T, SessionInfo>) {
          return {{"type", "session"}, {"resume_token", e.resume_token}};
        } else if constexpr (std::is_same_v<T, FinishStep>) {
          return {{"type", "finish"}, {"reason", to_string(e.reason)}, {"usage", e.usage.to_json()}};
        } else {
          return {{"type", "error"}, {"message", e.message}, {"retryable", e.retryable}};
        }
      },
      event);
}

std::optional<StreamEvent> chunk_from_json(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  std::string type = j.value("type", "");
  if (type == "text") return TextDelta{j.value("text", "")};
  if (type == "thinking") return ThinkingDelta{j.value("text", "")};
  if (type == "tool_call_delta") return ToolCallDelta{j.value("id", ""), j.value("name", ""), j.value("arguments_delta", "")};
  if (type == "tool_call") return ToolCallComplete{j.value("id", ""), j.value("name", ""), j.value("arguments", json::object())};
  if (type == "tool_result") return ToolResultChunk{j.value("tool_call_id", ""), j.value("name", ""), j.value("output", "")};
  if (type == "guardrail") return GuardrailTripped{j.value("guardrail", ""), j.value("message", "")};
  if (type == "session") return SessionInfo{j.value("resume_token", "")};
  if (type == "finish") {
    FinishStep step;
    step.reason = finish_reason_from_string(j.value("reason", "stop"));
    if (j.contains("usage")) {
      step.usage = TokenUsage::from_json(j["usage"]);
    }
    return step;
  }
  if (type == "error") return StreamError{j.value("message", ""), j.value("retryable", false)};

  spdlog::debug("Unknown chunk type: {}", type);
  return std::nullopt;
}

json AgentRequest::to_json() const {
  json j;
  j["model"] = model;
  j["prompt"] = prompt;
  if (!system_prompt.empty()) {
    j["system_prompt"] = system_prompt;
  }
  json prior = json::array();
  for (const auto &msg : prior_messages) {
    prior.push_back(msg.to_json());
  }
  j["prior_messages"] = prior;
  if (resume_token) {
    j["resume_token"] = *resume_token;
  }
  return j;
}

std::string AgentResponse::text() const {
  std::string result;
  for (const auto &block : blocks) {
    if (auto *text = std::get_if<TextContent>(&block)) {
      result += text->text;
    }
  }
  return result;
}

ProviderFactory &ProviderFactory::instance() {
  static ProviderFactory instance;
  return instance;
}

void ProviderFactory::ensure_defaults() {
  if (defaults_registered_) {
    return;
  }
  defaults_registered_ = true;

  // Register scripted provider (replays chunk scripts from config options)
  factories_.emplace("scripted", [](const ProviderConfig &cfg, asio::io_context &ctx) {
    return ScriptedProvider::from_config(cfg, ctx);
  });
}

std::shared_ptr<Provider> ProviderFactory::create(const std::string &name, const ProviderConfig &config, asio::io_context &io_ctx) {
  FactoryFunc factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_defaults();
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      spdlog::warn("Unknown provider: {}", name);
      return nullptr;
    }
    factory = it->second;
  }
  return factory(config, io_ctx);
}

void ProviderFactory::register_provider(const std::string &name, FactoryFunc factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_defaults();
  factories_[name] = std::move(factory);
}

bool ProviderFactory::has_provider(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_defaults();
  return factories_.count(name) > 0;
}

std::vector<std::string> ProviderFactory::names() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_defaults();
  std::vector<std::string> result;
  for (const auto &[name, factory] : factories_) {
    result.push_back(name);
  }
  return result;
}

}  // namespace taskstream::llm
